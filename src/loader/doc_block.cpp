#include "sprocket/loader/doc_block.hpp"

#include <cctype>

#include "sprocket/types.hpp"
#include "sprocket/util/strings.hpp"

namespace sprocket {
namespace loader {

namespace {

// Strips the comment decoration: leading whitespace, one '*', one space.
std::string strip_decoration(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) return "";
    if (line[pos] == '*') {
        ++pos;
        if (pos < line.size() && line[pos] == ' ') ++pos;
    }
    std::string rest = line.substr(pos);
    size_t end = rest.find_last_not_of(" \t\r");
    return (end == std::string::npos) ? "" : rest.substr(0, end + 1);
}

std::string join_trimmed(const std::vector<std::string>& lines) {
    size_t first = 0;
    size_t last = lines.size();
    while (first < last && util::trim(lines[first]).empty()) ++first;
    while (last > first && util::trim(lines[last - 1]).empty()) --last;

    std::vector<std::string> kept(lines.begin() + first, lines.begin() + last);
    return util::join(kept, "\n");
}

size_t first_whitespace(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(s[i]))) return i;
    }
    return std::string::npos;
}

} // namespace

DocBlock DocBlock::parse(const std::string& text) {
    DocBlock block;

    size_t open = text.find("/**");
    if (open == std::string::npos) return block;
    size_t close = text.find("*/", open + 3);
    if (close == std::string::npos) return block;

    std::vector<std::string> lines;
    for (const auto& raw : split_lines(text.substr(open + 3, close - open - 3))) {
        lines.push_back(strip_decoration(raw));
    }

    // Description part
    size_t i = 0;
    while (i < lines.size() && lines[i].empty()) ++i;

    std::vector<std::string> short_lines;
    while (i < lines.size() && !lines[i].empty() && lines[i][0] != '@') {
        short_lines.push_back(lines[i]);
        bool ends_sentence = lines[i].back() == '.';
        ++i;
        if (ends_sentence) break;
    }
    block.short_description = join_trimmed(short_lines);

    std::vector<std::string> long_lines;
    while (i < lines.size() && (lines[i].empty() || lines[i][0] != '@')) {
        long_lines.push_back(lines[i]);
        ++i;
    }
    block.long_description = join_trimmed(long_lines);

    // Tags
    while (i < lines.size()) {
        const std::string& head = lines[i];
        size_t ws = first_whitespace(head);
        DocTag tag;
        tag.name = head.substr(1, ws == std::string::npos ? std::string::npos : ws - 1);

        std::vector<std::string> content_lines;
        content_lines.push_back(ws == std::string::npos ? "" : util::trim(head.substr(ws)));
        ++i;
        while (i < lines.size() && (lines[i].empty() || lines[i][0] != '@')) {
            content_lines.push_back(lines[i]);
            ++i;
        }
        tag.content = join_trimmed(content_lines);

        tag.description = tag.content;
        if (tag.name == "param") {
            size_t end = first_whitespace(tag.content);
            tag.description = (end == std::string::npos) ? "" : util::trim(tag.content.substr(end));
        }
        block.tags.push_back(std::move(tag));
    }

    return block;
}

std::vector<ParamTag> DocBlock::param_tags() const {
    std::vector<ParamTag> params;
    for (const auto& tag : tags) {
        if (tag.name != "param") continue;

        ParamTag param;
        param.name = util::trim(tag.content.substr(0, tag.content.size() - tag.description.size()));

        std::vector<std::string> description_lines;
        for (const auto& line : split_lines(tag.description)) {
            description_lines.push_back(util::trim(line));
        }
        param.description = util::join(description_lines, "\n");
        params.push_back(std::move(param));
    }
    return params;
}

} // namespace loader
} // namespace sprocket
