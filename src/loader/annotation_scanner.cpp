#include "sprocket/loader/annotation_scanner.hpp"

#include <regex>
#include <set>

#include "sprocket/error.hpp"
#include "sprocket/util/strings.hpp"

namespace sprocket {
namespace loader {

namespace {

const std::regex& placeholder_pattern() {
    static const std::regex re(R"(@[A-Za-z0-9_.]+(%type)?@)");
    return re;
}

const std::regex& designation_pattern() {
    static const std::regex re(R"(^\s*--\s+type:\s*(\w+)\s*(.+)?\s*$)");
    return re;
}

const std::regex& bulk_insert_pattern() {
    static const std::regex re(R"(^([a-zA-Z0-9_]+)\s+([a-zA-Z0-9_,]+)$)");
    return re;
}

const std::regex& column_list_pattern() {
    static const std::regex re(R"(^[a-zA-Z0-9_]+(\s*,\s*[a-zA-Z0-9_]+)*$)");
    return re;
}

const std::regex& param_keyword_pattern() {
    static const std::regex re(R"(^\s*--\s+param:(.*)$)");
    return re;
}

// <name> <type> [<delimiter> <enclosure> <escape>]
const std::regex& param_pattern() {
    static const std::regex re(R"(^\s*(\w+)\s+(\w+)(?:\s+([^\s-])\s+([^\s-])\s+([^\s-]))?\s*$)");
    return re;
}

const std::regex& create_pattern() {
    static const std::regex re(R"(create\s+(procedure|function)\s+([a-zA-Z0-9_]+))",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::vector<std::string> column_list(const std::string& args) {
    std::vector<std::string> columns;
    for (const auto& column : util::split(args, ',')) {
        columns.push_back(util::trim(column));
    }
    return columns;
}

} // namespace

// =============================================================================
// Placeholders
// =============================================================================

std::vector<std::string> AnnotationScanner::placeholder_tokens() const {
    std::vector<std::string> tokens;
    std::set<std::string> seen;

    auto begin = std::sregex_iterator(source_.text.begin(), source_.text.end(), placeholder_pattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string token = it->str();
        if (seen.insert(token).second) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

PlaceholderSet AnnotationScanner::placeholders(const ReplacePairs& replace_pairs) const {
    PlaceholderSet resolved;
    std::vector<std::string> unknown;

    for (const auto& token : placeholder_tokens()) {
        auto it = replace_pairs.find(util::to_upper(token));
        if (it == replace_pairs.end()) {
            unknown.push_back("Unknown placeholder '" + token + "' in file '" + source_.path + "'.");
            continue;
        }
        resolved[token] = it->second;
    }

    if (!unknown.empty()) {
        throw ParseError(util::join(unknown, "\n"));
    }
    return resolved;
}

// =============================================================================
// Designation
// =============================================================================

int AnnotationScanner::begin_line() const {
    for (size_t i = 0; i < source_.lines.size(); ++i) {
        if (source_.lines[i] == "begin") return static_cast<int>(i);
    }
    return -1;
}

int AnnotationScanner::designation_line() const {
    for (int i = begin_line() - 1; i >= 0; --i) {
        if (std::regex_match(source_.lines[i], designation_pattern())) return i;
    }
    return -1;
}

Designation AnnotationScanner::designation() const {
    const std::string not_found = "Unable to find the designation type of the stored routine in file '" +
                                  source_.path + "'.";

    int key = begin_line();
    SPROCKET_CHECK_PARSE(key >= 0, not_found, "");

    int line = designation_line();
    SPROCKET_CHECK_PARSE(line >= 0, not_found, "");

    for (int i = line - 1; i >= 0; --i) {
        if (std::regex_match(source_.lines[i], designation_pattern())) {
            SPROCKET_THROW_PARSE("Found multiple designation types in file '" + source_.path + "'.",
                                 "line " + std::to_string(i + 1) + " and line " + std::to_string(line + 1));
        }
    }

    std::smatch matches;
    std::regex_match(source_.lines[line], matches, designation_pattern());
    std::string type = matches[1].str();
    std::string args = util::trim(matches[2].matched ? matches[2].str() : "");

    if (type == "bulk_insert") {
        std::smatch info;
        if (!std::regex_match(args, info, bulk_insert_pattern())) {
            SPROCKET_THROW_PARSE("Expected: -- type: bulk_insert <table_name> <columns> in file '" +
                                 source_.path + "'.", "");
        }
        return BulkInsert{info[1].str(), column_list(info[2].str())};
    }

    if (type == "rows_with_key" || type == "rows_with_index") {
        SPROCKET_CHECK_PARSE(std::regex_match(args, column_list_pattern()),
                             "Expected: -- type: " + type + " <columns> in file '" + source_.path + "'.", "");
        if (type == "rows_with_key") return RowsWithKey{column_list(args)};
        return RowsWithIndex{column_list(args)};
    }

    SPROCKET_CHECK_PARSE(args.empty(),
                         "Unexpected arguments '" + args + "' for designation type '" + type +
                         "' in file '" + source_.path + "'.", "");
    return PlainDesignation{type};
}

// =============================================================================
// Extended parameters
// =============================================================================

ExtendedParameters AnnotationScanner::extended_parameters() const {
    ExtendedParameters params;

    int first = designation_line() + 1;
    int last = begin_line();
    if (first <= 0 || last < 0) return params;

    for (int i = first; i < last; ++i) {
        std::smatch keyword;
        if (!std::regex_match(source_.lines[i], keyword, param_keyword_pattern())) continue;

        std::string rest = keyword[1].str();
        if (util::trim(rest).empty()) continue;

        std::smatch m;
        if (!std::regex_match(rest, m, param_pattern())) {
            SPROCKET_THROW_PARSE("Expected: -- param: <field_name> <type_of_list> [delimiter enclosure escape] in file '" +
                                 source_.path + "'.", "line " + std::to_string(i + 1));
        }

        ExtendedParameter param;
        param.name = m[1].str();
        param.data_type = m[2].str();
        if (m[3].matched) {
            param.delimiter = m[3].str()[0];
            param.enclosure = m[4].str()[0];
            param.escape = m[5].str()[0];
        }

        if (params.count(param.name)) {
            SPROCKET_THROW_PARSE("Duplicate parameter '" + param.name + "' in file '" + source_.path + "'.",
                                 "line " + std::to_string(i + 1));
        }
        params.emplace(param.name, param);
    }

    return params;
}

// =============================================================================
// Routine header
// =============================================================================

std::pair<std::string, std::string> AnnotationScanner::routine_header() const {
    std::smatch m;
    if (!std::regex_search(source_.text, m, create_pattern())) {
        SPROCKET_THROW_PARSE("Unable to find the stored routine name and type in file '" + source_.path + "'.", "");
    }

    std::string routine_type = util::to_lower(m[1].str());
    std::string routine_name = m[2].str();
    if (routine_name != source_.routine_name) {
        SPROCKET_THROW_PARSE("Stored routine name '" + routine_name + "' does not match filename in file '" +
                             source_.path + "'.", "");
    }

    return {routine_type, routine_name};
}

std::string AnnotationScanner::leading_comment() const {
    std::string text;
    for (const auto& line : source_.lines) {
        if (std::regex_search(line, create_pattern())) break;
        text += line + "\n";
    }
    return text;
}

// =============================================================================
// Scan
// =============================================================================

ScannedRoutine AnnotationScanner::scan(const ReplacePairs& replace_pairs) const {
    ScannedRoutine routine;
    routine.placeholders = placeholders(replace_pairs);
    routine.designation = designation();
    auto [routine_type, routine_name] = routine_header();
    routine.routine_type = routine_type;
    routine.routine_name = routine_name;
    routine.extended_parameters = extended_parameters();
    return routine;
}

} // namespace loader
} // namespace sprocket
