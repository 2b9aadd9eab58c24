#pragma once

#include <string>
#include <vector>

namespace sprocket {
namespace loader {

struct DocTag {
    std::string name;           // Tag name without '@', e.g. "param"
    std::string content;        // Everything after the tag name
    std::string description;    // content without the leading parameter name for "param"
};

struct ParamTag {
    std::string name;
    std::string description;    // Lines trimmed, joined with '\n'
};

/**
 * @brief Tokenized documentation comment (a slash-star-star block).
 *
 * The short description ends at the first blank line or at the first line
 * ending with a period. The long description runs up to the first tag.
 * Tags start with '@' at the beginning of a line and continue until the
 * next tag.
 */
struct DocBlock {
    std::string short_description;
    std::string long_description;
    std::vector<DocTag> tags;

    // Parses the first doc comment found in 'text'. No comment gives an empty block.
    static DocBlock parse(const std::string& text);

    // The "param" tags in order of appearance.
    std::vector<ParamTag> param_tags() const;
};

} // namespace loader
} // namespace sprocket
