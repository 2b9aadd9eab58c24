// =============================================================================
// annotation_scanner.hpp - Comment DSL of routine sources
// =============================================================================
// A routine source carries its calling contract in comment lines placed
// before the literal `begin` line:
//
//   -- type: rows_with_key usr_id
//   -- param: p_ids list_of_int , " \
//
// and may reference placeholders such as @MAX_LENGTH@ or @usr.usr_id%type@.
// =============================================================================

#pragma once

#include <string>
#include <vector>

#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

// Result of scanning one source.
struct ScannedRoutine {
    std::string routine_type;           // "procedure" or "function"
    std::string routine_name;
    Designation designation;
    ExtendedParameters extended_parameters;
    PlaceholderSet placeholders;
};

class AnnotationScanner {
public:
    explicit AnnotationScanner(const RoutineSource& source) : source_(source) {}

    /**
     * @brief Runs all extraction steps.
     * @throws ParseError naming the file and the violation.
     */
    ScannedRoutine scan(const ReplacePairs& replace_pairs) const;

    /**
     * @brief Placeholder tokens in order of first appearance, deduplicated.
     */
    std::vector<std::string> placeholder_tokens() const;

    /**
     * @brief Resolves every placeholder of the source.
     * @throws ParseError listing each unknown placeholder.
     */
    PlaceholderSet placeholders(const ReplacePairs& replace_pairs) const;

    /**
     * @brief Extracts the designation type and its arguments.
     * @throws ParseError if `begin` or the designation line is missing or malformed.
     */
    Designation designation() const;

    /**
     * @brief Extracts the `-- param:` declarations between the designation
     *        line and `begin`.
     * @throws ParseError on malformed or duplicate declarations.
     */
    ExtendedParameters extended_parameters() const;

    /**
     * @brief Extracts routine type and name from the create header and checks
     *        the name against the file name.
     * @return {routine_type, routine_name}
     */
    std::pair<std::string, std::string> routine_header() const;

    // Index of the first line equal to "begin", -1 if there is none.
    int begin_line() const;

    // Index of the designation line, -1 if there is none before `begin`.
    int designation_line() const;

    // Text before the create header, i.e. the leading doc comment.
    std::string leading_comment() const;

private:
    const RoutineSource& source_;
};

} // namespace loader
} // namespace sprocket
