#pragma once

#include <map>
#include <optional>
#include <string>

#include "sprocket/db/data_layer.hpp"
#include "sprocket/loader/annotation_scanner.hpp"
#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

// Magic constants, bound while the create statement is built
constexpr const char* MAGIC_FILE = "__FILE__";
constexpr const char* MAGIC_ROUTINE = "__ROUTINE__";
constexpr const char* MAGIC_DIR = "__DIR__";
constexpr const char* MAGIC_LINE = "__LINE__";

/**
 * @brief Replaces all tokens of 'pairs' in 'text' in a single pass.
 *
 * At each position the longest matching token wins and replaced text is not
 * scanned again.
 */
std::string substitute_tokens(const std::string& text, const std::map<std::string, std::string>& pairs);

/**
 * @brief Writes a routine into the database.
 */
class RoutineExecutor {
public:
    RoutineExecutor(db::DataLayer& db, const SessionSettings& session)
        : db_(db), session_(session) {}

    /**
     * @brief Routine source with placeholders and magic constants substituted.
     *
     * __LINE__ is bound to the 1-based number of each line.
     */
    std::string build_create_statement(const RoutineSource& source,
                                       const std::string& routine_name,
                                       const PlaceholderSet& placeholders);

    /**
     * @brief Drops the existing routine (if the catalog knows it), applies the
     *        session settings and creates the routine.
     * @throws DatabaseError if any statement fails.
     */
    void load(const RoutineSource& source,
              const ScannedRoutine& routine,
              const std::optional<RoutineCatalogEntry>& catalog);

    // "drop <type> if exists <name>"
    static std::string drop_statement(const std::string& routine_type, const std::string& routine_name);

private:
    db::DataLayer& db_;
    SessionSettings session_;
};

} // namespace loader
} // namespace sprocket
