#include "sprocket/loader/routine_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include "sprocket/db/helpers.hpp"
#include "sprocket/error.hpp"
#include "sprocket/loader/routine_compiler.hpp"
#include "sprocket/loader/routine_executor.hpp"
#include "sprocket/logging.hpp"
#include "sprocket/util/strings.hpp"

namespace fs = std::filesystem;

namespace sprocket {
namespace loader {

RoutineLoader::RoutineLoader(db::DataLayer& db, const LoaderConfig& config)
    : db_(db), config_(config), store_(config.metadata) {}

// =============================================================================
// Discovery
// =============================================================================

std::vector<std::string> RoutineLoader::discover_sources() const {
    std::vector<std::string> files;
    if (!fs::is_directory(config_.source_directory)) {
        LOG_WARN("Source directory '", config_.source_directory, "' does not exist");
        return files;
    }

    for (const auto& entry : fs::recursive_directory_iterator(config_.source_directory)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension().string() != config_.extension) continue;
        files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::map<std::string, RoutineCatalogEntry> RoutineLoader::read_catalog() {
    const char* query = R"SQL(
select routine_name         as routine_name
,      routine_type         as routine_type
,      sql_mode             as sql_mode
,      character_set_client as character_set_client
,      collation_connection as collation_connection
from   information_schema.ROUTINES
where  routine_schema = database()
order by routine_name)SQL";

    std::map<std::string, RoutineCatalogEntry> catalog;
    for (const auto& row : db_.execute_rows(query)) {
        RoutineCatalogEntry entry;
        entry.routine_type = util::to_lower(db::get_string(row, "routine_type"));
        entry.sql_mode = db::get_string(row, "sql_mode");
        entry.character_set_client = db::get_string(row, "character_set_client");
        entry.collation_connection = db::get_string(row, "collation_connection");
        catalog[db::get_string(row, "routine_name")] = entry;
    }
    return catalog;
}

ReplacePairs RoutineLoader::build_replace_pairs() {
    ReplacePairs pairs;
    for (const auto& [name, value] : config_.constants) {
        pairs["@" + util::to_upper(name) + "@"] = value;
    }

    const char* query = R"SQL(
select table_name         as table_name
,      column_name        as column_name
,      column_type        as column_type
,      character_set_name as character_set_name
from   information_schema.COLUMNS
where  table_schema = database()
order by table_name
,        ordinal_position)SQL";

    for (const auto& row : db_.execute_rows(query)) {
        std::string key = "@" + util::to_upper(db::get_string(row, "table_name") + "." +
                                                db::get_string(row, "column_name")) + "%TYPE@";
        std::string value = db::get_string(row, "column_type");
        if (!db::is_null(row, "character_set_name")) {
            value += " character set " + db::get_string(row, "character_set_name");
        }
        pairs[key] = value;
    }

    LOG_DEBUG("Replace pairs: ", pairs.size());
    return pairs;
}

// =============================================================================
// Loading
// =============================================================================

int RoutineLoader::load_all() {
    return load(discover_sources(), true);
}

int RoutineLoader::load_list(const std::vector<std::string>& files) {
    std::vector<std::string> sorted = files;
    std::sort(sorted.begin(), sorted.end());
    return load(sorted, false);
}

int RoutineLoader::load(const std::vector<std::string>& files, bool drop_obsolete) {
    store_.load();

    // Group sources by routine name; a name claimed twice is an error for both.
    std::map<std::string, std::vector<std::string>> sources;
    for (const auto& file : files) {
        sources[routine_name_from_path(file, config_.extension)].push_back(file);
    }

    std::map<std::string, RoutineCatalogEntry> catalog = read_catalog();
    ReplacePairs replace_pairs = build_replace_pairs();
    RoutineCompiler compiler(db_, config_.session, replace_pairs);

    int failures = 0;
    std::vector<std::string> names;
    try {
        for (const auto& [name, paths] : sources) {
            names.push_back(name);

            if (paths.size() > 1) {
                for (const auto& path : paths) {
                    LOG_ERROR("Routine '", name, "' is defined in multiple files, found in file '", path, "'");
                    ++failures;
                }
                continue;
            }

            std::optional<RoutineCatalogEntry> entry;
            auto it = catalog.find(name);
            if (it != catalog.end()) entry = it->second;

            CompileResult result = compiler.compile_file(paths.front(), config_.extension,
                                                         store_.get(name), entry);
            if (!result.ok()) {
                ++failures;
                continue;
            }
            if (result.metadata) store_.put(*result.metadata);
        }

        if (drop_obsolete) {
            failures += drop_obsolete_routines(names, catalog);
        }
    } catch (const DatabaseError& e) {
        LOG_ERROR("Aborting: ", e.what());
        store_.save();
        throw;
    }

    store_.save();

    if (failures > 0) {
        LOG_WARN(failures, " routine(s) failed to load");
    } else {
        LOG_INFO("Loaded ", sources.size(), " routine source(s)");
    }
    return failures;
}

int RoutineLoader::drop_obsolete_routines(const std::vector<std::string>& current_names,
                                          const std::map<std::string, RoutineCatalogEntry>& catalog) {
    std::set<std::string> current(current_names.begin(), current_names.end());
    int failures = 0;

    for (const auto& name : store_.routine_names()) {
        if (current.count(name)) continue;

        auto it = catalog.find(name);
        if (it != catalog.end()) {
            LOG_INFO("Dropping ", it->second.routine_type, " ", name);
            try {
                db_.execute_none(RoutineExecutor::drop_statement(it->second.routine_type, name));
            } catch (const DatabaseError& e) {
                if (e.is_fatal()) throw;
                LOG_ERROR("Error dropping '", name, "': ", e.what());
                ++failures;
                continue;
            }
        }
        store_.erase(name);
    }
    return failures;
}

} // namespace loader
} // namespace sprocket
