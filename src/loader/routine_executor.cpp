#include "sprocket/loader/routine_executor.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "sprocket/logging.hpp"
#include "sprocket/util/strings.hpp"

namespace fs = std::filesystem;

namespace sprocket {
namespace loader {

std::string substitute_tokens(const std::string& text, const std::map<std::string, std::string>& pairs) {
    std::vector<const std::pair<const std::string, std::string>*> ordered;
    for (const auto& pair : pairs) {
        if (!pair.first.empty()) ordered.push_back(&pair);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->first.size() > b->first.size();
    });

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        for (const auto* pair : ordered) {
            if (text.compare(i, pair->first.size(), pair->first) == 0) {
                out += pair->second;
                i += pair->first.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

std::string RoutineExecutor::build_create_statement(const RoutineSource& source,
                                                    const std::string& routine_name,
                                                    const PlaceholderSet& placeholders) {
    fs::path real_path = fs::weakly_canonical(fs::absolute(source.path));

    // Local copy: the magic constants never reach the placeholder set.
    std::map<std::string, std::string> replace(placeholders.begin(), placeholders.end());
    replace[MAGIC_FILE] = db_.quote_string(real_path.string());
    replace[MAGIC_ROUTINE] = "'" + routine_name + "'";
    replace[MAGIC_DIR] = db_.quote_string(real_path.parent_path().string());

    std::vector<std::string> lines;
    lines.reserve(source.lines.size());
    for (size_t i = 0; i < source.lines.size(); ++i) {
        replace[MAGIC_LINE] = std::to_string(i + 1);
        lines.push_back(substitute_tokens(source.lines[i], replace));
    }

    return util::join(lines, "\n");
}

std::string RoutineExecutor::drop_statement(const std::string& routine_type, const std::string& routine_name) {
    return "drop " + util::to_lower(routine_type) + " if exists " + routine_name;
}

void RoutineExecutor::load(const RoutineSource& source,
                           const ScannedRoutine& routine,
                           const std::optional<RoutineCatalogEntry>& catalog) {
    LOG_INFO("Loading ", routine.routine_type, " ", routine.routine_name);

    std::string create = build_create_statement(source, routine.routine_name, routine.placeholders);

    if (catalog) {
        db_.execute_none(drop_statement(catalog->routine_type, routine.routine_name));
    }

    db_.execute_none("set sql_mode ='" + db_.real_escape_string(session_.sql_mode) + "'");

    db_.execute_none("set names '" + db_.real_escape_string(session_.character_set) +
                     "' collate '" + db_.real_escape_string(session_.collation) + "'");

    db_.execute_none(create);
}

} // namespace loader
} // namespace sprocket
