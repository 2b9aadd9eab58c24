#include "sprocket/loader/staleness.hpp"

#include "sprocket/util/strings.hpp"

namespace sprocket {
namespace loader {

bool must_reload(const std::optional<BuildMetadata>& previous,
                 int64_t mtime,
                 const ReplacePairs& replace_pairs,
                 const SessionSettings& session,
                 const std::optional<RoutineCatalogEntry>& catalog) {
    // First time we see this source.
    if (!previous) return true;

    if (previous->timestamp != mtime) return true;

    // Only placeholders known from the previous run are compared; a new
    // placeholder implies an edit and thereby a new mtime.
    for (const auto& [placeholder, old_value] : previous->replace) {
        auto it = replace_pairs.find(util::to_upper(placeholder));
        if (it == replace_pairs.end() || it->second != old_value) return true;
    }

    if (!catalog) return true;

    if (catalog->sql_mode != session.sql_mode) return true;
    if (catalog->character_set_client != session.character_set) return true;
    if (catalog->collation_connection != session.collation) return true;

    return false;
}

} // namespace loader
} // namespace sprocket
