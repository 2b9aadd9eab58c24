#pragma once

#include <cstdint>
#include <optional>

#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

/**
 * @brief Decides whether a routine must be (re)loaded.
 *
 * Checked in order, the first hit wins:
 *  1. no previous metadata
 *  2. source modification time changed
 *  3. a placeholder recorded in the previous metadata is gone from the
 *     replace pairs or has a different value
 *  4. the routine does not exist in the database
 *  5. sql mode, character set or collation of the loaded routine differ from
 *     the session settings
 *
 * @param previous   Metadata of the previous run, if any.
 * @param mtime      Current modification time of the source.
 * @param replace_pairs Current replace pairs (uppercased keys).
 * @param session    Settings the routine would be loaded under.
 * @param catalog    Catalog entry of the routine, if it exists.
 */
bool must_reload(const std::optional<BuildMetadata>& previous,
                 int64_t mtime,
                 const ReplacePairs& replace_pairs,
                 const SessionSettings& session,
                 const std::optional<RoutineCatalogEntry>& catalog);

} // namespace loader
} // namespace sprocket
