// =============================================================================
// routine_loader.hpp - Batch loading of all routine sources
// =============================================================================
// Discovers sources, reads the live catalog, compiles every routine and keeps
// the metadata store in sync with the database.
// =============================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

#include "sprocket/config.hpp"
#include "sprocket/db/data_layer.hpp"
#include "sprocket/loader/metadata_store.hpp"
#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

class RoutineLoader {
public:
    RoutineLoader(db::DataLayer& db, const LoaderConfig& config);

    /**
     * @brief Compiles all sources under the source directory and drops
     * routines whose source is gone.
     * @return Number of routines that failed.
     * @throws DatabaseError when the connection is lost (metadata is saved first).
     */
    int load_all();

    /**
     * @brief Compiles the listed sources only.
     * @return Number of routines that failed.
     */
    int load_list(const std::vector<std::string>& files);

    // Sources under the source directory, sorted by path.
    std::vector<std::string> discover_sources() const;

    // Routines of the current schema keyed by name.
    std::map<std::string, RoutineCatalogEntry> read_catalog();

    // Configured constants and column types of the current schema.
    ReplacePairs build_replace_pairs();

    const MetadataStore& metadata() const { return store_; }

private:
    int load(const std::vector<std::string>& files, bool drop_obsolete);
    int drop_obsolete_routines(const std::vector<std::string>& current_names,
                               const std::map<std::string, RoutineCatalogEntry>& catalog);

    db::DataLayer& db_;
    LoaderConfig config_;
    MetadataStore store_;
};

} // namespace loader
} // namespace sprocket
