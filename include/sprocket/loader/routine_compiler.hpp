// =============================================================================
// routine_compiler.hpp - Compiles one routine source
// =============================================================================
// Pipeline: staleness gate -> scan -> load -> catalog -> documentation ->
// metadata. Every stage consumes the values produced by the previous ones.
// =============================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sprocket/db/data_layer.hpp"
#include "sprocket/loader/annotation_scanner.hpp"
#include "sprocket/loader/catalog_reconciler.hpp"
#include "sprocket/loader/doc_reconciler.hpp"
#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

enum class CompileStatus {
    LOADED,     // Routine (re)created, new metadata
    UNCHANGED,  // Not stale, previous metadata returned as is
    FAILED      // Diagnostic set, previous metadata stays authoritative
};

struct CompileResult {
    CompileStatus status = CompileStatus::FAILED;
    std::optional<BuildMetadata> metadata;
    std::string diagnostic;
    std::vector<std::string> warnings;

    bool ok() const { return status != CompileStatus::FAILED; }
};

/**
 * @brief Assembles the metadata record of a loaded routine.
 */
BuildMetadata synthesize_metadata(const ScannedRoutine& routine,
                                  const CatalogInfo& catalog,
                                  const RoutineDoc& doc,
                                  int64_t mtime);

class RoutineCompiler {
public:
    RoutineCompiler(db::DataLayer& db, const SessionSettings& session, const ReplacePairs& replace_pairs)
        : db_(db), session_(session), replace_pairs_(replace_pairs) {}

    /**
     * @brief Compiles a routine source.
     *
     * Per-routine failures are returned as a FAILED result.
     *
     * @param previous Metadata of the previous run of this routine.
     * @param catalog  Catalog entry of the routine if it exists in the database.
     * @throws DatabaseError only when the connection is lost.
     */
    CompileResult compile(const RoutineSource& source,
                          const std::optional<BuildMetadata>& previous,
                          const std::optional<RoutineCatalogEntry>& catalog);

    // Reads 'path' and compiles it. Unreadable files give a FAILED result.
    CompileResult compile_file(const std::string& path,
                               const std::string& extension,
                               const std::optional<BuildMetadata>& previous,
                               const std::optional<RoutineCatalogEntry>& catalog);

private:
    CompileResult failure(const std::string& diagnostic) const;

    db::DataLayer& db_;
    SessionSettings session_;
    ReplacePairs replace_pairs_;
};

} // namespace loader
} // namespace sprocket
