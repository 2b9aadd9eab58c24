#include "sprocket/loader/routine_compiler.hpp"

#include "sprocket/error.hpp"
#include "sprocket/loader/doc_block.hpp"
#include "sprocket/loader/routine_executor.hpp"
#include "sprocket/loader/staleness.hpp"
#include "sprocket/logging.hpp"

namespace sprocket {
namespace loader {

BuildMetadata synthesize_metadata(const ScannedRoutine& routine,
                                  const CatalogInfo& catalog,
                                  const RoutineDoc& doc,
                                  int64_t mtime) {
    BuildMetadata metadata;
    metadata.routine_name = routine.routine_name;
    metadata.routine_type = routine.routine_type;
    metadata.designation = routine.designation;
    metadata.parameters = catalog.parameters;
    metadata.fields = catalog.bulk_insert.fields;
    metadata.column_types = catalog.bulk_insert.column_types;
    metadata.timestamp = mtime;
    metadata.replace = routine.placeholders;
    metadata.doc = doc;
    metadata.extended_parameters = routine.extended_parameters;
    return metadata;
}

CompileResult RoutineCompiler::failure(const std::string& diagnostic) const {
    LOG_ERROR(diagnostic);
    CompileResult result;
    result.status = CompileStatus::FAILED;
    result.diagnostic = diagnostic;
    return result;
}

CompileResult RoutineCompiler::compile(const RoutineSource& source,
                                       const std::optional<BuildMetadata>& previous,
                                       const std::optional<RoutineCatalogEntry>& catalog) {
    if (!must_reload(previous, source.mtime, replace_pairs_, session_, catalog)) {
        LOG_DEBUG("Routine ", source.routine_name, " is up to date");
        CompileResult result;
        result.status = CompileStatus::UNCHANGED;
        result.metadata = previous;
        return result;
    }

    try {
        AnnotationScanner scanner(source);
        ScannedRoutine routine = scanner.scan(replace_pairs_);

        RoutineExecutor executor(db_, session_);
        executor.load(source, routine, catalog);

        CatalogReconciler reconciler(db_, source.path);
        CatalogInfo catalog_info = reconciler.reconcile(routine.routine_name,
                                                        routine.designation,
                                                        routine.extended_parameters);

        DocBlock doc_block = DocBlock::parse(scanner.leading_comment());
        DocReconciliation docs = reconcile_documentation(catalog_info.parameters, doc_block);
        for (const auto& warning : docs.warnings) {
            LOG_WARN("Warning: ", warning, " in file '", source.path, "'");
        }

        CompileResult result;
        result.status = CompileStatus::LOADED;
        result.metadata = synthesize_metadata(routine, catalog_info, docs.doc, source.mtime);
        result.warnings = std::move(docs.warnings);
        return result;
    } catch (const DatabaseError& e) {
        if (e.is_fatal()) throw;
        return failure("Error loading '" + source.path + "': " + e.what());
    } catch (const SprocketException& e) {
        return failure(e.what());
    } catch (const std::exception& e) {
        return failure("Error loading '" + source.path + "': " + e.what());
    }
}

CompileResult RoutineCompiler::compile_file(const std::string& path,
                                            const std::string& extension,
                                            const std::optional<BuildMetadata>& previous,
                                            const std::optional<RoutineCatalogEntry>& catalog) {
    RoutineSource source;
    try {
        source = RoutineSource::read(path, extension);
    } catch (const IOError& e) {
        return failure(e.what());
    }
    return compile(source, previous, catalog);
}

} // namespace loader
} // namespace sprocket
