// =============================================================================
// catalog_reconciler.hpp - Parameter and bulk insert metadata from the catalog
// =============================================================================
// Runs after a routine has been created: reads its parameters back from
// information_schema and merges the -- param: declarations of the source.
// =============================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sprocket/db/data_layer.hpp"
#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

struct BulkInsertColumns {
    std::vector<std::string> fields;        // Column names of the table
    std::vector<std::string> column_types;  // Leading word of each column type
};

struct CatalogInfo {
    std::vector<CatalogParameter> parameters;
    BulkInsertColumns bulk_insert;
};

// "<dtd> character set <cs> collation <coll>", clauses only when reported.
std::string data_type_descriptor(const std::string& dtd_identifier,
                                 const std::optional<std::string>& character_set_name,
                                 const std::optional<std::string>& collation_name);

/**
 * @brief Drops a temporary table when it goes out of scope.
 *
 * drop() drops it explicitly and reports failures; the destructor is the
 * fallback for early exits and only logs.
 */
class TemporaryTableGuard {
public:
    TemporaryTableGuard(db::DataLayer& db, const std::string& table)
        : db_(db), table_(table) {}
    ~TemporaryTableGuard();

    TemporaryTableGuard(const TemporaryTableGuard&) = delete;
    TemporaryTableGuard& operator=(const TemporaryTableGuard&) = delete;

    void drop();

private:
    db::DataLayer& db_;
    std::string table_;
    bool dropped_ = false;
};

class CatalogReconciler {
public:
    CatalogReconciler(db::DataLayer& db, const std::string& source_path)
        : db_(db), source_path_(source_path) {}

    /**
     * @brief Parameters of a routine in ordinal order.
     */
    std::vector<CatalogParameter> routine_parameters(const std::string& routine_name);

    /**
     * @brief Columns of the bulk insert table.
     *
     * A table absent from the catalog is a temporary table: the routine is
     * called once to create it and it is dropped after introspection.
     *
     * @throws ReconciliationError if the column count differs from the
     *         number of declared columns.
     */
    BulkInsertColumns bulk_insert_columns(const std::string& routine_name, const BulkInsert& designation);

    /**
     * @brief Merges the extended parameters into the catalog parameters.
     * @throws ReconciliationError for an extended parameter without a
     *         catalog parameter of the same name.
     */
    void merge_extended_parameters(std::vector<CatalogParameter>& parameters,
                                   const ExtendedParameters& extended) const;

    CatalogInfo reconcile(const std::string& routine_name,
                          const Designation& designation,
                          const ExtendedParameters& extended);

private:
    db::DataLayer& db_;
    std::string source_path_;
};

} // namespace loader
} // namespace sprocket
