#include "sprocket/loader/catalog_reconciler.hpp"

#include <regex>

#include "sprocket/db/helpers.hpp"
#include "sprocket/error.hpp"
#include "sprocket/logging.hpp"

namespace sprocket {
namespace loader {

std::string data_type_descriptor(const std::string& dtd_identifier,
                                 const std::optional<std::string>& character_set_name,
                                 const std::optional<std::string>& collation_name) {
    std::string descriptor = dtd_identifier;
    if (character_set_name) {
        descriptor += " character set " + *character_set_name;
    }
    if (collation_name) {
        descriptor += " collation " + *collation_name;
    }
    return descriptor;
}

// =============================================================================
// TemporaryTableGuard
// =============================================================================

TemporaryTableGuard::~TemporaryTableGuard() {
    if (dropped_) return;
    try {
        drop();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to drop temporary table '", table_, "': ", e.what());
    }
}

void TemporaryTableGuard::drop() {
    dropped_ = true;
    db_.execute_none("drop temporary table if exists `" + table_ + "`");
}

// =============================================================================
// CatalogReconciler
// =============================================================================

std::vector<CatalogParameter> CatalogReconciler::routine_parameters(const std::string& routine_name) {
    std::string query = R"SQL(
select t2.parameter_name     as parameter_name
,      t2.data_type          as data_type
,      t2.numeric_precision  as numeric_precision
,      t2.numeric_scale      as numeric_scale
,      t2.character_set_name as character_set_name
,      t2.collation_name     as collation_name
,      t2.dtd_identifier     as dtd_identifier
from            information_schema.ROUTINES   t1
left outer join information_schema.PARAMETERS t2  on  t2.specific_schema = t1.routine_schema and
                                                      t2.specific_name   = t1.routine_name and
                                                      t2.parameter_mode  is not null
where t1.routine_schema = database()
and   t1.routine_name   = )SQL" + db_.quote_string(routine_name) + R"SQL(
order by t2.ordinal_position)SQL";

    std::vector<CatalogParameter> parameters;
    for (const auto& row : db_.execute_rows(query)) {
        // A routine without parameters yields a single row of NULLs.
        if (db::get_string(row, "parameter_name").empty()) continue;

        CatalogParameter param;
        param.name = db::get_string(row, "parameter_name");
        param.data_type = db::get_string(row, "data_type");
        param.numeric_precision = db::get_optional(row, "numeric_precision");
        param.numeric_scale = db::get_optional(row, "numeric_scale");
        param.character_set_name = db::get_optional(row, "character_set_name");
        param.collation_name = db::get_optional(row, "collation_name");
        param.dtd_identifier = db::get_string(row, "dtd_identifier");
        param.data_type_descriptor = data_type_descriptor(param.dtd_identifier,
                                                          param.character_set_name,
                                                          param.collation_name);
        parameters.push_back(std::move(param));
    }
    return parameters;
}

BulkInsertColumns CatalogReconciler::bulk_insert_columns(const std::string& routine_name,
                                                         const BulkInsert& designation) {
    std::string query = R"SQL(
select 1
from   information_schema.TABLES
where  table_schema = database()
and    table_name   = )SQL" + db_.quote_string(designation.table);
    bool is_permanent = db_.execute_singleton0(query).has_value();

    std::optional<TemporaryTableGuard> guard;
    if (!is_permanent) {
        // The routine creates the temporary table, possibly before failing.
        guard.emplace(db_, designation.table);
        db_.execute_none("call " + routine_name + "()");
    }

    db::Rows columns = db_.execute_rows("describe `" + designation.table + "`");

    if (guard) {
        guard->drop();
    }

    size_t n1 = designation.columns.size();
    size_t n2 = columns.size();
    if (n1 != n2) {
        throw ReconciliationError("Number of fields " + std::to_string(n1) + " and number of columns " +
                                  std::to_string(n2) + " don't match.",
                                  "table '" + designation.table + "' in file '" + source_path_ + "'");
    }

    static const std::regex leading_word(R"(\w+)");

    BulkInsertColumns result;
    for (const auto& column : columns) {
        std::string type = db::get_string(column, "Type");
        std::smatch m;
        result.column_types.push_back(std::regex_search(type, m, leading_word) ? m.str() : type);
        result.fields.push_back(db::get_string(column, "Field"));
    }
    return result;
}

void CatalogReconciler::merge_extended_parameters(std::vector<CatalogParameter>& parameters,
                                                  const ExtendedParameters& extended) const {
    for (const auto& [name, declared] : extended) {
        bool found = false;
        for (auto& param : parameters) {
            if (param.name == name) {
                param.extended = declared;
                found = true;
                break;
            }
        }
        if (!found) {
            throw ReconciliationError("Specific parameter '" + name + "' does not exist in file '" +
                                      source_path_ + "'.");
        }
    }
}

CatalogInfo CatalogReconciler::reconcile(const std::string& routine_name,
                                         const Designation& designation,
                                         const ExtendedParameters& extended) {
    CatalogInfo info;

    if (const auto* bulk = std::get_if<BulkInsert>(&designation)) {
        info.bulk_insert = bulk_insert_columns(routine_name, *bulk);
    }

    info.parameters = routine_parameters(routine_name);
    merge_extended_parameters(info.parameters, extended);
    return info;
}

} // namespace loader
} // namespace sprocket
