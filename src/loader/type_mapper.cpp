#include "sprocket/loader/type_mapper.hpp"

#include <unordered_map>

#include "sprocket/error.hpp"

namespace sprocket {
namespace loader {

namespace {

// Every supported base type. decimal is resolved separately.
const std::unordered_map<std::string, const char*>& type_table() {
    static const std::unordered_map<std::string, const char*> table = {
        // Integers
        {"tinyint",    SEMANTIC_INT},
        {"smallint",   SEMANTIC_INT},
        {"mediumint",  SEMANTIC_INT},
        {"int",        SEMANTIC_INT},
        {"bigint",     SEMANTIC_INT},
        {"year",       SEMANTIC_INT},
        {"bit",        SEMANTIC_INT},

        // Floating point
        {"float",      SEMANTIC_FLOAT},
        {"double",     SEMANTIC_FLOAT},

        // Binary and character strings
        {"varbinary",  SEMANTIC_STRING},
        {"binary",     SEMANTIC_STRING},
        {"char",       SEMANTIC_STRING},
        {"varchar",    SEMANTIC_STRING},

        // Temporal
        {"time",       SEMANTIC_STRING},
        {"timestamp",  SEMANTIC_STRING},
        {"date",       SEMANTIC_STRING},
        {"datetime",   SEMANTIC_STRING},

        {"enum",       SEMANTIC_STRING},
        {"set",        SEMANTIC_STRING},

        // LOBs
        {"tinytext",   SEMANTIC_STRING},
        {"text",       SEMANTIC_STRING},
        {"mediumtext", SEMANTIC_STRING},
        {"longtext",   SEMANTIC_STRING},
        {"tinyblob",   SEMANTIC_STRING},
        {"blob",       SEMANTIC_STRING},
        {"mediumblob", SEMANTIC_STRING},
        {"longblob",   SEMANTIC_STRING},

        {LIST_OF_INT,  SEMANTIC_INT_LIST},
    };
    return table;
}

} // namespace

std::string column_type_to_semantic_type(const std::string& data_type,
                                         const std::optional<std::string>& numeric_scale) {
    if (data_type == "decimal") {
        return (numeric_scale && *numeric_scale == "0") ? SEMANTIC_INT : SEMANTIC_FLOAT;
    }

    auto it = type_table().find(data_type);
    if (it == type_table().end()) {
        throw UnsupportedTypeError(data_type);
    }
    return it->second;
}

std::string parameter_semantic_type(const CatalogParameter& parameter) {
    try {
        return column_type_to_semantic_type(parameter.effective_type(), parameter.numeric_scale);
    } catch (const UnsupportedTypeError& e) {
        throw UnsupportedTypeError(e.type_name(), "parameter '" + parameter.name + "'");
    }
}

} // namespace loader
} // namespace sprocket
