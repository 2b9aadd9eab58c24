#pragma once

#include <optional>
#include <string>

#include "sprocket/types.hpp"

namespace sprocket {
namespace loader {

// Semantic types understood by the wrapper generator
constexpr const char* SEMANTIC_INT = "int";
constexpr const char* SEMANTIC_FLOAT = "float";
constexpr const char* SEMANTIC_STRING = "string";
constexpr const char* SEMANTIC_INT_LIST = "string|int[]";

// Synthetic list type declared with -- param:
constexpr const char* LIST_OF_INT = "list_of_int";

/**
 * @brief Maps a catalog base type to the semantic type of the wrapper.
 *
 * decimal maps to int only when its scale is "0".
 *
 * @throws UnsupportedTypeError for any type outside the supported set.
 */
std::string column_type_to_semantic_type(const std::string& data_type,
                                         const std::optional<std::string>& numeric_scale = std::nullopt);

// Semantic type of a (possibly extended) parameter.
std::string parameter_semantic_type(const CatalogParameter& parameter);

} // namespace loader
} // namespace sprocket
