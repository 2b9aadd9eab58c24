/**
 * @file helpers.hpp
 * @brief Value extraction from catalog rows
 *
 * Catalog queries return every column as optional text. These helpers give
 * consistent handling of missing columns and SQL NULL.
 */

#pragma once

#include <optional>
#include <string>

#include "sprocket/db/data_layer.hpp"
#include "sprocket/error.hpp"

namespace sprocket::db {

/**
 * Value of a column, std::nullopt if the column is absent or NULL.
 */
inline std::optional<std::string> get_optional(const Row& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return std::nullopt;
    }
    return it->second;
}

/**
 * Value of a column, empty string if the column is absent or NULL.
 */
inline std::string get_string(const Row& row, const std::string& column) {
    return get_optional(row, column).value_or("");
}

inline bool is_null(const Row& row, const std::string& column) {
    return !get_optional(row, column).has_value();
}

/**
 * Escaped text written by the client library into 'buffer'. A length of
 * (unsigned long)-1 means the library refused to escape (e.g. under
 * NO_BACKSLASH_ESCAPES) and raises DatabaseError with 'error'.
 */
inline std::string escaped_string(const char* buffer, unsigned long length, const std::string& error) {
    if (length == static_cast<unsigned long>(-1)) {
        throw DatabaseError("Unable to escape string: " + error, "", ErrorCode::QUERY_FAILED);
    }
    return std::string(buffer, length);
}

} // namespace sprocket::db
