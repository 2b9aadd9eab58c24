#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sprocket::db {

// Column name -> value; std::nullopt for SQL NULL.
using Row = std::map<std::string, std::optional<std::string>>;
using Rows = std::vector<Row>;

/**
 * @brief Statement execution capability used by the routine compiler.
 *
 * Every method throws DatabaseError when the statement fails. Implementations
 * report lost connections with ErrorCode::CONNECTION_LOST.
 */
class DataLayer {
public:
    virtual ~DataLayer() = default;

    /**
     * @brief Executes a statement that returns no rows.
     */
    virtual void execute_none(const std::string& sql) = 0;

    /**
     * @brief Executes a query and returns all selected rows.
     */
    virtual Rows execute_rows(const std::string& sql) = 0;

    /**
     * @brief Escapes a string for use inside a quoted SQL literal.
     */
    virtual std::string real_escape_string(const std::string& value) = 0;

    // The singleton queries select a single column.

    /**
     * @brief Executes a query selecting 0 or 1 rows and returns its value.
     * @throws ResultError if more than one row is selected.
     */
    std::optional<std::string> execute_singleton0(const std::string& sql);

    /**
     * @brief Executes a query selecting exactly 1 row and returns its value.
     * @throws ResultError if not exactly one row is selected.
     */
    std::optional<std::string> execute_singleton1(const std::string& sql);

    // 'value' with quotes and escaping applied.
    std::string quote_string(const std::string& value) {
        return "'" + real_escape_string(value) + "'";
    }
};

} // namespace sprocket::db
