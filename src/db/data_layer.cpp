#include "sprocket/db/data_layer.hpp"

#include "sprocket/error.hpp"

namespace sprocket::db {

std::optional<std::string> DataLayer::execute_singleton0(const std::string& sql) {
    Rows rows = execute_rows(sql);
    if (rows.size() > 1) {
        throw ResultError({0, 1}, static_cast<int>(rows.size()), sql);
    }
    if (rows.empty() || rows.front().empty()) {
        return std::nullopt;
    }
    return rows.front().begin()->second;
}

std::optional<std::string> DataLayer::execute_singleton1(const std::string& sql) {
    Rows rows = execute_rows(sql);
    if (rows.size() != 1) {
        throw ResultError({1}, static_cast<int>(rows.size()), sql);
    }
    if (rows.front().empty()) {
        return std::nullopt;
    }
    return rows.front().begin()->second;
}

} // namespace sprocket::db
