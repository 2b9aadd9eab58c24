// =============================================================================
// FakeDataLayer - scripted DataLayer for tests
// =============================================================================
// Records every statement and answers queries with the rows of the first
// rule whose needle occurs in the statement.
// =============================================================================

#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sprocket/db/data_layer.hpp"
#include "sprocket/error.hpp"

namespace sprocket::test {

class FakeDataLayer : public db::DataLayer {
public:
    std::vector<std::string> statements;

    void on_query(const std::string& needle, db::Rows rows) {
        rules_.emplace_back(needle, std::move(rows));
    }

    void fail_on(const std::string& needle, ErrorCode code = ErrorCode::QUERY_FAILED) {
        failures_.emplace_back(needle, code);
    }

    void execute_none(const std::string& sql) override {
        statements.push_back(sql);
        check_failure(sql);
    }

    db::Rows execute_rows(const std::string& sql) override {
        statements.push_back(sql);
        check_failure(sql);
        for (const auto& [needle, rows] : rules_) {
            if (sql.find(needle) != std::string::npos) return rows;
        }
        return {};
    }

    std::string real_escape_string(const std::string& value) override {
        std::string out;
        for (char c : value) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        return out;
    }

    // Index of the first statement containing 'needle', -1 if none.
    int index_of(const std::string& needle) const {
        for (size_t i = 0; i < statements.size(); ++i) {
            if (statements[i].find(needle) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    bool executed(const std::string& needle) const {
        return index_of(needle) >= 0;
    }

private:
    void check_failure(const std::string& sql) const {
        for (const auto& [needle, code] : failures_) {
            if (sql.find(needle) != std::string::npos) {
                throw DatabaseError("Scripted failure", sql, code);
            }
        }
    }

    std::vector<std::pair<std::string, db::Rows>> rules_;
    std::vector<std::pair<std::string, ErrorCode>> failures_;
};

// Row literal; std::nullopt is SQL NULL.
inline db::Row row(std::initializer_list<std::pair<const std::string, std::optional<std::string>>> values) {
    return db::Row(values);
}

} // namespace sprocket::test
