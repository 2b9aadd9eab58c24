#include "sprocket/db/connection.hpp"

#include <memory>
#include <vector>

#include <mysql.h>
#include <errmsg.h>

#include "sprocket/db/helpers.hpp"
#include "sprocket/error.hpp"
#include "sprocket/logging.hpp"

namespace sprocket::db {

struct MySqlDataLayer::Handle {
    MYSQL* conn = nullptr;

    ~Handle() {
        if (conn) {
            mysql_close(conn);
        }
    }
};

MySqlDataLayer::MySqlDataLayer(const ConnectionConfig& config)
    : handle_(std::make_unique<Handle>()) {
    handle_->conn = mysql_init(nullptr);
    if (!handle_->conn) {
        throw DatabaseError("mysql_init failed", config.describe(), ErrorCode::CONNECTION_FAILED);
    }

    const char* db = config.database.empty() ? nullptr : config.database.c_str();
    if (!mysql_real_connect(handle_->conn, config.host.c_str(), config.user.c_str(),
                            config.password.c_str(), db, config.port, nullptr,
                            CLIENT_MULTI_STATEMENTS | CLIENT_MULTI_RESULTS)) {
        throw DatabaseError(std::string("Failed to connect: ") + mysql_error(handle_->conn),
                            config.describe(), ErrorCode::CONNECTION_FAILED);
    }

    LOG_DEBUG("Connected to ", config.describe());
}

MySqlDataLayer::~MySqlDataLayer() = default;

void MySqlDataLayer::raise(const std::string& sql) {
    unsigned int err = mysql_errno(handle_->conn);
    ErrorCode code = (err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST)
                         ? ErrorCode::CONNECTION_LOST
                         : ErrorCode::QUERY_FAILED;
    throw DatabaseError("MySQL error " + std::to_string(err) + ": " + mysql_error(handle_->conn),
                        sql, code);
}

// Discards remaining result sets, e.g. the status result of a CALL.
void MySqlDataLayer::drain_results() {
    while (true) {
        int status = mysql_next_result(handle_->conn);
        if (status == -1) break;
        if (status > 0) raise("");

        MYSQL_RES* res = mysql_store_result(handle_->conn);
        if (res) {
            mysql_free_result(res);
        } else if (mysql_field_count(handle_->conn) != 0) {
            raise("");
        }
    }
}

void MySqlDataLayer::execute_none(const std::string& sql) {
    LOG_DEBUG("Executing: ", sql);
    if (mysql_real_query(handle_->conn, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        raise(sql);
    }

    MYSQL_RES* res = mysql_store_result(handle_->conn);
    if (res) {
        mysql_free_result(res);
    } else if (mysql_field_count(handle_->conn) != 0) {
        raise(sql);
    }
    drain_results();
}

Rows MySqlDataLayer::execute_rows(const std::string& sql) {
    LOG_DEBUG("Querying: ", sql);
    if (mysql_real_query(handle_->conn, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        raise(sql);
    }

    std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> res(
        mysql_store_result(handle_->conn), &mysql_free_result);
    if (!res) {
        if (mysql_field_count(handle_->conn) != 0) {
            raise(sql);
        }
        drain_results();
        return {};
    }

    unsigned int num_fields = mysql_num_fields(res.get());
    MYSQL_FIELD* fields = mysql_fetch_fields(res.get());

    Rows rows;
    while (MYSQL_ROW values = mysql_fetch_row(res.get())) {
        unsigned long* lengths = mysql_fetch_lengths(res.get());
        Row row;
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (values[i]) {
                row[fields[i].name] = std::string(values[i], lengths[i]);
            } else {
                row[fields[i].name] = std::nullopt;
            }
        }
        rows.push_back(std::move(row));
    }

    res.reset();
    drain_results();
    return rows;
}

std::string MySqlDataLayer::real_escape_string(const std::string& value) {
    std::vector<char> buffer(value.size() * 2 + 1);
    unsigned long len = mysql_real_escape_string(handle_->conn, buffer.data(), value.data(),
                                                 static_cast<unsigned long>(value.size()));
    return escaped_string(buffer.data(), len, mysql_error(handle_->conn));
}

} // namespace sprocket::db
