#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include "sprocket/db/data_layer.hpp"

namespace sprocket::db {

// Database connection configuration
struct ConnectionConfig {
    std::string host;
    unsigned int port;
    std::string user;
    std::string password;
    std::string database;

    ConnectionConfig() {
        // Read from SPROCKET_DB_* env vars with defaults
        auto get_env = [](const char* name, const char* def) -> std::string {
            const char* val = std::getenv(name);
            return val ? val : def;
        };
        host = get_env("SPROCKET_DB_HOST", "localhost");
        port = static_cast<unsigned int>(std::strtoul(get_env("SPROCKET_DB_PORT", "3306").c_str(), nullptr, 10));
        user = get_env("SPROCKET_DB_USER", "root");
        password = get_env("SPROCKET_DB_PASS", "");
        database = get_env("SPROCKET_DB_NAME", "");
    }

    std::string describe() const {
        return user + "@" + host + ":" + std::to_string(port) + "/" + database;
    }
};

/**
 * @brief DataLayer over a MySQL connection (RAII wrapper for the MYSQL handle).
 *
 * Connects with multi-result support so that the result sets of a `call` of a
 * procedure can be drained.
 */
class MySqlDataLayer : public DataLayer {
public:
    // Connects immediately. Throws DatabaseError (CONNECTION_FAILED).
    explicit MySqlDataLayer(const ConnectionConfig& config);
    ~MySqlDataLayer() override;

    // No copy
    MySqlDataLayer(const MySqlDataLayer&) = delete;
    MySqlDataLayer& operator=(const MySqlDataLayer&) = delete;

    void execute_none(const std::string& sql) override;
    Rows execute_rows(const std::string& sql) override;
    std::string real_escape_string(const std::string& value) override;

private:
    // Owns the MYSQL handle; keeps <mysql.h> out of this header.
    struct Handle;

    [[noreturn]] void raise(const std::string& sql);
    void drain_results();

    std::unique_ptr<Handle> handle_;
};

} // namespace sprocket::db
