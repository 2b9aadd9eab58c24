// =============================================================================
// config.hpp - Loader configuration
// =============================================================================

#pragma once

#include <map>
#include <string>

#include "sprocket/db/connection.hpp"
#include "sprocket/types.hpp"

namespace sprocket {

struct LoaderConfig {
    db::ConnectionConfig database;

    std::string source_directory = "lib/psql";
    std::string extension = ".psql";
    std::string metadata = "etc/routines.yaml";

    // sql_mode, character set and collation routines are created with
    SessionSettings session;

    // NAME -> value, referenced in sources as @NAME@
    std::map<std::string, std::string> constants;

    std::string log_level = "info";
    std::string log_file;

    std::string config_file;
};

/**
 * @brief Loads the configuration from a YAML file.
 *
 * Missing keys keep their defaults. SPROCKET_DB_* environment variables take
 * precedence over the database section of the file.
 *
 * @throws ConfigError if the file is missing or is not valid YAML.
 */
LoaderConfig load_config(const std::string& config_file = "sprocket.yaml");

// Defaults only, no file.
LoaderConfig default_config();

// Applies SPROCKET_DB_HOST/PORT/USER/PASS/NAME when set.
void apply_env_overrides(db::ConnectionConfig& config);

} // namespace sprocket
