#include "sprocket/config.hpp"

#include <cstdlib>
#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "sprocket/error.hpp"

namespace sprocket {

LoaderConfig default_config() {
    LoaderConfig config;
    config.session.sql_mode =
        "STRICT_ALL_TABLES,ONLY_FULL_GROUP_BY,NO_ZERO_IN_DATE,NO_ZERO_DATE,"
        "ERROR_FOR_DIVISION_BY_ZERO,NO_ENGINE_SUBSTITUTION";
    config.session.character_set = "utf8mb4";
    config.session.collation = "utf8mb4_general_ci";
    return config;
}

void apply_env_overrides(db::ConnectionConfig& config) {
    if (const char* val = std::getenv("SPROCKET_DB_HOST")) config.host = val;
    if (const char* val = std::getenv("SPROCKET_DB_PORT")) {
        config.port = static_cast<unsigned int>(std::strtoul(val, nullptr, 10));
    }
    if (const char* val = std::getenv("SPROCKET_DB_USER")) config.user = val;
    if (const char* val = std::getenv("SPROCKET_DB_PASS")) config.password = val;
    if (const char* val = std::getenv("SPROCKET_DB_NAME")) config.database = val;
}

LoaderConfig load_config(const std::string& config_file) {
    LoaderConfig config = default_config();
    config.config_file = config_file;

    if (!std::filesystem::exists(config_file)) {
        throw ConfigError("Configuration file '" + config_file + "' not found", "",
                          "Pass the file with -c/--config");
    }

    try {
        YAML::Node yaml = YAML::LoadFile(config_file);

        if (yaml["database"]) {
            const auto& db = yaml["database"];
            if (db["host"]) config.database.host = db["host"].as<std::string>();
            if (db["port"]) config.database.port = db["port"].as<unsigned int>();
            if (db["user"]) config.database.user = db["user"].as<std::string>();
            if (db["password"]) config.database.password = db["password"].as<std::string>();
            if (db["database"]) config.database.database = db["database"].as<std::string>();
        }

        if (yaml["loader"]) {
            const auto& loader = yaml["loader"];
            if (loader["source_directory"]) config.source_directory = loader["source_directory"].as<std::string>();
            if (loader["extension"]) config.extension = loader["extension"].as<std::string>();
            if (loader["metadata"]) config.metadata = loader["metadata"].as<std::string>();
            if (loader["sql_mode"]) config.session.sql_mode = loader["sql_mode"].as<std::string>();
            if (loader["character_set"]) config.session.character_set = loader["character_set"].as<std::string>();
            if (loader["collation"]) config.session.collation = loader["collation"].as<std::string>();
            if (loader["constants"]) {
                for (const auto& item : loader["constants"]) {
                    config.constants[item.first.as<std::string>()] = item.second.as<std::string>();
                }
            }
        }

        if (yaml["logging"]) {
            const auto& log = yaml["logging"];
            if (log["level"]) config.log_level = log["level"].as<std::string>();
            if (log["file"]) config.log_file = log["file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid configuration file '" + config_file + "'", e.what());
    }

    apply_env_overrides(config.database);
    return config;
}

} // namespace sprocket
