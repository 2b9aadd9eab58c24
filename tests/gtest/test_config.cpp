// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "sprocket/config.hpp"
#include "sprocket/error.hpp"

using namespace sprocket;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"SPROCKET_DB_HOST", "SPROCKET_DB_PORT", "SPROCKET_DB_USER",
                                 "SPROCKET_DB_PASS", "SPROCKET_DB_NAME"}) {
            unsetenv(name);
        }
        path = (fs::temp_directory_path() /
                ("sprocket_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 ".yaml")).string();
    }

    void TearDown() override {
        unsetenv("SPROCKET_DB_HOST");
        fs::remove(path);
    }

    void write(const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    std::string path;
};

TEST_F(ConfigTest, Defaults) {
    LoaderConfig config = default_config();
    EXPECT_EQ(config.extension, ".psql");
    EXPECT_EQ(config.session.character_set, "utf8mb4");
    EXPECT_FALSE(config.session.sql_mode.empty());
    EXPECT_TRUE(config.constants.empty());
}

TEST_F(ConfigTest, LoadsAllSections) {
    write(
        "database:\n"
        "  host: db.local\n"
        "  port: 3307\n"
        "  user: loader\n"
        "  password: secret\n"
        "  database: shop\n"
        "loader:\n"
        "  source_directory: lib/sql\n"
        "  extension: .sql\n"
        "  metadata: build/routines.yaml\n"
        "  sql_mode: STRICT_ALL_TABLES\n"
        "  character_set: latin1\n"
        "  collation: latin1_swedish_ci\n"
        "  constants:\n"
        "    max_length: 100\n"
        "    status_active: A\n"
        "logging:\n"
        "  level: debug\n"
        "  file: loader.log\n");

    LoaderConfig config = load_config(path);
    EXPECT_EQ(config.database.host, "db.local");
    EXPECT_EQ(config.database.port, 3307u);
    EXPECT_EQ(config.database.user, "loader");
    EXPECT_EQ(config.database.password, "secret");
    EXPECT_EQ(config.database.database, "shop");
    EXPECT_EQ(config.source_directory, "lib/sql");
    EXPECT_EQ(config.extension, ".sql");
    EXPECT_EQ(config.metadata, "build/routines.yaml");
    EXPECT_EQ(config.session.sql_mode, "STRICT_ALL_TABLES");
    EXPECT_EQ(config.session.character_set, "latin1");
    EXPECT_EQ(config.session.collation, "latin1_swedish_ci");
    EXPECT_EQ(config.constants.at("max_length"), "100");
    EXPECT_EQ(config.constants.at("status_active"), "A");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.log_file, "loader.log");
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    write("loader:\n  extension: .sql\n");

    LoaderConfig config = load_config(path);
    EXPECT_EQ(config.extension, ".sql");
    EXPECT_EQ(config.source_directory, "lib/psql");
    EXPECT_EQ(config.session.collation, "utf8mb4_general_ci");
    EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write("database:\n  host: db.local\n");
    setenv("SPROCKET_DB_HOST", "env.local", 1);

    LoaderConfig config = load_config(path);
    EXPECT_EQ(config.database.host, "env.local");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigTest, InvalidYamlThrows) {
    write("loader: [unclosed\n");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigTest, WrongValueTypeThrows) {
    write("database:\n  port: not-a-number\n");
    EXPECT_THROW(load_config(path), ConfigError);
}
