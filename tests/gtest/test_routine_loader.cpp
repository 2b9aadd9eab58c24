// =============================================================================
// Routine Loader Tests
// =============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "sprocket/error.hpp"
#include "sprocket/loader/routine_loader.hpp"
#include "fake_data_layer.hpp"

using namespace sprocket;
using namespace sprocket::loader;
using sprocket::test::FakeDataLayer;
using sprocket::test::row;

namespace fs = std::filesystem;

class RoutineLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("sprocket_loader_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir / "psql");

        config = default_config();
        config.source_directory = (dir / "psql").string();
        config.metadata = (dir / "etc" / "routines.yaml").string();
        config.constants = {{"max_length", "100"}};
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void write_source(const std::string& relative, const std::string& name,
                      const std::string& body = "  select 1;") {
        fs::path path = dir / "psql" / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << "create procedure " << name << "()\n-- type: none\nbegin\n" << body << "\nend\n";
    }

    db::Row catalog_row(const std::string& name) const {
        return row({{"routine_name", name},
                    {"routine_type", "PROCEDURE"},
                    {"sql_mode", config.session.sql_mode},
                    {"character_set_client", config.session.character_set},
                    {"collation_connection", config.session.collation}});
    }

    fs::path dir;
    LoaderConfig config;
    FakeDataLayer db;
};

TEST_F(RoutineLoaderTest, DiscoversSourcesRecursively) {
    write_source("b/tst_b.psql", "tst_b");
    write_source("tst_a.psql", "tst_a");
    std::ofstream(dir / "psql" / "notes.txt") << "ignored";

    RoutineLoader loader(db, config);
    auto files = loader.discover_sources();

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "tst_b.psql");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "tst_a.psql");
}

TEST_F(RoutineLoaderTest, ReplacePairsFromConstantsAndColumns) {
    db.on_query("information_schema.COLUMNS", {
        row({{"table_name", "usr"}, {"column_name", "usr_name"},
             {"column_type", "varchar(60)"}, {"character_set_name", "utf8mb4"}}),
        row({{"table_name", "usr"}, {"column_name", "usr_id"},
             {"column_type", "int(10) unsigned"}, {"character_set_name", std::nullopt}}),
    });

    RoutineLoader loader(db, config);
    ReplacePairs pairs = loader.build_replace_pairs();

    EXPECT_EQ(pairs.at("@MAX_LENGTH@"), "100");
    EXPECT_EQ(pairs.at("@USR.USR_NAME%TYPE@"), "varchar(60) character set utf8mb4");
    EXPECT_EQ(pairs.at("@USR.USR_ID%TYPE@"), "int(10) unsigned");
}

TEST_F(RoutineLoaderTest, CatalogEntriesLowercased) {
    db.on_query("collation_connection", {catalog_row("tst_a")});

    RoutineLoader loader(db, config);
    auto catalog = loader.read_catalog();

    ASSERT_EQ(catalog.count("tst_a"), 1u);
    EXPECT_EQ(catalog.at("tst_a").routine_type, "procedure");
}

TEST_F(RoutineLoaderTest, LoadAllCompilesAndSavesMetadata) {
    write_source("tst_a.psql", "tst_a", "  select @MAX_LENGTH@;");
    write_source("tst_b.psql", "tst_b");

    RoutineLoader loader(db, config);
    EXPECT_EQ(loader.load_all(), 0);

    EXPECT_TRUE(db.executed("create procedure tst_a()"));
    EXPECT_TRUE(db.executed("select 100;"));
    EXPECT_TRUE(db.executed("create procedure tst_b()"));
    EXPECT_LT(db.index_of("create procedure tst_a()"), db.index_of("create procedure tst_b()"));

    MetadataStore saved(config.metadata);
    saved.load();
    EXPECT_EQ(saved.routine_names(), (std::vector<std::string>{"tst_a", "tst_b"}));
    EXPECT_EQ(saved.get("tst_a")->replace.at("@MAX_LENGTH@"), "100");
}

TEST_F(RoutineLoaderTest, SecondRunSkipsUnchangedRoutines) {
    write_source("tst_a.psql", "tst_a");
    {
        RoutineLoader loader(db, config);
        ASSERT_EQ(loader.load_all(), 0);
    }

    FakeDataLayer second;
    second.on_query("collation_connection", {catalog_row("tst_a")});
    RoutineLoader loader(second, config);
    EXPECT_EQ(loader.load_all(), 0);
    EXPECT_FALSE(second.executed("create procedure"));
    EXPECT_TRUE(loader.metadata().get("tst_a").has_value());
}

TEST_F(RoutineLoaderTest, DuplicateRoutineNamesFail) {
    write_source("one/tst_dup.psql", "tst_dup");
    write_source("two/tst_dup.psql", "tst_dup");

    RoutineLoader loader(db, config);
    EXPECT_EQ(loader.load_all(), 2);
    EXPECT_FALSE(db.executed("create procedure tst_dup"));
}

TEST_F(RoutineLoaderTest, FailedRoutineKeepsPreviousMetadata) {
    write_source("tst_a.psql", "tst_a");
    {
        RoutineLoader loader(db, config);
        ASSERT_EQ(loader.load_all(), 0);
    }

    // New mtime and a statement failure on reload.
    write_source("tst_a.psql", "tst_a", "  select 2;");
    fs::last_write_time(dir / "psql" / "tst_a.psql",
                        fs::last_write_time(dir / "psql" / "tst_a.psql") + std::chrono::hours(1));

    FakeDataLayer second;
    second.fail_on("create procedure tst_a");
    RoutineLoader loader(second, config);
    EXPECT_EQ(loader.load_all(), 1);
    EXPECT_TRUE(loader.metadata().get("tst_a").has_value());
}

TEST_F(RoutineLoaderTest, ObsoleteRoutinesDropped) {
    write_source("tst_a.psql", "tst_a");
    write_source("tst_gone.psql", "tst_gone");
    {
        RoutineLoader loader(db, config);
        ASSERT_EQ(loader.load_all(), 0);
    }
    fs::remove(dir / "psql" / "tst_gone.psql");

    FakeDataLayer second;
    second.on_query("collation_connection", {catalog_row("tst_a"), catalog_row("tst_gone")});
    RoutineLoader loader(second, config);
    EXPECT_EQ(loader.load_all(), 0);

    EXPECT_TRUE(second.executed("drop procedure if exists tst_gone"));
    EXPECT_FALSE(loader.metadata().get("tst_gone").has_value());
}

TEST_F(RoutineLoaderTest, LoadListDoesNotDropOtherRoutines) {
    write_source("tst_a.psql", "tst_a");
    write_source("tst_b.psql", "tst_b");
    {
        RoutineLoader loader(db, config);
        ASSERT_EQ(loader.load_all(), 0);
    }

    FakeDataLayer second;
    second.on_query("collation_connection", {catalog_row("tst_a"), catalog_row("tst_b")});
    RoutineLoader loader(second, config);
    EXPECT_EQ(loader.load_list({(dir / "psql" / "tst_a.psql").string()}), 0);

    EXPECT_FALSE(second.executed("drop procedure if exists tst_b"));
    EXPECT_TRUE(loader.metadata().get("tst_b").has_value());
}

TEST_F(RoutineLoaderTest, LostConnectionSavesMetadataAndAborts) {
    write_source("tst_a.psql", "tst_a");
    write_source("tst_b.psql", "tst_b");
    db.fail_on("create procedure tst_b", ErrorCode::CONNECTION_LOST);

    RoutineLoader loader(db, config);
    EXPECT_THROW(loader.load_all(), DatabaseError);

    MetadataStore saved(config.metadata);
    saved.load();
    EXPECT_EQ(saved.routine_names(), (std::vector<std::string>{"tst_a"}));
}
