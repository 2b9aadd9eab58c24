// =============================================================================
// Staleness Tests
// =============================================================================

#include <gtest/gtest.h>
#include "sprocket/loader/staleness.hpp"

using namespace sprocket;
using namespace sprocket::loader;

class StalenessTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = {"STRICT_ALL_TABLES", "utf8mb4", "utf8mb4_general_ci"};

        previous.routine_name = "tst_foo";
        previous.routine_type = "procedure";
        previous.timestamp = 1700000000;
        previous.replace = {{"@MAX@", "10"}, {"@usr.usr_id%type@", "int(10) unsigned"}};

        pairs = {{"@MAX@", "10"}, {"@USR.USR_ID%TYPE@", "int(10) unsigned"}, {"@UNUSED@", "x"}};

        catalog = RoutineCatalogEntry{"procedure", "STRICT_ALL_TABLES", "utf8mb4", "utf8mb4_general_ci"};
    }

    SessionSettings session;
    BuildMetadata previous;
    ReplacePairs pairs;
    std::optional<RoutineCatalogEntry> catalog;
};

TEST_F(StalenessTest, UpToDate) {
    EXPECT_FALSE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, NoPreviousMetadata) {
    // Whatever else holds, a routine never compiled before is reloaded.
    EXPECT_TRUE(must_reload(std::nullopt, 1700000000, pairs, session, catalog));
    EXPECT_TRUE(must_reload(std::nullopt, 0, {}, session, std::nullopt));
}

TEST_F(StalenessTest, ModifiedSource) {
    EXPECT_TRUE(must_reload(previous, 1700000001, pairs, session, catalog));
}

TEST_F(StalenessTest, SinglePlaceholderValueChanged) {
    pairs["@MAX@"] = "20";
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, PlaceholderNoLongerDefined) {
    pairs.erase("@USR.USR_ID%TYPE@");
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, UnrelatedPlaceholderChangeIgnored) {
    pairs["@UNUSED@"] = "y";
    pairs["@NEW@"] = "1";
    EXPECT_FALSE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, RoutineMissingFromCatalog) {
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, std::nullopt));
}

TEST_F(StalenessTest, SqlModeChanged) {
    catalog->sql_mode = "ANSI_QUOTES";
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, CharacterSetChanged) {
    catalog->character_set_client = "latin1";
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, catalog));
}

TEST_F(StalenessTest, CollationChanged) {
    session.collation = "utf8mb4_bin";
    EXPECT_TRUE(must_reload(previous, 1700000000, pairs, session, catalog));
}
