// =============================================================================
// Routine Compiler Tests
// =============================================================================

#include <gtest/gtest.h>
#include "sprocket/error.hpp"
#include "sprocket/loader/routine_compiler.hpp"
#include "fake_data_layer.hpp"

using namespace sprocket;
using namespace sprocket::loader;
using sprocket::test::FakeDataLayer;
using sprocket::test::row;

namespace {

const char* ROWS_WITH_KEY_SOURCE =
    "/**\n"
    " * Selects the users of a group.\n"
    " *\n"
    " * @param p_grp_id The ID of the group.\n"
    " */\n"
    "create procedure tst_rows_with_key(in p_grp_id @grp.grp_id%type@)\n"
    "reads sql data\n"
    "-- type: rows_with_key usr_id\n"
    "begin\n"
    "  select usr_id, usr_name from usr where grp_id = p_grp_id;\n"
    "end\n";

} // namespace

class RoutineCompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = {"STRICT_ALL_TABLES", "utf8mb4", "utf8mb4_general_ci"};
        pairs = {{"@GRP.GRP_ID%TYPE@", "int(10) unsigned"}};

        db.on_query("information_schema.PARAMETERS", {
            row({{"parameter_name", "p_grp_id"},
                 {"data_type", "int"},
                 {"numeric_precision", "10"},
                 {"numeric_scale", "0"},
                 {"character_set_name", std::nullopt},
                 {"collation_name", std::nullopt},
                 {"dtd_identifier", "int(10) unsigned"}}),
        });
    }

    RoutineSource source(const std::string& name, const std::string& text, int64_t mtime = 1700000000) {
        return RoutineSource::from_text("lib/psql/" + name + ".psql", ".psql", text, mtime);
    }

    RoutineCatalogEntry live_entry() const {
        return {"procedure", session.sql_mode, session.character_set, session.collation};
    }

    FakeDataLayer db;
    SessionSettings session;
    ReplacePairs pairs;
};

TEST_F(RoutineCompilerTest, RowsWithKeyEndToEnd) {
    RoutineCompiler compiler(db, session, pairs);
    CompileResult result = compiler.compile(source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE),
                                            std::nullopt, std::nullopt);

    ASSERT_EQ(result.status, CompileStatus::LOADED) << result.diagnostic;
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_TRUE(result.metadata.has_value());

    const BuildMetadata& m = *result.metadata;
    EXPECT_EQ(m.routine_name, "tst_rows_with_key");
    EXPECT_EQ(m.routine_type, "procedure");
    EXPECT_EQ(m.designation, Designation(RowsWithKey{{"usr_id"}}));
    EXPECT_EQ(m.timestamp, 1700000000);
    EXPECT_EQ(m.replace, (PlaceholderSet{{"@grp.grp_id%type@", "int(10) unsigned"}}));
    EXPECT_TRUE(m.fields.empty());
    EXPECT_TRUE(m.extended_parameters.empty());

    ASSERT_EQ(m.parameters.size(), 1u);
    EXPECT_EQ(m.parameters[0].data_type_descriptor, "int(10) unsigned");

    EXPECT_EQ(m.doc.short_description, "Selects the users of a group.");
    ASSERT_EQ(m.doc.parameters.size(), 1u);
    EXPECT_EQ(m.doc.parameters[0].semantic_type, "int");
    EXPECT_EQ(*m.doc.parameters[0].description, "The ID of the group.");

    int create = db.index_of("create procedure tst_rows_with_key(in p_grp_id int(10) unsigned)");
    ASSERT_GE(create, 0);
    EXPECT_LT(create, db.index_of("information_schema.PARAMETERS"));
}

TEST_F(RoutineCompilerTest, UnchangedRoutineReturnsPreviousMetadata) {
    RoutineCompiler compiler(db, session, pairs);
    auto src = source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE);

    CompileResult first = compiler.compile(src, std::nullopt, std::nullopt);
    ASSERT_TRUE(first.ok());

    db.statements.clear();
    CompileResult second = compiler.compile(src, first.metadata, live_entry());

    EXPECT_EQ(second.status, CompileStatus::UNCHANGED);
    ASSERT_TRUE(second.metadata.has_value());
    EXPECT_EQ(*second.metadata, *first.metadata);
    EXPECT_TRUE(db.statements.empty());
}

TEST_F(RoutineCompilerTest, ChangedPlaceholderReloads) {
    RoutineCompiler first_compiler(db, session, pairs);
    auto src = source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE);
    CompileResult first = first_compiler.compile(src, std::nullopt, std::nullopt);
    ASSERT_TRUE(first.ok());

    ReplacePairs changed = {{"@GRP.GRP_ID%TYPE@", "bigint(20)"}};
    RoutineCompiler compiler(db, session, changed);
    CompileResult second = compiler.compile(src, first.metadata, live_entry());

    EXPECT_EQ(second.status, CompileStatus::LOADED);
    EXPECT_EQ(second.metadata->replace.at("@grp.grp_id%type@"), "bigint(20)");
    EXPECT_TRUE(db.executed("drop procedure if exists tst_rows_with_key"));
}

TEST_F(RoutineCompilerTest, OwnsReplacePairs) {
    RoutineCompiler compiler(db, session, ReplacePairs{{"@GRP.GRP_ID%TYPE@", "smallint(5)"}});
    CompileResult result = compiler.compile(source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE),
                                            std::nullopt, std::nullopt);

    ASSERT_EQ(result.status, CompileStatus::LOADED) << result.diagnostic;
    EXPECT_EQ(result.metadata->replace.at("@grp.grp_id%type@"), "smallint(5)");
    EXPECT_TRUE(db.executed("create procedure tst_rows_with_key(in p_grp_id smallint(5))"));
}

TEST_F(RoutineCompilerTest, UndocumentedParameterWarns) {
    std::string text = "create procedure tst_nodoc(in p_id int)\n-- type: none\nbegin\nend\n";
    FakeDataLayer local;
    local.on_query("information_schema.PARAMETERS", {
        row({{"parameter_name", "p_id"}, {"data_type", "int"}, {"dtd_identifier", "int(11)"}}),
    });

    RoutineCompiler compiler(local, session, pairs);
    CompileResult result = compiler.compile(source("tst_nodoc", text), std::nullopt, std::nullopt);

    ASSERT_EQ(result.status, CompileStatus::LOADED);
    EXPECT_EQ(result.warnings, (std::vector<std::string>{"parameter 'p_id' is missing from doc block"}));
}

TEST_F(RoutineCompilerTest, ParseErrorFailsWithoutStatements) {
    std::string text = "create procedure tst_bad()\nbegin\nend\n";

    RoutineCompiler compiler(db, session, pairs);
    CompileResult result = compiler.compile(source("tst_bad", text), std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, CompileStatus::FAILED);
    EXPECT_NE(result.diagnostic.find("Unable to find the designation type"), std::string::npos);
    EXPECT_FALSE(result.metadata.has_value());
    EXPECT_TRUE(db.statements.empty());
}

TEST_F(RoutineCompilerTest, UnknownPlaceholderFails) {
    std::string text = "create procedure tst_ph()\n-- type: none\nbegin\n  select @NOPE@;\nend\n";

    RoutineCompiler compiler(db, session, pairs);
    CompileResult result = compiler.compile(source("tst_ph", text), std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, CompileStatus::FAILED);
    EXPECT_NE(result.diagnostic.find("Unknown placeholder '@NOPE@'"), std::string::npos);
}

TEST_F(RoutineCompilerTest, FailingStatementFails) {
    db.fail_on("create procedure");

    RoutineCompiler compiler(db, session, pairs);
    CompileResult result = compiler.compile(source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE),
                                            std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, CompileStatus::FAILED);
    EXPECT_NE(result.diagnostic.find("lib/psql/tst_rows_with_key.psql"), std::string::npos);
}

TEST_F(RoutineCompilerTest, LostConnectionPropagates) {
    db.fail_on("set sql_mode", ErrorCode::CONNECTION_LOST);

    RoutineCompiler compiler(db, session, pairs);
    EXPECT_THROW(compiler.compile(source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE),
                                  std::nullopt, std::nullopt),
                 DatabaseError);
}

TEST_F(RoutineCompilerTest, UnsupportedParameterTypeFails) {
    FakeDataLayer local;
    local.on_query("information_schema.PARAMETERS", {
        row({{"parameter_name", "p_grp_id"}, {"data_type", "geometry"}, {"dtd_identifier", "geometry"}}),
    });

    RoutineCompiler compiler(local, session, pairs);
    CompileResult result = compiler.compile(source("tst_rows_with_key", ROWS_WITH_KEY_SOURCE),
                                            std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, CompileStatus::FAILED);
    EXPECT_NE(result.diagnostic.find("geometry"), std::string::npos);
}

TEST_F(RoutineCompilerTest, MissingFileFails) {
    RoutineCompiler compiler(db, session, pairs);
    CompileResult result = compiler.compile_file("/nonexistent/tst_gone.psql", ".psql",
                                                 std::nullopt, std::nullopt);

    EXPECT_EQ(result.status, CompileStatus::FAILED);
    EXPECT_FALSE(result.diagnostic.empty());
}

TEST_F(RoutineCompilerTest, DocumentedRowsWithKeyHasNoWarnings) {
    std::string text =
        "/**\n"
        " * Selects rows by id.\n"
        " *\n"
        " * @param id The id.\n"
        " */\n"
        "create procedure tst_by_id(in id int)\n"
        "-- type: rows_with_key id\n"
        "begin\n"
        "  select id from t where t.id = id;\n"
        "end\n";
    FakeDataLayer local;
    local.on_query("information_schema.PARAMETERS", {
        row({{"parameter_name", "id"}, {"data_type", "int"}, {"dtd_identifier", "int(11)"}}),
    });

    RoutineCompiler compiler(local, session, pairs);
    CompileResult result = compiler.compile(source("tst_by_id", text), std::nullopt, std::nullopt);

    ASSERT_EQ(result.status, CompileStatus::LOADED) << result.diagnostic;
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(designation_name(result.metadata->designation), "rows_with_key");
    EXPECT_EQ(designation_columns(result.metadata->designation), (std::vector<std::string>{"id"}));
    ASSERT_EQ(result.metadata->doc.parameters.size(), 1u);
    EXPECT_EQ(result.metadata->doc.parameters[0].semantic_type, "int");
}
