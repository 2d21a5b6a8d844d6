// ==============================================================================
// test_sqlite_gtest.cpp - Тесты обёртки sqlite3 и классификации схемы
// ==============================================================================

#include "chatx/schema.hpp"
#include "chatx/sqlite.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

namespace chatx::sqlite::test {

using chatx::test::ChatDbBuilder;
using chatx::test::LEGACY_SCHEMA;
using chatx::test::TempDirTest;

class SqliteTest : public TempDirTest {};

TEST_F(SqliteTest, Open_MissingFileReadOnly_Throws) {
    EXPECT_THROW({ Database db(temp_dir_ / "absent.db", OpenMode::ReadOnly); }, SqliteError);
}

TEST_F(SqliteTest, Statement_BindAndReadAllTypes) {
    Database db(temp_dir_ / "t.db", OpenMode::ReadWriteCreate);
    db.exec("CREATE TABLE t (i INTEGER, r REAL, s TEXT, b BLOB, n TEXT)");

    auto insert = db.prepare("INSERT INTO t VALUES (?1, ?2, ?3, ?4, ?5)");
    insert.bind_int(1, 1234567890123LL);
    insert.bind_double(2, 0.25);
    insert.bind_text(3, "строка");
    insert.bind_blob(4, {0x00, 0xFF, 0x10});
    insert.bind_null(5);
    EXPECT_FALSE(insert.step());

    auto select = db.prepare("SELECT i, r, s, b, n FROM t");
    ASSERT_TRUE(select.step());
    EXPECT_EQ(select.column_count(), 5);
    EXPECT_EQ(select.column_name(2), "s");
    EXPECT_EQ(select.column_int(0), 1234567890123LL);
    EXPECT_DOUBLE_EQ(select.column_double(1), 0.25);
    EXPECT_EQ(select.column_text(2), "строка");
    EXPECT_EQ(select.column_blob(3), (std::vector<std::uint8_t>{0x00, 0xFF, 0x10}));
    EXPECT_TRUE(select.column_is_null(4));

    EXPECT_TRUE(select.column_value(0).is_int());
    EXPECT_TRUE(select.column_value(1).is_double());
    EXPECT_TRUE(select.column_value(2).is_string());
    EXPECT_TRUE(select.column_value(3).is_bytes());
    EXPECT_TRUE(select.column_value(4).is_null());
    EXPECT_FALSE(select.step());
}

TEST_F(SqliteTest, Prepare_InvalidSql_Throws) {
    Database db(temp_dir_ / "t.db", OpenMode::ReadWriteCreate);
    EXPECT_THROW(db.prepare("SELEC nothing"), SqliteError);
}

TEST_F(SqliteTest, Introspection_TablesAndColumns) {
    Database db(temp_dir_ / "t.db", OpenMode::ReadWriteCreate);
    db.exec("CREATE TABLE \"odd name\" (a INTEGER, \"b c\" TEXT)");

    EXPECT_TRUE(db.table_exists("odd name"));
    EXPECT_FALSE(db.table_exists("message"));
    EXPECT_EQ(db.table_columns("odd name"), (std::vector<std::string>{"a", "b c"}));
    EXPECT_TRUE(db.table_columns("message").empty());
    EXPECT_EQ(db.query_int("SELECT COUNT(*) FROM \"odd name\"").value_or(-1), 0);
    EXPECT_EQ(quote_identifier("x\"y"), "\"x\"\"y\"");
}

// ==============================================================================
// Поколения схемы
// ==============================================================================

TEST(SchemaTest, Classify_ByColumnSet) {
    std::set<std::string> legacy = {"ROWID", "guid", "text", "date", "is_from_me", "handle_id"};
    EXPECT_EQ(schema::classify(legacy).generation, schema::Generation::LegacyText);

    auto binary = legacy;
    binary.insert("attributedBody");
    schema::SchemaInfo info = schema::classify(binary);
    EXPECT_EQ(info.generation, schema::Generation::BinaryText);
    EXPECT_EQ(info.version, 2);

    binary.insert("message_summary_info");
    EXPECT_EQ(schema::classify(binary).generation, schema::Generation::BinaryTextEdits);
    EXPECT_STREQ(schema::generation_tag(schema::Generation::BinaryTextEdits), "binary_text_edits");
}

TEST(SchemaTest, Classify_UnknownLayoutDegradesToLegacy) {
    schema::SchemaInfo info = schema::classify({"ROWID", "guid", "body"});
    EXPECT_FALSE(info.recognized);
    EXPECT_EQ(info.generation, schema::Generation::LegacyText);
    EXPECT_EQ(info.missing,
              (std::vector<std::string>{"text", "date", "is_from_me", "handle_id"}));
}

TEST(SchemaTest, Generations_AreAppendOnlyAscending) {
    const auto& table = schema::generations();
    ASSERT_EQ(table.size(), 3u);
    for (std::size_t i = 1; i < table.size(); ++i) {
        EXPECT_GT(table[i].version, table[i - 1].version);
        EXPECT_GT(table[i].required.size(), table[i - 1].required.size());
    }
}

class SchemaInspectTest : public TempDirTest {};

TEST_F(SchemaInspectTest, Inspect_ModernDatabase) {
    ChatDbBuilder builder(temp_dir_ / "chat.db");
    schema::SchemaInfo info = schema::inspect(builder.db());

    EXPECT_TRUE(info.recognized);
    EXPECT_EQ(info.generation, schema::Generation::BinaryTextEdits);
    EXPECT_TRUE(info.has_column("ROWID"));
    EXPECT_TRUE(info.has_column("thread_originator_guid"));
    EXPECT_TRUE(info.has_handle);
    EXPECT_TRUE(info.has_chat_message_join);
    EXPECT_TRUE(info.handle_joinable);
    EXPECT_TRUE(info.chat_joinable);
    EXPECT_TRUE(info.attachments_available());
    EXPECT_TRUE(info.warnings.empty());
}

TEST_F(SchemaInspectTest, Inspect_LegacyDatabase) {
    ChatDbBuilder builder(temp_dir_ / "chat.db", LEGACY_SCHEMA);
    schema::SchemaInfo info = schema::inspect(builder.db());

    EXPECT_EQ(info.generation, schema::Generation::LegacyText);
    EXPECT_TRUE(info.has_handle);
    EXPECT_FALSE(info.has_chat);
    EXPECT_FALSE(info.attachments_available());
}

TEST_F(SchemaInspectTest, Inspect_DriftedAuxiliaryColumnsAreNotJoined) {
    ChatDbBuilder builder(temp_dir_ / "chat.db");
    builder.db().exec("DROP TABLE handle;"
                      "CREATE TABLE handle (ROWID INTEGER PRIMARY KEY, uncanonicalized_id TEXT);"
                      "DROP TABLE chat;"
                      "CREATE TABLE chat (ROWID INTEGER PRIMARY KEY, chat_identifier TEXT);");
    schema::SchemaInfo info = schema::inspect(builder.db());

    EXPECT_TRUE(info.recognized);
    EXPECT_TRUE(info.has_handle);
    EXPECT_FALSE(info.handle_joinable);
    EXPECT_TRUE(info.has_chat);
    EXPECT_FALSE(info.chat_joinable);
    EXPECT_TRUE(info.attachments_available());
    EXPECT_EQ(info.warnings, (std::vector<std::string>{"handle table lacks column(s): id",
                                                       "chat table lacks column(s): guid"}));
}

}  // namespace chatx::sqlite::test
