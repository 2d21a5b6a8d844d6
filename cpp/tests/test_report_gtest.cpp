// ==============================================================================
// test_report_gtest.cpp - Тесты Run Reporter
// ==============================================================================

#include "chatx/report.hpp"

#include "chatx/output.hpp"

#include <gtest/gtest.h>
#include <regex>
#include <string>

namespace chatx::report::test {

TEST(ReportTest, NowUtc_IsIso8601) {
    std::regex iso("^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}Z$");
    EXPECT_TRUE(std::regex_match(now_utc(), iso)) << now_utc();
}

TEST(ReportTest, ToDocument_Layout) {
    RunReport report;
    report.started_at = "2024-03-01T10:00:00Z";
    report.finished_at = "2024-03-01T10:00:05Z";
    report.source_kind = "backup";
    report.source_path = "~/Backup/udid";
    report.schema_generation = "binary_text_edits";
    report.schema_version = 3;
    report.counters.rows_read = 12;
    report.counters.messages_emitted = 9;
    report.counters.reactions_folded = 3;
    report.wal_deleted_rowids = {41, 42};
    report.artifacts = {"messages.jsonl", "run_report.json"};

    message::UnresolvedRelation rel;
    rel.origin_rowid = 7;
    rel.origin_msg_id = "msg_7";
    rel.association_key = "p:0/GONE";
    rel.kind = message::RelationKind::ReactionRemoval;
    report.unresolved.push_back(rel);

    rapidjson::Document doc = report.to_document();
    EXPECT_STREQ(doc["source"]["kind"].GetString(), "backup");
    EXPECT_TRUE(doc["source"]["conversation"].IsNull());
    EXPECT_STREQ(doc["schema"]["generation"].GetString(), "binary_text_edits");
    EXPECT_EQ(doc["schema"]["version"].GetInt(), 3);

    const auto& counters = doc["counters"];
    EXPECT_EQ(counters["rows_read"].GetUint64(), 12u);
    EXPECT_EQ(counters["messages_emitted"].GetUint64(), 9u);
    // Нулевые счётчики присутствуют в файле
    ASSERT_TRUE(counters.HasMember("attachments_missing"));
    EXPECT_EQ(counters["attachments_missing"].GetUint64(), 0u);

    ASSERT_EQ(doc["unresolved_relations"].Size(), 1u);
    EXPECT_STREQ(doc["unresolved_relations"][0]["kind"].GetString(), "reaction_removal");
    EXPECT_EQ(doc["wal_deleted_rowids"][1].GetInt64(), 42);
    EXPECT_EQ(doc["artifacts"].Size(), 2u);
}

TEST(ReportTest, ToDocument_ConversationFilter) {
    RunReport report;
    report.conversation_filter = "chat-a";
    rapidjson::Document doc = report.to_document();
    EXPECT_STREQ(doc["source"]["conversation"].GetString(), "chat-a");
}

TEST(ReportTest, PrintSummary_DoesNotThrow) {
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);
    RunReport report;
    report.counters.rows_read = 1;
    EXPECT_NO_THROW(report.print_summary(writer));
}

}  // namespace chatx::report::test
