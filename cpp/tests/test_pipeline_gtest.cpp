// ==============================================================================
// test_pipeline_gtest.cpp - Сквозные тесты прогона извлечения
// ==============================================================================

#include "chatx/pipeline.hpp"

#include "backup_fixture.hpp"
#include "chatx/output.hpp"
#include "chatx/decode.hpp"
#include "chatx/problem.hpp"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <map>
#include <rapidjson/document.h>
#include <string>

namespace chatx::pipeline::test {

namespace fs = std::filesystem;

using chatx::test::BackupBuilder;
using chatx::test::build_chat_db;
using chatx::test::ChatDbBuilder;
using chatx::test::MessageSpec;
using chatx::test::read_file;
using chatx::test::read_lines;
using chatx::test::TempDirTest;
using chatx::test::text_message;
using chatx::test::typedstream_blob;
using chatx::test::write_file;

namespace {

rapidjson::Document parse_json(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str());
    return doc;
}

/// messages.jsonl по msg_id
std::map<std::string, rapidjson::Document> load_messages(const fs::path& path) {
    std::map<std::string, rapidjson::Document> out;
    for (const auto& line : read_lines(path)) {
        rapidjson::Document doc = parse_json(line);
        std::string id = doc["msg_id"].GetString();
        out.emplace(id, std::move(doc));
    }
    return out;
}

}  // namespace

class PipelineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        home_ = temp_dir_ / "home";
        db_path_ = home_ / "Library" / "Messages" / "chat.db";
        fs::create_directories(db_path_.parent_path());
        fs::create_directories(temp_dir_ / "work");

        cfg_.source.kind = config::SourceKind::Live;
        cfg_.source.db_path = "~/Library/Messages/chat.db";
        cfg_.source.home = home_;
        cfg_.output.dir = temp_dir_ / "out";
        cfg_.staging.work_dir = temp_dir_ / "work";
        cfg_.attachments.workers = 2;
    }

    /// Переписка: текст, реакция, текст только в attributedBody,
    /// отсутствующее вложение и второй чат
    void build_conversations() {
        ChatDbBuilder db(db_path_);
        std::int64_t alice = db.add_handle("+15550001");
        std::int64_t chat_a = db.add_chat("iMessage;-;+15550001");
        std::int64_t chat_b = db.add_chat("chat-b");

        db.add_message(text_message("G-1", "hello", chat_a, alice));

        MessageSpec tapback = text_message("G-2", "Loved “hello”", chat_a);
        tapback.assoc_guid = "p:0/G-1";
        tapback.assoc_type = 2000;
        tapback.date = 700000100;
        db.add_message(tapback);

        MessageSpec body_only;
        body_only.guid = "G-3";
        body_only.body = typedstream_blob("from body");
        body_only.chat_id = chat_a;
        body_only.handle_id = alice;
        db.add_message(body_only);

        std::int64_t photo = db.add_message(text_message("G-4", "see photo", chat_a));
        db.add_attachment(photo, "~/Library/SMS/Attachments/aa/01/IMG_0001.jpeg", "image/jpeg");

        db.add_message(text_message("G-5", "other chat", chat_b));
    }

    fs::path out() const { return cfg_.output.dir; }

    fs::path home_;
    fs::path db_path_;
    config::ExtractConfig cfg_;
    output::Writer writer_{output::OutputConfig{true, 0, true}};
};

// ==============================================================================
// Живая база
// ==============================================================================

TEST_F(PipelineTest, Run_LiveDatabaseEndToEnd) {
    build_conversations();

    RunResult result = run(cfg_, writer_);
    const report::Counters& counters = result.report.counters;
    EXPECT_EQ(counters.rows_read, 5u);
    EXPECT_EQ(counters.messages_emitted, 4u);
    EXPECT_EQ(counters.reactions_folded, 1u);
    EXPECT_EQ(counters.text_from_body, 1u);
    EXPECT_EQ(counters.attachments_total, 1u);
    EXPECT_EQ(counters.attachments_missing, 1u);
    EXPECT_EQ(counters.quarantined, 0u);
    EXPECT_EQ(result.report.source_path, "~/Library/Messages/chat.db");

    auto messages = load_messages(out() / MESSAGES_FILE);
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages.count("msg_2"), 0u);

    const auto& hello = messages.at("msg_1");
    EXPECT_STREQ(hello["conv_id"].GetString(), "iMessage;-;+15550001");
    EXPECT_STREQ(hello["sender"].GetString(), "+15550001");
    EXPECT_FALSE(hello["is_me"].GetBool());
    ASSERT_EQ(hello["reactions"].Size(), 1u);
    EXPECT_STREQ(hello["reactions"][0]["kind"].GetString(), "love");
    EXPECT_STREQ(hello["reactions"][0]["from"].GetString(), "me");
    EXPECT_STREQ(hello["source_ref"]["path"].GetString(), "~/Library/Messages/chat.db");

    EXPECT_STREQ(messages.at("msg_3")["text"].GetString(), "from body");

    const auto& photo = messages.at("msg_4");
    ASSERT_EQ(photo["attachments"].Size(), 1u);
    EXPECT_TRUE(photo["attachments"][0]["abs_path"].IsNull());
    EXPECT_STREQ(photo["attachments"][0]["type"].GetString(), "image");

    rapidjson::Document missing = parse_json(read_file(out() / MISSING_ATTACHMENTS_FILE));
    EXPECT_EQ(missing["total_missing"].GetUint64(), 1u);
    EXPECT_STREQ(missing["conversations"][0]["items"][0]["msg_id"].GetString(), "msg_4");
    EXPECT_STREQ(missing["conversations"][0]["items"][0]["reason"].GetString(),
                 "missing_on_disk");

    rapidjson::Document report = parse_json(read_file(out() / RUN_REPORT_FILE));
    EXPECT_STREQ(report["schema"]["generation"].GetString(), "binary_text_edits");
    EXPECT_EQ(report["counters"]["messages_emitted"].GetUint64(), 4u);

    EXPECT_TRUE(fs::is_regular_file(out() / QUARANTINE_FILE));
    EXPECT_TRUE(read_lines(out() / QUARANTINE_FILE).empty());
    EXPECT_TRUE(fs::is_regular_file(db_path_));
}

TEST_F(PipelineTest, Run_ConversationFilter) {
    build_conversations();
    cfg_.filter.conversation = "chat-b";

    RunResult result = run(cfg_, writer_);
    EXPECT_EQ(result.report.conversation_filter, "chat-b");
    auto messages = load_messages(out() / MESSAGES_FILE);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_STREQ(messages.at("msg_5")["text"].GetString(), "other chat");
}

TEST_F(PipelineTest, Run_CopiesAndTranscribesAudio) {
    {
        ChatDbBuilder db(db_path_);
        std::int64_t chat = db.add_chat("chat-a");
        std::int64_t voice = db.add_message(text_message("G-1", "voice memo", chat));
        db.add_attachment(voice, "~/Library/SMS/Attachments/cc/Audio Message.caf", "audio/x-caf");
    }
    write_file(home_ / "Library/SMS/Attachments/cc/Audio Message.caf", "caf bytes");

    cfg_.attachments.copy_binaries = true;
    cfg_.transcription.mode = config::TranscriptionMode::Fixed;
    cfg_.transcription.fixed_text = "[voice note]";

    RunResult result = run(cfg_, writer_);
    EXPECT_EQ(result.report.counters.attachments_copied, 1u);
    EXPECT_EQ(result.report.counters.transcripts_created, 1u);
    EXPECT_NE(std::find(result.report.artifacts.begin(), result.report.artifacts.end(),
                        std::string(ATTACHMENTS_DIR)),
              result.report.artifacts.end());

    auto messages = load_messages(out() / MESSAGES_FILE);
    const auto& msg = messages.at("msg_1");
    const auto& attachment = msg["attachments"][0];
    ASSERT_TRUE(attachment["sha256"].IsString());
    fs::path copied = attachment["abs_path"].GetString();
    EXPECT_EQ(copied.parent_path().filename().string(), attachment["sha256"].GetString());
    EXPECT_EQ(read_file(copied), "caf bytes");
    EXPECT_STREQ(msg["source_meta"]["transcript"][0]["text"].GetString(), "[voice note]");
}

TEST_F(PipelineTest, Run_RepeatedRunIsByteIdentical) {
    build_conversations();
    run(cfg_, writer_);
    const std::string first = read_file(out() / MESSAGES_FILE);

    cfg_.output.dir = temp_dir_ / "out-again";
    run(cfg_, writer_);
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(read_file(out() / MESSAGES_FILE), first);
}

// ==============================================================================
// Дрейф схемы
// ==============================================================================

TEST_F(PipelineTest, Run_DriftedAuxiliaryColumnsDegradeToWarnings) {
    build_conversations();
    {
        sqlite::Database db(db_path_, sqlite::OpenMode::ReadWrite);
        db.exec("DROP TABLE handle;"
                "CREATE TABLE handle (ROWID INTEGER PRIMARY KEY, uncanonicalized_id TEXT);"
                "DROP TABLE chat;"
                "CREATE TABLE chat (ROWID INTEGER PRIMARY KEY, chat_identifier TEXT);");
    }

    RunResult result = run(cfg_, writer_);
    EXPECT_EQ(result.report.counters.schema_warnings, 2u);
    EXPECT_EQ(result.report.counters.rows_read, 5u);

    auto messages = load_messages(out() / MESSAGES_FILE);
    const auto& hello = messages.at("msg_1");
    EXPECT_STREQ(hello["sender"].GetString(), "unknown_1");
    EXPECT_STREQ(hello["conv_id"].GetString(), decode::UNASSIGNED_CONVERSATION);
    EXPECT_TRUE(hello["source_meta"]["sender_unresolved"].GetBool());

    rapidjson::Document report = parse_json(read_file(out() / RUN_REPORT_FILE));
    EXPECT_EQ(report["counters"]["schema_warnings"].GetUint64(), 2u);
}

TEST_F(PipelineTest, Run_UnreadableAttachmentTableIsStructuredError) {
    build_conversations();
    {
        sqlite::Database db(db_path_, sqlite::OpenMode::ReadWrite);
        db.exec("DROP TABLE attachment;"
                "CREATE TABLE attachment (guid TEXT PRIMARY KEY, filename TEXT) WITHOUT ROWID;");
    }

    try {
        run(cfg_, writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DbOpenFailed);
        EXPECT_EQ(exit_code_for(e.code()), 3);
        EXPECT_NE(e.problem().detail.find("attachment metadata"), std::string::npos);
    }
}

// ==============================================================================
// Фатальные исходы
// ==============================================================================

TEST_F(PipelineTest, Run_AllRowsInvalidWritesReportsThenFails) {
    {
        ChatDbBuilder db(db_path_);
        std::int64_t chat = db.add_chat("chat-a");
        for (const char* guid : {"G-1", "G-2"}) {
            MessageSpec m = text_message(guid, "far future", chat);
            m.date = 4000000000;
            db.add_message(m);
        }
    }

    try {
        run(cfg_, writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoValidRows);
        EXPECT_EQ(exit_code_for(e.code()), 4);
    }

    auto quarantined = read_lines(out() / QUARANTINE_FILE);
    ASSERT_EQ(quarantined.size(), 2u);
    EXPECT_NE(quarantined[0].find("timestamp out of range"), std::string::npos);
    EXPECT_TRUE(read_lines(out() / MESSAGES_FILE).empty());

    rapidjson::Document report = parse_json(read_file(out() / RUN_REPORT_FILE));
    EXPECT_EQ(report["counters"]["quarantined"].GetUint64(), 2u);
    EXPECT_EQ(report["counters"]["messages_emitted"].GetUint64(), 0u);
}

TEST_F(PipelineTest, Run_MissingDatabase) {
    try {
        run(cfg_, writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DbNotFound);
        EXPECT_NE(e.problem().instance.find("Library/Messages/chat.db"), std::string::npos);
    }
}

TEST_F(PipelineTest, Run_CancelledBeforeDecoding) {
    build_conversations();
    std::atomic<bool> cancel{true};
    try {
        run(cfg_, writer_, &cancel);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Cancelled);
        EXPECT_EQ(exit_code_for(e.code()), 130);
    }
    EXPECT_FALSE(fs::exists(out() / MESSAGES_FILE));
}

// ==============================================================================
// Бэкап
// ==============================================================================

TEST_F(PipelineTest, Run_BackupResolvesAttachmentFromManifest) {
    fs::path root = temp_dir_ / "Backup" / "udid";
    BackupBuilder builder(root);
    builder.add_file(backup::HOME_DOMAIN, backup::SMS_DB_PATH,
                     build_chat_db(temp_dir_ / "scratch.db", [](ChatDbBuilder& db) {
                         std::int64_t chat = db.add_chat("chat-a");
                         std::int64_t a = db.add_message(text_message("G-1", "pic", chat));
                         db.add_attachment(a, "~/Library/SMS/Attachments/aa/01/IMG_1.jpeg",
                                           "image/jpeg");
                         std::int64_t b = db.add_message(text_message("G-2", "gone", chat));
                         db.add_attachment(b, "~/Library/SMS/Attachments/bb/02/IMG_2.jpeg",
                                           "image/jpeg");
                     }));
    builder.add_file(backup::MEDIA_DOMAIN, "Library/SMS/Attachments/aa/01/IMG_1.jpeg",
                     "jpeg one");
    builder.finish();

    cfg_.source.kind = config::SourceKind::Backup;
    cfg_.source.backup_root = root;
    cfg_.attachments.copy_binaries = true;

    RunResult result = run(cfg_, writer_);
    EXPECT_EQ(result.report.source_kind, "backup");
    EXPECT_EQ(result.report.counters.attachments_resolved, 1u);
    EXPECT_EQ(result.report.counters.attachments_missing, 1u);

    auto messages = load_messages(out() / MESSAGES_FILE);
    fs::path copied = messages.at("msg_1")["attachments"][0]["abs_path"].GetString();
    EXPECT_EQ(read_file(copied), "jpeg one");

    rapidjson::Document missing = parse_json(read_file(out() / MISSING_ATTACHMENTS_FILE));
    EXPECT_STREQ(missing["conversations"][0]["items"][0]["reason"].GetString(),
                 "not_in_manifest");
}

}  // namespace chatx::pipeline::test
