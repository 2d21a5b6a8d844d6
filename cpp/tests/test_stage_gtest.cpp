// ==============================================================================
// test_stage_gtest.cpp - Тесты Source Stager
// ==============================================================================

#include "chatx/stage.hpp"

#include "backup_fixture.hpp"
#include "chatx/output.hpp"
#include "chatx/problem.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

namespace chatx::stage::test {

namespace fs = std::filesystem;

using chatx::test::BackupBuilder;
using chatx::test::build_chat_db;
using chatx::test::ChatDbBuilder;
using chatx::test::TempDirTest;
using chatx::test::text_message;

class StageTest : public TempDirTest {
protected:
    StageOptions options() const {
        StageOptions opts;
        opts.work_dir = temp_dir_ / "work";
        fs::create_directories(opts.work_dir);
        opts.timeout = std::chrono::milliseconds(2000);
        opts.decrypt_timeout = std::chrono::seconds(30);
        return opts;
    }

    SourceDescriptor live(const fs::path& db) const {
        SourceDescriptor source;
        source.kind = config::SourceKind::Live;
        source.db_path = db;
        return source;
    }

    output::Writer writer_{output::OutputConfig{}};
};

// ==============================================================================
// Живой источник
// ==============================================================================

TEST_F(StageTest, Live_CopiesIntoPrivateDirectory) {
    fs::path original = temp_dir_ / "Messages" / "chat.db";
    fs::create_directories(original.parent_path());
    {
        ChatDbBuilder db(original);
        std::int64_t chat = db.add_chat("chat-a");
        db.add_message(text_message("G-1", "one", chat));
        db.add_message(text_message("G-2", "two", chat));
    }

    fs::path staged_dir;
    {
        auto staged = stage(live(original), options(), writer_);
        staged_dir = staged->dir();
        EXPECT_EQ(staged->kind(), config::SourceKind::Live);
        EXPECT_EQ(staged->source_path(), original);
        EXPECT_EQ(staged->manifest(), nullptr);
        EXPECT_TRUE(fs::is_regular_file(staged->db_path()));
        EXPECT_NE(staged->db_path(), original);

        struct stat st {};
        ASSERT_EQ(::stat(staged_dir.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0700u);

        sqlite::Database db = staged->open();
        EXPECT_EQ(message_rowids(db), (std::set<std::int64_t>{1, 2}));
        // Копия открыта только на чтение запросов
        EXPECT_THROW(db.exec("DELETE FROM message"), sqlite::SqliteError);
    }
    EXPECT_FALSE(fs::exists(staged_dir));
}

TEST_F(StageTest, Live_RetainKeepsDirectory) {
    fs::path original = temp_dir_ / "chat.db";
    { ChatDbBuilder db(original); }

    StageOptions opts = options();
    opts.retain = true;
    fs::path staged_dir;
    {
        auto staged = stage(live(original), opts, writer_);
        EXPECT_TRUE(staged->retained());
        staged_dir = staged->dir();
    }
    EXPECT_TRUE(fs::is_directory(staged_dir));
}

TEST_F(StageTest, Live_MissingDatabaseIsDbNotFound) {
    try {
        stage(live(temp_dir_ / "absent.db"), options(), writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DbNotFound);
        EXPECT_EQ(exit_code_for(e.code()), 3);
    }
}

TEST_F(StageTest, Live_DatabaseWithoutMessageTableFailsOnOpen) {
    fs::path original = temp_dir_ / "other.db";
    {
        sqlite::Database db(original, sqlite::OpenMode::ReadWriteCreate);
        db.exec("CREATE TABLE notes (id INTEGER)");
    }
    auto staged = stage(live(original), options(), writer_);
    try {
        staged->open();
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DbOpenFailed);
    }
}

// ==============================================================================
// WAL-аудит
// ==============================================================================

TEST_F(StageTest, WalAudit_FindsWalOnlyAndDeletedRows) {
    fs::path original = temp_dir_ / "chat.db";
    // Соединение остаётся открытым: при закрытии SQLite перенёс бы WAL в файл
    ChatDbBuilder db(original);
    db.db().exec("PRAGMA journal_mode=WAL");
    db.db().exec("PRAGMA wal_autocheckpoint=0");
    std::int64_t chat = db.add_chat("chat-a");
    std::int64_t first = db.add_message(text_message("G-1", "one", chat));
    std::int64_t second = db.add_message(text_message("G-2", "two", chat));
    db.db().exec("PRAGMA wal_checkpoint(TRUNCATE)");

    std::int64_t third = db.add_message(text_message("G-3", "three", chat));
    auto del = db.db().prepare("DELETE FROM message WHERE ROWID = ?1");
    del.bind_int(1, first);
    del.step();

    auto staged = stage(live(original), options(), writer_);
    ASSERT_TRUE(staged->has_wal());
    const WalAudit& audit = staged->wal_audit();
    ASSERT_TRUE(audit.performed);
    EXPECT_EQ(audit.wal_only, (std::set<std::int64_t>{third}));
    EXPECT_EQ(audit.wal_deleted, (std::vector<std::int64_t>{first}));

    sqlite::Database copy = staged->open();
    EXPECT_EQ(message_rowids(copy), (std::set<std::int64_t>{second, third}));
}

TEST_F(StageTest, WalAudit_DisabledByOption) {
    fs::path original = temp_dir_ / "chat.db";
    ChatDbBuilder db(original);
    db.db().exec("PRAGMA journal_mode=WAL");
    db.db().exec("PRAGMA wal_autocheckpoint=0");
    db.add_message(text_message("G-1", "one", 0));

    StageOptions opts = options();
    opts.wal_audit = false;
    auto staged = stage(live(original), opts, writer_);
    EXPECT_TRUE(staged->has_wal());
    EXPECT_FALSE(staged->wal_audit().performed);
}

// ==============================================================================
// Бэкап
// ==============================================================================

TEST_F(StageTest, Backup_ExtractsSmsDb) {
    fs::path root = temp_dir_ / "MobileSync" / "Backup" / "udid";
    BackupBuilder builder(root);
    builder.add_file(backup::HOME_DOMAIN, backup::SMS_DB_PATH,
                     build_chat_db(temp_dir_ / "scratch.db", [](ChatDbBuilder& db) {
                         db.add_message(text_message("G-1", "from backup", 0));
                     }));
    builder.finish();

    SourceDescriptor source;
    source.kind = config::SourceKind::Backup;
    source.backup_root = root;
    auto staged = stage(source, options(), writer_);
    ASSERT_NE(staged->manifest(), nullptr);
    EXPECT_FALSE(staged->manifest()->encrypted());
    EXPECT_EQ(staged->source_path(), root);

    sqlite::Database db = staged->open();
    EXPECT_EQ(message_rowids(db).size(), 1u);
}

TEST_F(StageTest, Backup_EncryptedWithPassword) {
    fs::path root = temp_dir_ / "udid";
    BackupBuilder builder(root, std::string("hunter2"));
    builder.add_file(backup::HOME_DOMAIN, backup::SMS_DB_PATH,
                     build_chat_db(temp_dir_ / "scratch.db", [](ChatDbBuilder& db) {
                         db.add_message(text_message("G-1", "secret", 0));
                         db.add_message(text_message("G-2", "stuff", 0));
                     }));
    builder.finish();

    SourceDescriptor source;
    source.kind = config::SourceKind::Backup;
    source.backup_root = root;
    source.password = "hunter2";
    auto staged = stage(source, options(), writer_);
    EXPECT_TRUE(staged->manifest()->encrypted());
    sqlite::Database db = staged->open();
    EXPECT_EQ(message_rowids(db).size(), 2u);

    source.password.reset();
    try {
        stage(source, options(), writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BackupEncryptedNeedsPassword);
    }
}

TEST_F(StageTest, Backup_ErrorsMapToPipelineCodes) {
    SourceDescriptor source;
    source.kind = config::SourceKind::Backup;
    source.backup_root = temp_dir_ / "absent";
    try {
        stage(source, options(), writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BackupNotFound);
    }

    // Бэкап без sms.db
    BackupBuilder builder(temp_dir_ / "udid");
    builder.add_file(backup::MEDIA_DOMAIN, "Library/SMS/Attachments/x.jpg", "x");
    builder.finish();
    source.backup_root = builder.root();
    try {
        stage(source, options(), writer_);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BackupEntryMissing);
    }
}

}  // namespace chatx::stage::test
