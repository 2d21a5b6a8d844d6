// ==============================================================================
// test_attachments_gtest.cpp - Тесты Attachment Resolver
// ==============================================================================

#include "chatx/attachments.hpp"

#include "backup_fixture.hpp"
#include "chatx/backup.hpp"
#include "chatx/crypto.hpp"
#include "chatx/output.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace chatx::attachments::test {

namespace fs = std::filesystem;

using chatx::test::BackupBuilder;
using chatx::test::ChatDbBuilder;
using chatx::test::LEGACY_SCHEMA;
using chatx::test::read_file;
using chatx::test::TempDirTest;
using chatx::test::text_message;
using chatx::test::write_file;

namespace {

message::CanonicalMessage message_with_rowid(std::int64_t rowid, const std::string& conv) {
    message::CanonicalMessage msg;
    msg.msg_id = message::make_msg_id(rowid);
    msg.conv_id = conv;
    msg.source_meta.set("rowid", Value(static_cast<std::int64_t>(rowid)));
    return msg;
}

message::AttachmentRef ref_for(const std::string& filename, std::int64_t rowid) {
    message::AttachmentRef ref;
    ref.filename = filename;
    ref.rowid = rowid;
    return ref;
}

}  // namespace

// ==============================================================================
// Пути
// ==============================================================================

TEST(AttachmentsTest, BackupRelativePath_KnownPrefixes) {
    EXPECT_EQ(backup_relative_path("~/Library/SMS/Attachments/ab/12/IMG_1.jpeg").value_or(""),
              "Library/SMS/Attachments/ab/12/IMG_1.jpeg");
    EXPECT_EQ(backup_relative_path("/var/mobile/Library/SMS/Attachments/x.caf").value_or(""),
              "Library/SMS/Attachments/x.caf");
    EXPECT_EQ(
        backup_relative_path("/private/var/mobile/Library/SMS/Attachments/y.mov").value_or(""),
        "Library/SMS/Attachments/y.mov");
    EXPECT_EQ(backup_relative_path("Library/SMS/z.png").value_or(""), "Library/SMS/z.png");
    EXPECT_FALSE(backup_relative_path("/tmp/other.png").has_value());
    EXPECT_FALSE(backup_relative_path("~/Documents/a.txt").has_value());
}

// ==============================================================================
// Метаданные
// ==============================================================================

class AttachmentsDbTest : public TempDirTest {};

TEST_F(AttachmentsDbTest, LoadMetadata_GroupsByMessage) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    std::int64_t m1 = db.add_message(text_message("G-1", "photo", 0));
    std::int64_t m2 = db.add_message(text_message("G-2", "voice", 0));
    db.add_attachment(m1, "~/Library/SMS/Attachments/a/IMG_1.HEIC", "image/heic");
    db.add_attachment(m1, "~/Library/SMS/Attachments/b/doc.pdf", "application/pdf", "doc.pdf");
    db.add_attachment(m2, "~/Library/SMS/Attachments/c/Audio.caf", "audio/x-caf");

    AttachmentMap map = load_metadata(db.db(), schema::inspect(db.db()));
    ASSERT_EQ(map.size(), 2u);
    ASSERT_EQ(map[m1].size(), 2u);
    EXPECT_EQ(map[m1][0].type, message::AttachmentType::Image);
    EXPECT_EQ(map[m1][1].type, message::AttachmentType::File);
    EXPECT_EQ(map[m1][1].transfer_name.value_or(""), "doc.pdf");
    EXPECT_EQ(map[m2][0].type, message::AttachmentType::Audio);
}

TEST_F(AttachmentsDbTest, LoadMetadata_NoTablesIsEmpty) {
    ChatDbBuilder db(temp_dir_ / "chat.db", LEGACY_SCHEMA);
    EXPECT_TRUE(load_metadata(db.db(), schema::inspect(db.db())).empty());
}

// ==============================================================================
// Материализация
// ==============================================================================

class MaterializeTest : public TempDirTest {};

TEST_F(MaterializeTest, Materialize_ContentAddressedAndIdempotent) {
    fs::path src = temp_dir_ / "src" / "IMG_0001.jpeg";
    write_file(src, "jpeg bytes");
    fs::path out = temp_dir_ / "out";

    std::string error;
    auto first = materialize(src, out, "IMG_0001.jpeg", error);
    ASSERT_TRUE(first.has_value()) << error;
    EXPECT_FALSE(first->reused);
    EXPECT_EQ(first->sha256, crypto::sha256_file(src).value_or(""));
    EXPECT_EQ(first->path, out / "attachments" / first->sha256.substr(0, 2) / first->sha256 /
                               "IMG_0001.jpeg");
    EXPECT_EQ(read_file(first->path), "jpeg bytes");

    auto second = materialize(src, out, "IMG_0001.jpeg", error);
    ASSERT_TRUE(second.has_value()) << error;
    EXPECT_TRUE(second->reused);
    EXPECT_EQ(second->path, first->path);

    // Частичных файлов не остаётся
    for (const auto& entry : fs::directory_iterator(out / "attachments")) {
        EXPECT_NE(entry.path().filename().string().rfind(".partial-", 0), 0u);
    }
}

TEST_F(MaterializeTest, Materialize_MissingSourceIsError) {
    std::string error;
    EXPECT_FALSE(materialize(temp_dir_ / "absent.bin", temp_dir_ / "out", "x", error).has_value());
    EXPECT_FALSE(error.empty());
}

// ==============================================================================
// BackupSource
// ==============================================================================

class BackupSourceTest : public TempDirTest {
protected:
    static constexpr const char* STORED = "~/Library/SMS/Attachments/ab/12/IMG_0001.jpeg";
    static constexpr const char* RELATIVE = "Library/SMS/Attachments/ab/12/IMG_0001.jpeg";

    std::unique_ptr<backup::Manifest> open_backup(const fs::path& root,
                                                  std::optional<std::string> password) {
        backup::OpenOptions options;
        options.password = std::move(password);
        options.work_dir = temp_dir_ / "work";
        options.decrypt_timeout = std::chrono::seconds(30);
        fs::create_directories(options.work_dir);
        backup::BackupError error;
        auto manifest = backup::Manifest::open(root, options, error);
        EXPECT_NE(manifest, nullptr) << error.format();
        return manifest;
    }
};

TEST_F(BackupSourceTest, Resolve_PlainBackupMaterializesIdentically) {
    BackupBuilder builder(temp_dir_ / "udid");
    builder.add_file(backup::MEDIA_DOMAIN, RELATIVE, "jpeg from backup");
    builder.finish();
    auto manifest = open_backup(builder.root(), std::nullopt);
    ASSERT_NE(manifest, nullptr);

    BackupSource source(*manifest, temp_dir_ / "scratch");
    fs::path out = temp_dir_ / "out";
    std::vector<Materialized> copies;
    for (int pass = 0; pass < 2; ++pass) {
        Resolution res;
        ASSERT_TRUE(source.resolve(ref_for(STORED, 1), res)) << res.reason;
        std::string error;
        auto copy = materialize(res.readable, out, "IMG_0001.jpeg", error);
        ASSERT_TRUE(copy.has_value()) << error;
        copies.push_back(*copy);
    }

    EXPECT_FALSE(copies[0].reused);
    EXPECT_TRUE(copies[1].reused);
    EXPECT_EQ(copies[0].path, copies[1].path);
    EXPECT_EQ(copies[0].sha256, copies[1].sha256);
    const std::string content = "jpeg from backup";
    EXPECT_EQ(copies[0].sha256, crypto::sha256_hex(content.data(), content.size()));
    EXPECT_EQ(read_file(copies[1].path), "jpeg from backup");
}

TEST_F(BackupSourceTest, Resolve_EncryptedBackupDecryptsIntoScratch) {
    BackupBuilder builder(temp_dir_ / "udid", std::string("hunter2"));
    builder.add_file(backup::MEDIA_DOMAIN, RELATIVE, "secret jpeg");
    builder.finish();
    auto manifest = open_backup(builder.root(), std::string("hunter2"));
    ASSERT_NE(manifest, nullptr);

    fs::path scratch = temp_dir_ / "scratch";
    BackupSource source(*manifest, scratch);

    Resolution first;
    ASSERT_TRUE(source.resolve(ref_for(STORED, 1), first)) << first.reason;
    EXPECT_EQ(first.readable.parent_path().parent_path(), scratch);
    EXPECT_EQ(first.readable.filename().string(), "IMG_0001.jpeg");
    EXPECT_EQ(read_file(first.readable), "secret jpeg");
    // abs_path указывает на зашифрованный файл внутри бэкапа
    EXPECT_NE(first.abs_path.find(builder.root().string()), std::string::npos);

    // Повторный запрос берёт уже расшифрованный файл
    Resolution second;
    ASSERT_TRUE(source.resolve(ref_for(STORED, 1), second));
    EXPECT_EQ(second.readable, first.readable);

    std::string error;
    auto copy = materialize(second.readable, temp_dir_ / "out", "IMG_0001.jpeg", error);
    ASSERT_TRUE(copy.has_value()) << error;
    const std::string content = "secret jpeg";
    EXPECT_EQ(copy->sha256, crypto::sha256_hex(content.data(), content.size()));
}

TEST_F(BackupSourceTest, Resolve_ReportsReasons) {
    BackupBuilder builder(temp_dir_ / "udid");
    builder.add_dangling(backup::MEDIA_DOMAIN, RELATIVE);
    builder.finish();
    auto manifest = open_backup(builder.root(), std::nullopt);
    ASSERT_NE(manifest, nullptr);
    BackupSource source(*manifest, temp_dir_ / "scratch");

    Resolution res;
    EXPECT_FALSE(source.resolve(ref_for(STORED, 1), res));
    EXPECT_EQ(res.reason, "missing_in_backup");
    EXPECT_FALSE(source.resolve(ref_for("~/Library/SMS/Attachments/cd/other.png", 2), res));
    EXPECT_EQ(res.reason, "not_in_manifest");
    EXPECT_FALSE(source.resolve(ref_for("/Users/me/Desktop/x.png", 3), res));
    EXPECT_EQ(res.reason, "not_a_backup_path");
    EXPECT_FALSE(source.resolve(ref_for("", 4), res));
    EXPECT_EQ(res.reason, "no_filename");
}

// ==============================================================================
// Resolver
// ==============================================================================

class ResolverTest : public TempDirTest {
protected:
    output::Writer writer_{output::OutputConfig{}};
};

TEST_F(ResolverTest, Run_LiveSourceResolvesAndRecordsMissing) {
    fs::path home = temp_dir_ / "home";
    write_file(home / "Library/SMS/Attachments/a/present.jpg", "image");

    std::vector<message::CanonicalMessage> messages;
    messages.push_back(message_with_rowid(1, "chat-a"));
    messages.push_back(message_with_rowid(2, "chat-b"));
    messages.push_back(message_with_rowid(3, "chat-a"));

    AttachmentMap metadata;
    metadata[1].push_back(ref_for("~/Library/SMS/Attachments/a/present.jpg", 10));
    metadata[2].push_back(ref_for("~/Library/SMS/Attachments/b/gone.mov", 11));
    metadata[2].push_back(ref_for("", 12));

    LiveSource source(home);
    ResolverOptions options;
    options.workers = 2;
    options.out_dir = temp_dir_ / "out";
    Resolver resolver(source, options, writer_);
    resolver.run(messages, std::move(metadata));

    EXPECT_EQ(resolver.stats().total, 3u);
    EXPECT_EQ(resolver.stats().resolved, 1u);
    EXPECT_EQ(resolver.stats().missing, 2u);
    EXPECT_EQ(resolver.stats().copied, 0u);

    ASSERT_EQ(messages[0].attachments.size(), 1u);
    EXPECT_EQ(messages[0].attachments[0].abs_path.value_or(""),
              (home / "Library/SMS/Attachments/a/present.jpg").string());
    EXPECT_FALSE(messages[0].source_meta.has("attachment_unresolved"));

    ASSERT_EQ(messages[1].attachments.size(), 2u);
    EXPECT_FALSE(messages[1].attachments[0].abs_path.has_value());
    EXPECT_TRUE(messages[1].source_meta.get("attachment_unresolved")->as_bool());
    EXPECT_TRUE(messages[2].attachments.empty());

    const auto& missing = resolver.missing();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0].reason, "missing_on_disk");
    EXPECT_EQ(missing[1].reason, "no_filename");
    EXPECT_EQ(missing[1].filename, "attachment_12");
}

TEST_F(ResolverTest, Run_CopyBinariesSetsSha) {
    fs::path home = temp_dir_ / "home";
    write_file(home / "Library/SMS/Attachments/a/voice.caf", "caf audio");

    std::vector<message::CanonicalMessage> messages;
    messages.push_back(message_with_rowid(1, "chat"));
    AttachmentMap metadata;
    metadata[1].push_back(ref_for("~/Library/SMS/Attachments/a/voice.caf", 1));

    LiveSource source(home);
    ResolverOptions options;
    options.copy_binaries = true;
    options.out_dir = temp_dir_ / "out";
    Resolver resolver(source, options, writer_);
    resolver.run(messages, std::move(metadata));

    const auto& ref = messages[0].attachments[0];
    ASSERT_TRUE(ref.sha256.has_value());
    EXPECT_EQ(resolver.stats().copied, 1u);
    fs::path copied = ref.abs_path.value_or("");
    EXPECT_EQ(copied.parent_path().filename().string(), *ref.sha256);
    EXPECT_EQ(read_file(copied), "caf audio");
}

TEST(AttachmentsTest, MissingReport_GroupsByConversation) {
    std::vector<message::MissingAttachment> missing = {
        {"chat-b", "msg_2", "b.jpg", 2, "missing_on_disk"},
        {"chat-a", "msg_3", "a.jpg", 3, "missing_on_disk"},
        {"chat-b", "msg_4", "c.jpg", 4, "not_in_manifest"},
    };

    rapidjson::Document doc = missing_report(missing);
    EXPECT_EQ(doc["total_missing"].GetUint64(), 3u);
    const auto& conversations = doc["conversations"];
    ASSERT_EQ(conversations.Size(), 2u);
    EXPECT_STREQ(conversations[0]["conv_id"].GetString(), "chat-b");
    EXPECT_EQ(conversations[0]["count"].GetUint64(), 2u);
    EXPECT_STREQ(conversations[1]["conv_id"].GetString(), "chat-a");
    EXPECT_GT(doc["remediation"].Size(), 0u);
}

}  // namespace chatx::attachments::test
