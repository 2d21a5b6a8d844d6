// ==============================================================================
// test_decode_gtest.cpp - Тесты Row Decoder
// ==============================================================================

#include "chatx/decode.hpp"

#include "chatx/codec.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace chatx::decode::test {

using chatx::test::Bytes;
using chatx::test::ChatDbBuilder;
using chatx::test::LEGACY_SCHEMA;
using chatx::test::MessageSpec;
using chatx::test::TempDirTest;
using chatx::test::text_message;
using chatx::test::typedstream_blob;

namespace {

/// message_summary_info в XML: история правок частей
Bytes edit_history(const std::vector<std::vector<std::string>>& parts,
                   const std::vector<int>& retracted = {}) {
    std::string xml = "<plist><dict><key>ec</key><dict>";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        xml += "<key>" + std::to_string(i) + "</key><array>";
        for (const auto& version : parts[i]) {
            xml += "<dict><key>t</key><data>" + codec::base64_encode(typedstream_blob(version)) +
                   "</data></dict>";
        }
        xml += "</array>";
    }
    xml += "</dict>";
    if (!retracted.empty()) {
        xml += "<key>rp</key><array>";
        for (int idx : retracted) {
            xml += "<integer>" + std::to_string(idx) + "</integer>";
        }
        xml += "</array>";
    }
    xml += "</dict></plist>";
    return Bytes(xml.begin(), xml.end());
}

std::vector<DecodedRow> decode_all(sqlite::Database& db,
                                   const std::optional<std::string>& conversation = std::nullopt) {
    schema::SchemaInfo info = schema::inspect(db);
    RowReader reader(db, info, conversation);
    RowDecoder decoder(info, "~/chat.db");
    std::vector<DecodedRow> rows;
    RawRow raw;
    while (reader.next(raw)) {
        rows.push_back(decoder.decode(raw));
    }
    return rows;
}

}  // namespace

// ==============================================================================
// Время
// ==============================================================================

TEST(DecodeTest, NormalizeTimestamp_SecondsAndNanoseconds) {
    EXPECT_EQ(normalize_timestamp(700000000).unix_seconds, APPLE_EPOCH_UNIX + 700000000);
    EXPECT_EQ(normalize_timestamp(700000000LL * 1000000000LL).unix_seconds,
              APPLE_EPOCH_UNIX + 700000000);

    // Порог: 99 999 999 999 ещё секунды, 1e11 уже наносекунды
    EXPECT_EQ(normalize_timestamp(NANOSECOND_THRESHOLD - 1).unix_seconds,
              APPLE_EPOCH_UNIX + NANOSECOND_THRESHOLD - 1);
    EXPECT_EQ(normalize_timestamp(NANOSECOND_THRESHOLD).unix_seconds, APPLE_EPOCH_UNIX + 100);
}

TEST(DecodeTest, NormalizeTimestamp_RoundsHalfAwayFromZero) {
    EXPECT_EQ(normalize_timestamp(600000000500000000LL).unix_seconds,
              APPLE_EPOCH_UNIX + 600000001);
    EXPECT_EQ(normalize_timestamp(600000000499999999LL).unix_seconds,
              APPLE_EPOCH_UNIX + 600000000);
    EXPECT_EQ(normalize_timestamp(-600000000500000000LL).unix_seconds,
              APPLE_EPOCH_UNIX - 600000001);
}

TEST(DecodeTest, NormalizeTimestamp_ZeroAndNullAreMissing) {
    NormalizedTime zero = normalize_timestamp(0);
    EXPECT_TRUE(zero.missing);
    EXPECT_EQ(zero.unix_seconds, APPLE_EPOCH_UNIX);
    EXPECT_TRUE(normalize_timestamp(std::nullopt).missing);
}

// ==============================================================================
// Декодеры текста
// ==============================================================================

TEST(DecodeTest, EditHistory_TakesLastVersionOfEachPart) {
    EditHistoryDecoder decoder;
    auto text = decoder.decode(edit_history({{"draft", "final"}, {"second part"}}));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "final\nsecond part");
}

TEST(DecodeTest, EditHistory_SkipsRetractedParts) {
    EditHistoryDecoder decoder;
    auto text = decoder.decode(edit_history({{"gone"}, {"kept"}}, {0}));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "kept");

    EXPECT_FALSE(decoder.decode(edit_history({{"gone"}}, {0})).has_value());
}

TEST(DecodeTest, KeyedArchive_IgnoresNonBinaryPayload) {
    KeyedArchiveDecoder decoder;
    EXPECT_FALSE(decoder.decode(typedstream_blob("x")).has_value());
}

TEST(DecodeTest, TextChain_LegacyIgnoresBody) {
    TextChain chain(schema::Generation::LegacyText);
    RawRow row;
    row.attributed_body = typedstream_blob("hidden");
    DecodedText out = chain.decode(row);
    EXPECT_EQ(out.source, TextSource::Undecoded);
    EXPECT_TRUE(out.text.empty());
}

TEST(DecodeTest, TextChain_PrefersTextColumn) {
    TextChain chain(schema::Generation::BinaryTextEdits);
    RawRow row;
    row.text = "\xEF\xBF\xBC plain ";
    row.attributed_body = typedstream_blob("body");
    DecodedText out = chain.decode(row);
    EXPECT_EQ(out.source, TextSource::Text);
    EXPECT_EQ(out.text, "plain");
}

// ==============================================================================
// Строки из базы
// ==============================================================================

class DecodeDbTest : public TempDirTest {};

TEST_F(DecodeDbTest, Decode_BodyOnlyMessage) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    std::int64_t chat = db.add_chat("iMessage;-;+15550001");
    std::int64_t handle = db.add_handle("+15550001");

    MessageSpec m;
    m.guid = "G-BODY";
    m.body = typedstream_blob("Только в attributedBody");
    m.handle_id = handle;
    m.chat_id = chat;
    db.add_message(m);

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    const auto& msg = rows[0].message;
    EXPECT_EQ(msg.text, "Только в attributedBody");
    EXPECT_EQ(msg.conv_id, "iMessage;-;+15550001");
    EXPECT_EQ(msg.sender_id, "+15550001");
    EXPECT_FALSE(msg.is_me);
    EXPECT_EQ(msg.source_ref.guid, "G-BODY");
    EXPECT_EQ(msg.source_ref.path, "~/chat.db");
    EXPECT_EQ(msg.source_meta.get("text_source")->as_string(), "attributed_body");
    EXPECT_EQ(msg.source_meta.get("text_decoder")->as_string(), "typedstream");
}

TEST_F(DecodeDbTest, Decode_EditHistoryFallback) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    MessageSpec m;
    m.guid = "G-EDIT";
    m.from_me = true;
    m.summary = edit_history({{"v1", "v2"}});
    db.add_message(m);

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].message.text, "v2");
    EXPECT_EQ(rows[0].message.sender, "Me");
    EXPECT_EQ(rows[0].message.conv_id, UNASSIGNED_CONVERSATION);
}

TEST_F(DecodeDbTest, Decode_UndecodablePayloadIsPreserved) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    MessageSpec m;
    m.guid = "G-RAW";
    m.from_me = true;
    m.body = Bytes{0xDE, 0xAD, 0xBE, 0xEF};
    db.add_message(m);

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    const Value& meta = rows[0].message.source_meta;
    EXPECT_TRUE(rows[0].message.text.empty());
    EXPECT_TRUE(meta.get("text_undecoded")->as_bool());
    EXPECT_EQ(meta.get("raw")->get("attributed_body")->to_json_string(), "\"3q2+7w==\"");
}

TEST_F(DecodeDbTest, Decode_UnknownHandleAndMissingDate) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    MessageSpec m = text_message("G-1", "hi", 0, 42);
    m.date = 0;
    db.add_message(m);

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    const auto& msg = rows[0].message;
    EXPECT_EQ(msg.sender, "unknown_42");
    EXPECT_EQ(msg.sender_id, "unknown_42");
    EXPECT_TRUE(msg.source_meta.get("sender_unresolved")->as_bool());
    EXPECT_TRUE(msg.source_meta.get("timestamp_missing")->as_bool());
    EXPECT_EQ(msg.timestamp, APPLE_EPOCH_UNIX);
}

TEST_F(DecodeDbTest, Decode_ExtraColumnsGoToPlatformMeta) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    std::int64_t alice = db.add_handle("+15550001");
    MessageSpec reply = text_message("G-1", "hi", 0, alice);
    reply.assoc_guid = "p:0/G-0";
    reply.assoc_type = 1000;
    reply.thread = "G-0";
    db.add_message(reply);
    db.db().exec("UPDATE message SET balloon_bundle_id = 'com.apple.Handwriting'");

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    const Value& meta = rows[0].message.source_meta;
    const Value* platform = meta.get("platform");
    ASSERT_NE(platform, nullptr);
    EXPECT_EQ(platform->get("balloon_bundle_id")->as_string(), "com.apple.Handwriting");
    EXPECT_FALSE(platform->has("text"));
    EXPECT_FALSE(platform->has("handle_id"));

    // Моделируемые колонки сохраняются в source_meta в исходном виде
    std::int64_t handle_id = 0;
    ASSERT_TRUE(meta.get("handle_id")->to_int64(handle_id));
    EXPECT_EQ(handle_id, alice);
    const Value* association = meta.get("association");
    ASSERT_NE(association, nullptr);
    EXPECT_EQ(association->get("guid")->as_string(), "p:0/G-0");
    std::int64_t type = 0;
    ASSERT_TRUE(association->get("type")->to_int64(type));
    EXPECT_EQ(type, 1000);
    EXPECT_TRUE(association->get("emoji")->is_null());
    EXPECT_EQ(meta.get("thread_originator_guid")->as_string(), "G-0");
}

TEST_F(DecodeDbTest, Reader_FiltersConversationInRowidOrder) {
    ChatDbBuilder db(temp_dir_ / "chat.db");
    std::int64_t a = db.add_chat("chat-a");
    std::int64_t b = db.add_chat("chat-b");
    MessageSpec late = text_message("G-3", "third", a);
    late.rowid = 30;
    db.add_message(late);
    MessageSpec early = text_message("G-1", "first", a);
    early.rowid = 10;
    db.add_message(early);
    MessageSpec other = text_message("G-2", "other", b);
    other.rowid = 20;
    db.add_message(other);

    auto rows = decode_all(db.db(), std::string("chat-a"));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].message.msg_id, "msg_10");
    EXPECT_EQ(rows[1].message.msg_id, "msg_30");

    EXPECT_EQ(decode_all(db.db()).size(), 3u);
}

TEST_F(DecodeDbTest, Reader_LegacySchemaWithoutChat) {
    ChatDbBuilder db(temp_dir_ / "chat.db", LEGACY_SCHEMA);
    std::int64_t handle = db.add_handle("friend@example.com");
    auto stmt = db.db().prepare(
        "INSERT INTO message (guid, text, date, is_from_me, handle_id) VALUES (?1, ?2, ?3, 0, ?4)");
    stmt.bind_text(1, "L-1");
    stmt.bind_text(2, "legacy text");
    stmt.bind_int(3, 300000000);
    stmt.bind_int(4, handle);
    stmt.step();

    auto rows = decode_all(db.db());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].message.text, "legacy text");
    EXPECT_EQ(rows[0].message.sender_id, "friend@example.com");
    EXPECT_EQ(rows[0].message.conv_id, UNASSIGNED_CONVERSATION);
    EXPECT_EQ(rows[0].message.timestamp, APPLE_EPOCH_UNIX + 300000000);
}

}  // namespace chatx::decode::test
