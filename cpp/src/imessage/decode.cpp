// ==============================================================================
// decode.cpp - Row Decoder: чтение и декодирование строк message
// ==============================================================================

#include "chatx/decode.hpp"

#include "chatx/codec.hpp"
#include "chatx/plist.hpp"
#include "chatx/typedstream.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>

namespace chatx::decode {

namespace {

// Служебные псевдонимы колонок запроса
constexpr const char* COL_ROWID = "chatx_rowid";
constexpr const char* COL_HANDLE_ADDRESS = "chatx_handle_address";
constexpr const char* COL_CHAT_GUID = "chatx_chat_guid";

/// Колонки message, которые модель описывает явно
const std::set<std::string>& modelled_columns() {
    static const std::set<std::string> columns = {
        "ROWID",
        "guid",
        "text",
        "attributedBody",
        "message_summary_info",
        "date",
        "is_from_me",
        "service",
        "handle_id",
        "associated_message_guid",
        "associated_message_type",
        "associated_message_emoji",
        "thread_originator_guid",
        COL_ROWID,
        COL_HANDLE_ADDRESS,
        COL_CHAT_GUID,
    };
    return columns;
}

std::optional<std::string> opt_text(const sqlite::Statement& stmt, int i) {
    if (stmt.column_is_null(i)) {
        return std::nullopt;
    }
    return stmt.column_text(i);
}

std::optional<std::int64_t> opt_int(const sqlite::Statement& stmt, int i) {
    if (stmt.column_is_null(i)) {
        return std::nullopt;
    }
    return stmt.column_int(i);
}

std::optional<Bytes> opt_blob(const sqlite::Statement& stmt, int i) {
    if (stmt.column_is_null(i)) {
        return std::nullopt;
    }
    Bytes blob = stmt.column_blob(i);
    if (blob.empty()) {
        return std::nullopt;
    }
    return blob;
}

Value opt_string_value(const std::optional<std::string>& s) {
    return s ? Value(*s) : Value();
}

}  // namespace

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

NormalizedTime normalize_timestamp(std::optional<std::int64_t> raw) {
    NormalizedTime out;
    if (!raw || *raw == 0) {
        out.missing = true;
        return out;
    }

    std::int64_t value = *raw;
    std::int64_t seconds = value;
    if (value >= NANOSECOND_THRESHOLD || value <= -NANOSECOND_THRESHOLD) {
        constexpr std::int64_t NS = 1000000000LL;
        seconds = value / NS;
        std::int64_t rem = value % NS;
        if (rem >= NS / 2) {
            ++seconds;
        } else if (rem <= -NS / 2) {
            --seconds;
        }
    }
    out.unix_seconds = APPLE_EPOCH_UNIX + seconds;
    return out;
}

// ----------------------------------------------------------------------------
// RowReader
// ----------------------------------------------------------------------------

std::string build_row_query(const schema::SchemaInfo& info, bool filter_conversation) {
    std::string handle_expr = "NULL";
    std::string join;
    if (info.handle_joinable) {
        handle_expr = "h.id";
        join = " LEFT JOIN handle h ON h.ROWID = m.handle_id";
    }

    std::string chat_expr = "NULL";
    if (info.chat_joinable) {
        // Сообщение может входить в несколько чатов: берётся первый по ROWID
        chat_expr =
            "(SELECT c.guid FROM chat_message_join cmj JOIN chat c ON c.ROWID = cmj.chat_id"
            " WHERE cmj.message_id = m.ROWID ORDER BY c.ROWID LIMIT 1)";
    }

    std::string inner = "SELECT m.*, m.ROWID AS " + std::string(COL_ROWID) + ", " + handle_expr +
                        " AS " + COL_HANDLE_ADDRESS + ", " + chat_expr + " AS " + COL_CHAT_GUID +
                        " FROM message m" + join;

    std::string sql = "SELECT * FROM (" + inner + ")";
    if (filter_conversation) {
        sql += " WHERE " + std::string(COL_CHAT_GUID) + " = ?1";
    }
    sql += " ORDER BY " + std::string(COL_ROWID);
    return sql;
}

RowReader::RowReader(sqlite::Database& db, const schema::SchemaInfo& info,
                     const std::optional<std::string>& conversation)
    : sql_(build_row_query(info, conversation.has_value())), stmt_(db.prepare(sql_)) {
    if (conversation) {
        stmt_.bind_text(1, *conversation);
    }
    for (int i = 0; i < stmt_.column_count(); ++i) {
        names_.push_back(stmt_.column_name(i));
    }
}

bool RowReader::next(RawRow& row) {
    if (!stmt_.step()) {
        return false;
    }
    ++rows_read_;

    row = RawRow{};
    const auto& modelled = modelled_columns();
    for (int i = 0; i < static_cast<int>(names_.size()); ++i) {
        const std::string& name = names_[static_cast<std::size_t>(i)];
        if (name == COL_ROWID) {
            row.rowid = stmt_.column_int(i);
        } else if (name == "guid") {
            row.guid = stmt_.column_is_null(i) ? std::string() : stmt_.column_text(i);
        } else if (name == "text") {
            row.text = opt_text(stmt_, i);
        } else if (name == "attributedBody") {
            row.attributed_body = opt_blob(stmt_, i);
        } else if (name == "message_summary_info") {
            row.message_summary_info = opt_blob(stmt_, i);
        } else if (name == "date") {
            row.date = opt_int(stmt_, i);
        } else if (name == "is_from_me") {
            row.is_from_me = !stmt_.column_is_null(i) && stmt_.column_int(i) != 0;
        } else if (name == "service") {
            row.service = opt_text(stmt_, i);
        } else if (name == "handle_id") {
            row.handle_id = opt_int(stmt_, i);
        } else if (name == COL_HANDLE_ADDRESS) {
            row.handle_address = opt_text(stmt_, i);
        } else if (name == COL_CHAT_GUID) {
            row.chat_guid = opt_text(stmt_, i);
        } else if (name == "associated_message_guid") {
            row.associated_message_guid = opt_text(stmt_, i);
        } else if (name == "associated_message_type") {
            row.associated_message_type = opt_int(stmt_, i).value_or(0);
        } else if (name == "associated_message_emoji") {
            row.associated_message_emoji = opt_text(stmt_, i);
        } else if (name == "thread_originator_guid") {
            row.thread_originator_guid = opt_text(stmt_, i);
        } else if (modelled.count(name) == 0) {
            row.platform.set(name, stmt_.column_value(i));
        }
    }
    return true;
}

// ----------------------------------------------------------------------------
// Декодеры текста
// ----------------------------------------------------------------------------

std::optional<std::string> TypedstreamDecoder::decode(const Bytes& payload) const {
    return typedstream::extract_string(payload);
}

std::optional<std::string> KeyedArchiveDecoder::decode(const Bytes& payload) const {
    if (!plist::is_binary_plist(payload.data(), payload.size())) {
        return std::nullopt;
    }
    auto root = plist::parse_binary(payload.data(), payload.size());
    if (!root) {
        return std::nullopt;
    }
    auto top = plist::unarchive_top(*root, "root");
    if (!top) {
        return std::nullopt;
    }
    if (const auto* s = top->get_string()) {
        return *s;
    }
    // Неизвестный подкласс: строка в NSString / NS.string
    for (const char* key : {"NSString", "NS.string"}) {
        const Value* v = top->get(key);
        if (v != nullptr && v->is_string()) {
            return v->as_string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> EditHistoryDecoder::decode(const Bytes& payload) const {
    auto root = plist::parse(payload);
    if (!root) {
        return std::nullopt;
    }
    const Value* edits = root->get("ec");
    if (edits == nullptr || !edits->is_object()) {
        return std::nullopt;
    }

    // Отозванные части
    std::set<std::int64_t> retracted;
    if (const Value* rp = root->get("rp"); rp != nullptr && rp->is_array()) {
        for (const auto& item : rp->as_array()) {
            std::int64_t idx = 0;
            if (item.to_int64(idx)) {
                retracted.insert(idx);
            }
        }
    }

    // Ключи "0", "1", ... упорядочиваются численно
    std::map<std::int64_t, const Value*> parts;
    for (const auto& [key, history] : edits->as_object()) {
        char* end = nullptr;
        long long idx = std::strtoll(key.c_str(), &end, 10);
        if (end == key.c_str() || *end != '\0' || !history.is_array() ||
            history.array_size() == 0) {
            continue;
        }
        parts[idx] = &history;
    }

    TypedstreamDecoder typed;
    KeyedArchiveDecoder keyed;
    std::string text;
    bool any = false;
    for (const auto& [idx, history] : parts) {
        if (retracted.count(idx) != 0) {
            continue;
        }
        const Value& last = history->as_array().back();
        const Value* t = last.get("t");
        if (t == nullptr || !t->is_bytes()) {
            continue;
        }
        auto part = typed.decode(t->as_bytes());
        if (!part) {
            part = keyed.decode(t->as_bytes());
        }
        if (!part) {
            continue;
        }
        if (any) {
            text += "\n";
        }
        text += *part;
        any = true;
    }
    if (!any) {
        return std::nullopt;
    }
    return text;
}

const char* text_source_name(TextSource source) {
    switch (source) {
    case TextSource::Text:
        return "text";
    case TextSource::Body:
        return "attributed_body";
    case TextSource::EditHistory:
        return "edit_history";
    case TextSource::None:
        return "none";
    case TextSource::Undecoded:
        return "undecoded";
    }
    return "none";
}

TextChain::TextChain(schema::Generation generation) {
    use_body_ = generation != schema::Generation::LegacyText;
    use_edits_ = generation == schema::Generation::BinaryTextEdits;
    body_decoders_.push_back(std::make_unique<TypedstreamDecoder>());
    body_decoders_.push_back(std::make_unique<KeyedArchiveDecoder>());
}

DecodedText TextChain::decode(const RawRow& row) const {
    DecodedText out;
    if (row.text && !row.text->empty()) {
        out.text = codec::strip_object_replacement(codec::sanitize_utf8(*row.text));
        out.source = TextSource::Text;
        return out;
    }

    if (use_body_ && row.attributed_body) {
        for (const auto& decoder : body_decoders_) {
            if (auto text = decoder->decode(*row.attributed_body)) {
                out.text = codec::strip_object_replacement(*text);
                out.source = TextSource::Body;
                out.decoder = decoder->name();
                return out;
            }
        }
    }

    if (use_edits_ && row.message_summary_info) {
        if (auto text = edits_.decode(*row.message_summary_info)) {
            out.text = codec::strip_object_replacement(*text);
            out.source = TextSource::EditHistory;
            out.decoder = edits_.name();
            return out;
        }
    }

    out.source = (row.attributed_body || row.message_summary_info) ? TextSource::Undecoded
                                                                  : TextSource::None;
    return out;
}

// ----------------------------------------------------------------------------
// RowDecoder
// ----------------------------------------------------------------------------

RowDecoder::RowDecoder(const schema::SchemaInfo& info, std::string source_path)
    : chain_(info.generation), source_path_(std::move(source_path)) {}

DecodedRow RowDecoder::decode(const RawRow& row) {
    DecodedRow out;
    out.rowid = row.rowid;
    out.guid = row.guid;
    out.association_type = row.associated_message_type;
    if (row.associated_message_guid && !row.associated_message_guid->empty()) {
        out.association_key = row.associated_message_guid;
    }
    out.association_emoji = row.associated_message_emoji;
    if (row.thread_originator_guid && !row.thread_originator_guid->empty()) {
        out.thread_originator_guid = row.thread_originator_guid;
    }

    message::CanonicalMessage& msg = out.message;
    Value& meta = msg.source_meta;
    msg.msg_id = message::make_msg_id(row.rowid);
    msg.conv_id = row.chat_guid && !row.chat_guid->empty() ? *row.chat_guid
                                                           : UNASSIGNED_CONVERSATION;
    msg.source_ref.guid = row.guid.empty() ? msg.msg_id : row.guid;
    msg.source_ref.path = source_path_;

    meta.set("rowid", Value(static_cast<std::int64_t>(row.rowid)));
    meta.set("service", opt_string_value(row.service));
    meta.set("date_raw", row.date ? Value(static_cast<std::int64_t>(*row.date)) : Value());
    meta.set("has_attributed_body", Value(row.attributed_body.has_value()));
    meta.set("handle_id", row.handle_id ? Value(static_cast<std::int64_t>(*row.handle_id))
                                        : Value());

    // Сырые поля связи: код типа и ключ остаются и после разрешения
    if (row.associated_message_guid || row.associated_message_type != 0 ||
        row.associated_message_emoji) {
        Value association = Value::make_object();
        association.set("guid", opt_string_value(row.associated_message_guid));
        association.set("type", Value(static_cast<std::int64_t>(row.associated_message_type)));
        association.set("emoji", opt_string_value(row.associated_message_emoji));
        meta.set("association", std::move(association));
    }
    if (row.thread_originator_guid) {
        meta.set("thread_originator_guid", Value(*row.thread_originator_guid));
    }

    // Время
    NormalizedTime ts = normalize_timestamp(row.date);
    msg.timestamp = ts.unix_seconds;
    if (ts.missing) {
        meta.set("timestamp_missing", Value(true));
        ++stats_.timestamp_missing;
    }

    // Отправитель
    msg.is_me = row.is_from_me;
    if (row.is_from_me) {
        msg.sender = message::SELF_SENDER;
        msg.sender_id = message::SELF_SENDER_ID;
    } else if (row.handle_address && !row.handle_address->empty()) {
        msg.sender = *row.handle_address;
        msg.sender_id = *row.handle_address;
    } else {
        msg.sender = "unknown_" + std::to_string(row.handle_id.value_or(0));
        msg.sender_id = msg.sender;
        meta.set("sender_unresolved", Value(true));
        ++stats_.sender_unresolved;
    }

    // Текст
    DecodedText text = chain_.decode(row);
    msg.text = std::move(text.text);
    meta.set("text_source", Value(text_source_name(text.source)));
    if (!text.decoder.empty()) {
        meta.set("text_decoder", Value(text.decoder));
    }
    switch (text.source) {
    case TextSource::Body:
        ++stats_.text_from_body;
        break;
    case TextSource::EditHistory:
        ++stats_.text_from_edit_history;
        break;
    case TextSource::Undecoded: {
        ++stats_.text_undecoded;
        meta.set("text_undecoded", Value(true));
        Value raw = Value::make_object();
        if (row.attributed_body) {
            raw.set("attributed_body", Value(*row.attributed_body));
        }
        if (row.message_summary_info) {
            raw.set("message_summary_info", Value(*row.message_summary_info));
        }
        meta.set("raw", std::move(raw));
        break;
    }
    case TextSource::Text:
    case TextSource::None:
        break;
    }

    if (row.platform.object_size() > 0) {
        meta.set("platform", row.platform);
    }

    ++stats_.messages_decoded;
    return out;
}

}  // namespace chatx::decode
