// ==============================================================================
// chatx/message.hpp - Каноническая модель сообщения
// ==============================================================================
//
// Назначение:
// - CanonicalMessage: выходная единица messages.jsonl
// - Reaction: закрытый набор видов реакций
// - AttachmentRef: ссылка на вложение без байтов
// - UnresolvedRelation / MissingAttachment: записи о разрывах
// - Сериализация в RapidJSON в фиксированном порядке полей
//
// Порядок полей записи:
//   msg_id, conv_id, platform, timestamp, sender, sender_id, is_me, text,
//   reply_to_msg_id, reactions, attachments, source_ref, source_meta
//
// ==============================================================================

#ifndef CHATX_MESSAGE_HPP
#define CHATX_MESSAGE_HPP

#include <chatx/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace chatx::message {

constexpr const char* PLATFORM_IMESSAGE = "imessage";

/// Отображаемое имя и идентификатор собственных сообщений
constexpr const char* SELF_SENDER = "Me";
constexpr const char* SELF_SENDER_ID = "me";

// ----------------------------------------------------------------------------
// Реакции
// ----------------------------------------------------------------------------

enum class ReactionKind { Love, Like, Dislike, Amused, Emphasize, Question, Custom };

const char* reaction_kind_name(ReactionKind kind);
std::optional<ReactionKind> parse_reaction_kind(std::string_view name);

struct Reaction {
    std::string from;
    ReactionKind kind = ReactionKind::Like;
    std::int64_t ts = 0;  // Unix секунды
    std::optional<std::string> emoji;
};

// ----------------------------------------------------------------------------
// Вложения
// ----------------------------------------------------------------------------

enum class AttachmentType { Image, Video, Audio, File, Unknown };

const char* attachment_type_name(AttachmentType type);

/// Классификация по MIME, затем по UTI, затем по расширению
AttachmentType classify_attachment(const std::optional<std::string>& mime_type,
                                   const std::optional<std::string>& uti,
                                   std::string_view filename);

struct AttachmentRef {
    AttachmentType type = AttachmentType::Unknown;
    std::string filename;                      // путь как хранится в базе
    std::optional<std::string> abs_path;       // разрешённый источник байтов
    std::optional<std::string> sha256;         // хэш скопированных байтов
    std::optional<std::string> mime_type;
    std::optional<std::string> uti;
    std::optional<std::string> transfer_name;
    std::optional<std::int64_t> total_bytes;
    std::int64_t rowid = 0;                    // ROWID в таблице attachment

    /// Локальный файл с открытыми байтами (в JSON не пишется)
    std::optional<std::string> local_path;
};

// ----------------------------------------------------------------------------
// Сообщение
// ----------------------------------------------------------------------------

struct SourceRef {
    std::string guid;
    std::string path;  // редактированный путь источника
};

struct CanonicalMessage {
    std::string msg_id;
    std::string conv_id;
    std::string platform = PLATFORM_IMESSAGE;
    std::int64_t timestamp = 0;  // Unix секунды, UTC
    std::string sender;
    std::string sender_id;
    bool is_me = false;
    std::string text;
    std::optional<std::string> reply_to_msg_id;
    std::vector<Reaction> reactions;
    std::vector<AttachmentRef> attachments;
    SourceRef source_ref;
    Value source_meta = Value::make_object();
};

/// Идентификатор сообщения по ROWID: "msg_<rowid>"
std::string make_msg_id(std::int64_t rowid);

/// Unix секунды → "YYYY-MM-DDTHH:MM:SSZ"; пустая строка вне диапазона gmtime
std::string format_timestamp(std::int64_t unix_seconds);

void to_rapidjson(const CanonicalMessage& msg, rapidjson::Value& out,
                  rapidjson::Document::AllocatorType& alloc);

rapidjson::Document to_document(const CanonicalMessage& msg);

// ----------------------------------------------------------------------------
// Разрывы
// ----------------------------------------------------------------------------

enum class RelationKind { Reply, Reaction, ReactionRemoval };

const char* relation_kind_name(RelationKind kind);

/// Ссылка на сообщение, которого нет в прогоне
struct UnresolvedRelation {
    std::int64_t origin_rowid = 0;
    std::string origin_msg_id;
    std::string association_key;
    RelationKind kind = RelationKind::Reply;
};

/// Вложение без доступного источника байтов
struct MissingAttachment {
    std::string conv_id;
    std::string msg_id;
    std::string filename;
    std::int64_t attachment_rowid = 0;
    std::string reason;
};

}  // namespace chatx::message

#endif  // CHATX_MESSAGE_HPP
