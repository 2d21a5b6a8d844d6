// ==============================================================================
// chatx/decode.hpp - Row Decoder: строка chat.db → черновик сообщения
// ==============================================================================
//
// Назначение:
// - RawRow: строка message вместе с адресом handle и guid чата
// - RowReader: запрос строк в порядке ROWID, только существующие таблицы
// - Нормализация времени (секунды/наносекунды от 2001-01-01 по величине)
// - Цепочка декодеров текста: text → attributedBody → message_summary_info
// - Разрешение отправителя
//
// Полезная нагрузка, которую не удалось декодировать, сохраняется в
// source_meta.raw как base64: строка не теряется.
//
// ==============================================================================

#ifndef CHATX_DECODE_HPP
#define CHATX_DECODE_HPP

#include <chatx/message.hpp>
#include <chatx/schema.hpp>
#include <chatx/sqlite.hpp>
#include <chatx/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatx::decode {

using Bytes = std::vector<std::uint8_t>;

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// 2001-01-01T00:00:00Z в Unix секундах
constexpr std::int64_t APPLE_EPOCH_UNIX = 978307200;

/// Значения по модулю не меньше порога считаются наносекундами
constexpr std::int64_t NANOSECOND_THRESHOLD = 100000000000LL;

struct NormalizedTime {
    std::int64_t unix_seconds = APPLE_EPOCH_UNIX;
    bool missing = false;  // 0 или NULL в источнике
};

/// Перевести сырое значение date в Unix секунды.
/// Наносекунды делятся на 1e9 с округлением половины от нуля.
NormalizedTime normalize_timestamp(std::optional<std::int64_t> raw);

// ----------------------------------------------------------------------------
// RawRow
// ----------------------------------------------------------------------------

struct RawRow {
    std::int64_t rowid = 0;
    std::string guid;
    std::optional<std::string> text;
    std::optional<Bytes> attributed_body;
    std::optional<Bytes> message_summary_info;
    std::optional<std::int64_t> date;
    bool is_from_me = false;
    std::optional<std::string> service;
    std::optional<std::int64_t> handle_id;
    std::optional<std::string> handle_address;
    std::optional<std::string> chat_guid;
    std::optional<std::string> associated_message_guid;
    std::int64_t associated_message_type = 0;
    std::optional<std::string> associated_message_emoji;
    std::optional<std::string> thread_originator_guid;

    /// Все прочие колонки message в типе хранения
    Value platform = Value::make_object();
};

// ----------------------------------------------------------------------------
// RowReader
// ----------------------------------------------------------------------------

class RowReader {
public:
    /// conversation: ограничить одним guid чата
    RowReader(sqlite::Database& db, const schema::SchemaInfo& info,
              const std::optional<std::string>& conversation = std::nullopt);

    RowReader(const RowReader&) = delete;
    RowReader& operator=(const RowReader&) = delete;

    /// Следующая строка; false когда строки закончились
    bool next(RawRow& row);

    std::size_t rows_read() const { return rows_read_; }

    /// Текст SQL запроса (для отладочного вывода)
    const std::string& sql() const { return sql_; }

private:
    std::string sql_;
    sqlite::Statement stmt_;
    std::vector<std::string> names_;
    std::size_t rows_read_ = 0;
};

/// Собрать SQL запроса строк для данной схемы
std::string build_row_query(const schema::SchemaInfo& info, bool filter_conversation);

// ----------------------------------------------------------------------------
// Декодеры текста
// ----------------------------------------------------------------------------

/// Декодер одного формата бинарного текста
class TextDecoder {
public:
    virtual ~TextDecoder() = default;

    virtual const char* name() const = 0;

    /// Строка из полезной нагрузки; std::nullopt если формат не подошёл
    virtual std::optional<std::string> decode(const Bytes& payload) const = 0;
};

/// NSArchiver typedstream (attributedBody в большинстве версий)
class TypedstreamDecoder : public TextDecoder {
public:
    const char* name() const override { return "typedstream"; }
    std::optional<std::string> decode(const Bytes& payload) const override;
};

/// NSKeyedArchiver bplist с NSAttributedString / NSString в root
class KeyedArchiveDecoder : public TextDecoder {
public:
    const char* name() const override { return "keyed_archive"; }
    std::optional<std::string> decode(const Bytes& payload) const override;
};

/// message_summary_info: ec → последняя правка каждой части → t
class EditHistoryDecoder : public TextDecoder {
public:
    const char* name() const override { return "edit_history"; }
    std::optional<std::string> decode(const Bytes& payload) const override;
};

/// Откуда взят текст
enum class TextSource { Text, Body, EditHistory, None, Undecoded };

const char* text_source_name(TextSource source);

struct DecodedText {
    std::string text;
    TextSource source = TextSource::None;
    std::string decoder;  // имя сработавшего TextDecoder
};

/// Цепочка декодирования; порядок задаётся поколением схемы
class TextChain {
public:
    explicit TextChain(schema::Generation generation);

    DecodedText decode(const RawRow& row) const;

private:
    bool use_body_ = false;
    bool use_edits_ = false;
    std::vector<std::unique_ptr<TextDecoder>> body_decoders_;
    EditHistoryDecoder edits_;
};

// ----------------------------------------------------------------------------
// Декодирование строки
// ----------------------------------------------------------------------------

/// Строка после декодирования: черновик сообщения и данные связей
struct DecodedRow {
    std::int64_t rowid = 0;
    std::string guid;
    std::optional<std::string> association_key;
    std::int64_t association_type = 0;
    std::optional<std::string> association_emoji;
    std::optional<std::string> thread_originator_guid;
    message::CanonicalMessage message;
};

struct DecodeStats {
    std::size_t messages_decoded = 0;
    std::size_t text_from_body = 0;
    std::size_t text_from_edit_history = 0;
    std::size_t text_undecoded = 0;
    std::size_t timestamp_missing = 0;
    std::size_t sender_unresolved = 0;
};

class RowDecoder {
public:
    /// source_path: редактированный путь источника для source_ref.path
    RowDecoder(const schema::SchemaInfo& info, std::string source_path);

    DecodedRow decode(const RawRow& row);

    const DecodeStats& stats() const { return stats_; }

private:
    TextChain chain_;
    std::string source_path_;
    DecodeStats stats_;
};

/// Идентификатор беседы для строки без чата
constexpr const char* UNASSIGNED_CONVERSATION = "conv_unassigned";

}  // namespace chatx::decode

#endif  // CHATX_DECODE_HPP
