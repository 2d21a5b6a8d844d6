// ==============================================================================
// chatx/schema.hpp - Schema Adapter: поколения схемы chat.db
// ==============================================================================
//
// Назначение:
// - Таблица известных поколений (tag → обязательные колонки message),
//   только дописывается
// - Классификация по набору колонок, а не по строке версии
// - Набор вспомогательных таблиц и их колонок для построения запроса строк
//
// Неизвестная раскладка (нет даже колонок legacy) деградирует к legacy_text
// с предупреждением, а не к фатальной ошибке. Вспомогательная таблица без
// нужных колонок считается отсутствующей: соответствующее поле читается
// как NULL, в warnings добавляется запись.
//
// ==============================================================================

#ifndef CHATX_SCHEMA_HPP
#define CHATX_SCHEMA_HPP

#include <chatx/sqlite.hpp>

#include <set>
#include <string>
#include <vector>

namespace chatx::schema {

enum class Generation {
    LegacyText,       // text
    BinaryText,       // + attributedBody
    BinaryTextEdits   // + message_summary_info
};

struct GenerationSpec {
    Generation generation;
    const char* tag;
    int version;
    std::vector<const char*> required;  // колонки message
    std::vector<const char*> optional;  // читаются, если есть
};

/// Таблица поколений в порядке возрастания version
const std::vector<GenerationSpec>& generations();

const char* generation_tag(Generation generation);

// ----------------------------------------------------------------------------
// Результат инспекции
// ----------------------------------------------------------------------------

struct SchemaInfo {
    Generation generation = Generation::LegacyText;
    int version = 1;
    bool recognized = true;                  // false → деградация к legacy
    std::vector<std::string> missing;        // недостающие колонки legacy
    std::set<std::string> message_columns;

    // Наличие таблиц
    bool has_handle = false;
    bool has_chat = false;
    bool has_chat_message_join = false;
    bool has_attachment = false;
    bool has_message_attachment_join = false;

    // Таблицы присутствуют и содержат колонки, по которым строится JOIN
    bool handle_joinable = false;      // handle.id, message.handle_id
    bool chat_joinable = false;        // chat.guid, chat_message_join.{chat_id,message_id}
    bool attachment_joinable = false;  // message_attachment_join.{message_id,attachment_id}

    /// Деградации раскладки вспомогательных таблиц
    std::vector<std::string> warnings;

    bool has_column(const std::string& name) const { return message_columns.count(name) != 0; }

    /// Можно ли читать метаданные вложений
    bool attachments_available() const { return attachment_joinable; }
};

/// Классифицировать набор колонок message
SchemaInfo classify(const std::set<std::string>& message_columns);

/// Прочитать колонки и вспомогательные таблицы из открытой базы
SchemaInfo inspect(sqlite::Database& db);

}  // namespace chatx::schema

#endif  // CHATX_SCHEMA_HPP
