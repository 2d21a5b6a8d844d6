// ==============================================================================
// schema.cpp - Классификация поколений схемы chat.db
// ==============================================================================

#include "chatx/schema.hpp"

#include <initializer_list>

namespace chatx::schema {

namespace {

/// Колонки первого поколения; входят в обязательные колонки всех следующих
const std::vector<const char*>& legacy_columns() {
    static const std::vector<const char*> columns = {"ROWID", "guid",       "text",
                                                     "date",  "is_from_me", "handle_id"};
    return columns;
}

std::vector<const char*> legacy_plus(std::initializer_list<const char*> extra) {
    std::vector<const char*> columns = legacy_columns();
    columns.insert(columns.end(), extra.begin(), extra.end());
    return columns;
}

const std::vector<GenerationSpec>& generation_table() {
    // Новые поколения дописываются в конец
    static const std::vector<GenerationSpec> table = {
        {Generation::LegacyText,
         "legacy_text",
         1,
         legacy_columns(),
         {"service", "associated_message_guid", "associated_message_type",
          "thread_originator_guid"}},
        {Generation::BinaryText,
         "binary_text",
         2,
         legacy_plus({"attributedBody"}),
         {"associated_message_emoji"}},
        {Generation::BinaryTextEdits,
         "binary_text_edits",
         3,
         legacy_plus({"attributedBody", "message_summary_info"}),
         {"date_edited", "date_retracted"}},
    };
    return table;
}

std::set<std::string> column_set(sqlite::Database& db, const char* table) {
    std::set<std::string> columns;
    for (auto& name : db.table_columns(table)) {
        columns.insert(std::move(name));
    }
    return columns;
}

/// Проверить колонки вспомогательной таблицы; недостающие попадают в warnings
bool columns_present(sqlite::Database& db, const char* table,
                     std::initializer_list<const char*> required,
                     std::vector<std::string>& warnings) {
    const std::set<std::string> columns = column_set(db, table);
    std::string missing;
    for (const char* column : required) {
        if (columns.count(column) == 0) {
            missing += missing.empty() ? column : std::string(", ") + column;
        }
    }
    if (missing.empty()) {
        return true;
    }
    warnings.push_back(std::string(table) + " table lacks column(s): " + missing);
    return false;
}

}  // namespace

const std::vector<GenerationSpec>& generations() {
    return generation_table();
}

const char* generation_tag(Generation generation) {
    for (const auto& spec : generation_table()) {
        if (spec.generation == generation) {
            return spec.tag;
        }
    }
    return "legacy_text";
}

SchemaInfo classify(const std::set<std::string>& message_columns) {
    SchemaInfo info;
    info.message_columns = message_columns;

    const auto& table = generation_table();
    const GenerationSpec* best = nullptr;
    for (const auto& spec : table) {
        bool complete = true;
        for (const char* column : spec.required) {
            if (message_columns.count(column) == 0) {
                complete = false;
                break;
            }
        }
        if (complete && (best == nullptr || spec.version > best->version)) {
            best = &spec;
        }
    }

    if (best != nullptr) {
        info.generation = best->generation;
        info.version = best->version;
        return info;
    }

    // Раскладка не распознана: самый консервативный путь декодирования
    info.recognized = false;
    info.generation = table.front().generation;
    info.version = table.front().version;
    for (const char* column : table.front().required) {
        if (message_columns.count(column) == 0) {
            info.missing.emplace_back(column);
        }
    }
    return info;
}

SchemaInfo inspect(sqlite::Database& db) {
    std::set<std::string> columns = column_set(db, "message");
    // ROWID есть у любой rowid-таблицы, но не попадает в table_info
    if (!columns.empty()) {
        columns.insert("ROWID");
    }

    SchemaInfo info = classify(columns);
    info.has_handle = db.table_exists("handle");
    info.has_chat = db.table_exists("chat");
    info.has_chat_message_join = db.table_exists("chat_message_join");
    info.has_attachment = db.table_exists("attachment");
    info.has_message_attachment_join = db.table_exists("message_attachment_join");

    std::vector<std::string>& warnings = info.warnings;

    if (!info.has_handle) {
        warnings.emplace_back("handle table absent, senders will be unresolved");
    } else if (!info.has_column("handle_id")) {
        warnings.emplace_back("message table lacks column(s): handle_id");
    } else {
        info.handle_joinable = columns_present(db, "handle", {"id"}, warnings);
    }

    if (!info.has_chat || !info.has_chat_message_join) {
        warnings.emplace_back("chat tables absent, messages are unassigned");
    } else {
        bool chat_ok = columns_present(db, "chat", {"guid"}, warnings);
        bool join_ok = columns_present(db, "chat_message_join", {"chat_id", "message_id"}, warnings);
        info.chat_joinable = chat_ok && join_ok;
    }

    if (!info.has_attachment || !info.has_message_attachment_join) {
        warnings.emplace_back("attachment tables absent, attachments skipped");
    } else {
        info.attachment_joinable = columns_present(db, "message_attachment_join",
                                                   {"message_id", "attachment_id"}, warnings);
    }
    return info;
}

}  // namespace chatx::schema
