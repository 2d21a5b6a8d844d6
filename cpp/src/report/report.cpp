// ==============================================================================
// report.cpp - run_report.json и итоговая сводка
// ==============================================================================

#include "chatx/report.hpp"

#include "chatx/output.hpp"

#include <chrono>
#include <utility>

namespace chatx::report {

namespace {

using Alloc = rapidjson::Document::AllocatorType;

rapidjson::Value str(const std::string& s, Alloc& alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

/// Пары (имя, значение) в порядке вывода
std::vector<std::pair<const char*, std::size_t>> counter_list(const Counters& c) {
    return {
        {"rows_read", c.rows_read},
        {"messages_decoded", c.messages_decoded},
        {"messages_emitted", c.messages_emitted},
        {"reactions_folded", c.reactions_folded},
        {"reactions_deduplicated", c.reactions_deduplicated},
        {"reaction_removals", c.reaction_removals},
        {"replies_resolved", c.replies_resolved},
        {"replies_unresolved", c.replies_unresolved},
        {"reactions_unresolved", c.reactions_unresolved},
        {"attachments_total", c.attachments_total},
        {"attachments_resolved", c.attachments_resolved},
        {"attachments_missing", c.attachments_missing},
        {"attachments_copied", c.attachments_copied},
        {"transcripts_created", c.transcripts_created},
        {"transcripts_failed", c.transcripts_failed},
        {"quarantined", c.quarantined},
        {"text_from_body", c.text_from_body},
        {"text_from_edit_history", c.text_from_edit_history},
        {"text_undecoded", c.text_undecoded},
        {"schema_warnings", c.schema_warnings},
        {"wal_only_rows", c.wal_only_rows},
        {"wal_deleted_rows", c.wal_deleted_rows},
    };
}

}  // namespace

std::string now_utc() {
    auto now = std::chrono::system_clock::now();
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return message::format_timestamp(static_cast<std::int64_t>(seconds));
}

rapidjson::Document RunReport::to_document() const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("started_at", str(started_at, alloc), alloc);
    doc.AddMember("finished_at", str(finished_at, alloc), alloc);

    rapidjson::Value source(rapidjson::kObjectType);
    source.AddMember("kind", str(source_kind, alloc), alloc);
    source.AddMember("path", str(source_path, alloc), alloc);
    if (conversation_filter.empty()) {
        source.AddMember("conversation", rapidjson::Value(rapidjson::kNullType), alloc);
    } else {
        source.AddMember("conversation", str(conversation_filter, alloc), alloc);
    }
    doc.AddMember("source", source, alloc);

    rapidjson::Value schema(rapidjson::kObjectType);
    schema.AddMember("generation", str(schema_generation, alloc), alloc);
    schema.AddMember("version", schema_version, alloc);
    doc.AddMember("schema", schema, alloc);

    rapidjson::Value counts(rapidjson::kObjectType);
    for (const auto& [name, value] : counter_list(counters)) {
        counts.AddMember(rapidjson::StringRef(name), static_cast<std::uint64_t>(value), alloc);
    }
    doc.AddMember("counters", counts, alloc);

    rapidjson::Value relations(rapidjson::kArrayType);
    for (const auto& rel : unresolved) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("origin_rowid", static_cast<std::int64_t>(rel.origin_rowid), alloc);
        item.AddMember("origin_msg_id", str(rel.origin_msg_id, alloc), alloc);
        item.AddMember("association_key", str(rel.association_key, alloc), alloc);
        item.AddMember("kind", rapidjson::StringRef(message::relation_kind_name(rel.kind)), alloc);
        relations.PushBack(item, alloc);
    }
    doc.AddMember("unresolved_relations", relations, alloc);

    rapidjson::Value deleted(rapidjson::kArrayType);
    for (std::int64_t rowid : wal_deleted_rowids) {
        deleted.PushBack(static_cast<std::int64_t>(rowid), alloc);
    }
    doc.AddMember("wal_deleted_rowids", deleted, alloc);

    rapidjson::Value files(rapidjson::kArrayType);
    for (const auto& name : artifacts) {
        files.PushBack(str(name, alloc), alloc);
    }
    doc.AddMember("artifacts", files, alloc);
    return doc;
}

void RunReport::print_summary(output::Writer& writer) const {
    output::Table table;
    table.set_headers({"counter", "value"});
    for (const auto& [name, value] : counter_list(counters)) {
        // Нулевые счётчики разрывов не загромождают сводку
        if (value == 0 && std::string(name) != "messages_emitted" &&
            std::string(name) != "quarantined") {
            continue;
        }
        table.add_row({name, std::to_string(value)});
    }
    table.print(writer);
}

}  // namespace chatx::report
