// ==============================================================================
// chatx/report.hpp - Run Reporter
// ==============================================================================
//
// RunReport создаётся в начале прогона, только дополняется и выводится один
// раз в конце: run_report.json и таблица-сводка в stderr.
//
// ==============================================================================

#ifndef CHATX_REPORT_HPP
#define CHATX_REPORT_HPP

#include <chatx/message.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace chatx::output {
class Writer;
}

namespace chatx::report {

struct Counters {
    std::size_t rows_read = 0;
    std::size_t messages_decoded = 0;
    std::size_t messages_emitted = 0;
    std::size_t reactions_folded = 0;
    std::size_t reactions_deduplicated = 0;
    std::size_t reaction_removals = 0;
    std::size_t replies_resolved = 0;
    std::size_t replies_unresolved = 0;
    std::size_t reactions_unresolved = 0;
    std::size_t attachments_total = 0;
    std::size_t attachments_resolved = 0;
    std::size_t attachments_missing = 0;
    std::size_t attachments_copied = 0;
    std::size_t transcripts_created = 0;
    std::size_t transcripts_failed = 0;
    std::size_t quarantined = 0;
    std::size_t text_from_body = 0;
    std::size_t text_from_edit_history = 0;
    std::size_t text_undecoded = 0;
    std::size_t schema_warnings = 0;
    std::size_t wal_only_rows = 0;
    std::size_t wal_deleted_rows = 0;
};

struct RunReport {
    std::string started_at;
    std::string finished_at;
    std::string source_kind;
    std::string source_path;  // редактированный
    std::string schema_generation;
    int schema_version = 0;
    std::string conversation_filter;
    Counters counters;
    std::vector<message::UnresolvedRelation> unresolved;
    std::vector<std::int64_t> wal_deleted_rowids;
    std::vector<std::string> artifacts;  // имена файлов относительно out dir

    rapidjson::Document to_document() const;

    /// Таблица счётчиков в stderr
    void print_summary(output::Writer& writer) const;
};

/// Текущее время UTC в формате YYYY-MM-DDTHH:MM:SSZ
std::string now_utc();

}  // namespace chatx::report

#endif  // CHATX_REPORT_HPP
