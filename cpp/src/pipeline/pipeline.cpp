// ==============================================================================
// pipeline.cpp - Прогон извлечения
// ==============================================================================

#include "chatx/pipeline.hpp"

#include "chatx/attachments.hpp"
#include "chatx/decode.hpp"
#include "chatx/message.hpp"
#include "chatx/output.hpp"
#include "chatx/platform.hpp"
#include "chatx/problem.hpp"
#include "chatx/relations.hpp"
#include "chatx/schema.hpp"
#include "chatx/sqlite.hpp"
#include "chatx/stage.hpp"
#include "chatx/transcribe.hpp"
#include "chatx/validate.hpp"

#include <chrono>
#include <memory>
#include <system_error>
#include <utility>

namespace chatx::pipeline {

namespace fs = std::filesystem;

namespace {

void check_cancel(const std::atomic<bool>* cancel, const char* where) {
    if (cancel != nullptr && cancel->load()) {
        throw PipelineError(ErrorCode::Cancelled, std::string("interrupted during ") + where);
    }
}

fs::path effective_home(const config::ExtractConfig& cfg) {
    if (!cfg.source.home.empty()) {
        return cfg.source.home;
    }
    return platform::home_dir().value_or(fs::path());
}

stage::SourceDescriptor make_source(const config::ExtractConfig& cfg, const fs::path& home) {
    stage::SourceDescriptor source;
    source.kind = cfg.source.kind;
    if (cfg.source.kind == config::SourceKind::Live) {
        source.db_path = platform::expand_home(platform::path_to_utf8(cfg.source.db_path), home);
    } else {
        source.backup_root =
            platform::expand_home(platform::path_to_utf8(cfg.source.backup_root), home);
        source.password = config::resolve_password(cfg.source);
    }
    return source;
}

stage::StageOptions make_stage_options(const config::StagingConfig& staging) {
    stage::StageOptions options;
    options.work_dir = staging.work_dir;
    options.retain = staging.retain;
    options.timeout = std::chrono::seconds(staging.timeout_seconds);
    options.decrypt_timeout = std::chrono::seconds(staging.decrypt_timeout_seconds);
    options.wal_audit = staging.wal_audit;
    return options;
}

void fill_counters(report::Counters& counters, const decode::DecodeStats& decoded,
                   const relations::RelationStats& rel) {
    counters.messages_decoded = decoded.messages_decoded;
    counters.text_from_body = decoded.text_from_body;
    counters.text_from_edit_history = decoded.text_from_edit_history;
    counters.text_undecoded = decoded.text_undecoded;
    counters.reactions_folded = rel.reactions_folded;
    counters.reactions_deduplicated = rel.reactions_deduplicated;
    counters.reaction_removals = rel.reaction_removals;
    counters.reactions_unresolved = rel.reactions_unresolved;
    counters.replies_resolved = rel.replies_resolved;
    counters.replies_unresolved = rel.replies_unresolved;
}

/// Ошибка SQLite при чтении уже открытой базы
[[noreturn]] void fail_read(const sqlite::SqliteError& e, const char* where,
                            const std::string& source_path) {
    throw PipelineError(ErrorCode::DbOpenFailed,
                        std::string("database read failed during ") + where + ": " + e.what(),
                        source_path);
}

void write_or_fail(const fs::path& path, const rapidjson::Value& doc) {
    if (!output::write_json_file(path, doc)) {
        throw PipelineError(ErrorCode::OutputFailed, "cannot write output file",
                            platform::path_to_utf8(path));
    }
}

}  // namespace

RunResult run(const config::ExtractConfig& cfg, output::Writer& writer,
              const std::atomic<bool>* cancel) {
    RunResult result;
    report::RunReport& rep = result.report;
    report::Counters& counters = rep.counters;
    rep.started_at = report::now_utc();
    rep.source_kind = config::source_kind_name(cfg.source.kind);
    rep.conversation_filter = cfg.filter.conversation.value_or("");

    const fs::path home = effective_home(cfg);
    const fs::path out_dir = cfg.output.dir;
    result.out_dir = out_dir;

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        throw PipelineError(ErrorCode::OutputFailed,
                            "cannot create output directory: " + ec.message(),
                            platform::path_to_utf8(out_dir));
    }

    // ------------------------------------------------------------------------
    // Staging
    // ------------------------------------------------------------------------

    stage::SourceDescriptor source = make_source(cfg, home);
    std::unique_ptr<stage::StagedDatabase> staged =
        stage::stage(source, make_stage_options(cfg.staging), writer);
    const std::string source_path =
        platform::redact_path(platform::path_to_utf8(staged->source_path()), home);
    rep.source_path = source_path;

    const stage::WalAudit& audit = staged->wal_audit();
    counters.wal_deleted_rows = audit.wal_deleted.size();
    rep.wal_deleted_rowids = audit.wal_deleted;
    if (!audit.wal_deleted.empty()) {
        writer.warn(std::to_string(audit.wal_deleted.size()) +
                    " row(s) present in the main file were deleted by the WAL");
    }
    check_cancel(cancel, "staging");

    sqlite::Database db = staged->open();

    // ------------------------------------------------------------------------
    // Схема
    // ------------------------------------------------------------------------

    schema::SchemaInfo info;
    try {
        info = schema::inspect(db);
    } catch (const sqlite::SqliteError& e) {
        fail_read(e, "schema inspection", source_path);
    }
    rep.schema_generation = schema::generation_tag(info.generation);
    rep.schema_version = info.version;
    if (!info.recognized) {
        ++counters.schema_warnings;
        std::string missing;
        for (const auto& column : info.missing) {
            missing += missing.empty() ? column : ", " + column;
        }
        writer.warn("unrecognized message schema, decoding as " + rep.schema_generation +
                    (missing.empty() ? std::string() : " (missing: " + missing + ")"));
    } else {
        writer.info("Schema generation: " + rep.schema_generation + " (v" +
                    std::to_string(info.version) + ")");
    }
    for (const auto& warning : info.warnings) {
        ++counters.schema_warnings;
        writer.warn(warning);
    }

    // ------------------------------------------------------------------------
    // Чтение и декодирование строк
    // ------------------------------------------------------------------------

    decode::RowDecoder decoder(info, source_path);
    std::vector<decode::DecodedRow> rows;
    try {
        decode::RowReader reader(db, info, cfg.filter.conversation);
        writer.trace("row query: " + reader.sql());

        decode::RawRow raw;
        while (reader.next(raw)) {
            check_cancel(cancel, "row decoding");
            decode::DecodedRow row = decoder.decode(raw);
            if (audit.wal_only.count(row.rowid) != 0) {
                row.message.source_meta.set("wal_only", Value(true));
                ++counters.wal_only_rows;
            }
            rows.push_back(std::move(row));
        }
        counters.rows_read = reader.rows_read();
    } catch (const sqlite::SqliteError& e) {
        fail_read(e, "row decoding", source_path);
    }
    writer.info("Read " + std::to_string(counters.rows_read) + " message row(s)");

    // ------------------------------------------------------------------------
    // Связи
    // ------------------------------------------------------------------------

    relations::ResolveResult resolved = relations::resolve(std::move(rows));
    fill_counters(counters, decoder.stats(), resolved.stats);
    rep.unresolved = std::move(resolved.unresolved);
    std::vector<message::CanonicalMessage>& messages = resolved.messages;
    check_cancel(cancel, "relationship resolution");

    // ------------------------------------------------------------------------
    // Вложения
    // ------------------------------------------------------------------------

    std::vector<message::MissingAttachment> missing;
    bool attachments_copied = false;
    if (cfg.attachments.include && info.attachments_available()) {
        attachments::AttachmentMap metadata;
        try {
            metadata = attachments::load_metadata(db, info);
        } catch (const sqlite::SqliteError& e) {
            fail_read(e, "attachment metadata", source_path);
        }

        std::unique_ptr<attachments::ByteSource> bytes;
        if (staged->manifest() != nullptr) {
            bytes = std::make_unique<attachments::BackupSource>(*staged->manifest(),
                                                                staged->dir() / "attachments");
        } else {
            bytes = std::make_unique<attachments::LiveSource>(home);
        }

        attachments::ResolverOptions options;
        options.copy_binaries = cfg.attachments.copy_binaries;
        options.workers = cfg.attachments.workers;
        options.out_dir = out_dir;

        attachments::Resolver resolver(*bytes, options, writer);
        try {
            resolver.run(messages, std::move(metadata), cancel);
        } catch (const sqlite::SqliteError& e) {
            fail_read(e, "attachment resolution", source_path);
        }
        check_cancel(cancel, "attachment resolution");

        const attachments::AttachmentStats& stats = resolver.stats();
        counters.attachments_total = stats.total;
        counters.attachments_resolved = stats.resolved;
        counters.attachments_missing = stats.missing;
        counters.attachments_copied = stats.copied;
        attachments_copied = stats.copied > 0;
        missing = resolver.missing();
        if (stats.copy_failed > 0) {
            writer.warn(std::to_string(stats.copy_failed) + " attachment(s) could not be copied");
        }
    }

    // ------------------------------------------------------------------------
    // Транскрипция
    // ------------------------------------------------------------------------

    std::unique_ptr<transcribe::Transcriber> transcriber =
        transcribe::make_transcriber(cfg.transcription);
    if (transcriber) {
        if (!cfg.attachments.include) {
            writer.warn("transcription requested but attachments are disabled");
        } else {
            writer.info("Transcribing audio with " + transcriber->engine());
            transcribe::TranscriptionStats stats = transcribe::apply(
                messages, *transcriber, cfg.attachments.workers, writer, cancel);
            check_cancel(cancel, "transcription");
            counters.transcripts_created = stats.created;
            counters.transcripts_failed = stats.failed;
        }
    }

    // ------------------------------------------------------------------------
    // Проверка и запись
    // ------------------------------------------------------------------------

    validate::Validator validator;
    output::JsonlFile sink;
    const fs::path messages_path = out_dir / MESSAGES_FILE;
    if (!sink.open(messages_path)) {
        throw PipelineError(ErrorCode::OutputFailed, "cannot open messages file",
                            platform::path_to_utf8(messages_path));
    }
    validate::QuarantineSink quarantine(out_dir / QUARANTINE_FILE);
    if (!quarantine.open()) {
        throw PipelineError(ErrorCode::OutputFailed, "cannot open quarantine file",
                            platform::path_to_utf8(quarantine.path()));
    }

    for (std::size_t i = 0; i < messages.size(); ++i) {
        check_cancel(cancel, "validation");
        const message::CanonicalMessage& msg = messages[i];
        rapidjson::Document doc = message::to_document(msg);
        if (auto error = validator.check(msg, doc)) {
            writer.debug("quarantined " + msg.msg_id + ": " + *error);
            if (!quarantine.write(i, msg.msg_id, *error, doc)) {
                throw PipelineError(ErrorCode::OutputFailed, "cannot write quarantine record",
                                    platform::path_to_utf8(quarantine.path()));
            }
            continue;
        }
        if (!sink.write(doc)) {
            throw PipelineError(ErrorCode::OutputFailed, "cannot write message record",
                                platform::path_to_utf8(messages_path));
        }
    }
    counters.messages_emitted = sink.lines();
    counters.quarantined = quarantine.count();
    if (!sink.close()) {
        throw PipelineError(ErrorCode::OutputFailed, "cannot flush messages file",
                            platform::path_to_utf8(messages_path));
    }
    if (!quarantine.close()) {
        throw PipelineError(ErrorCode::OutputFailed, "cannot flush quarantine file",
                            platform::path_to_utf8(quarantine.path()));
    }
    if (counters.quarantined > 0) {
        writer.warn(std::to_string(counters.quarantined) + " record(s) quarantined");
    }

    // ------------------------------------------------------------------------
    // Отчёты
    // ------------------------------------------------------------------------

    rapidjson::Document missing_doc = attachments::missing_report(missing);
    write_or_fail(out_dir / MISSING_ATTACHMENTS_FILE, missing_doc);

    rep.artifacts = {MESSAGES_FILE, QUARANTINE_FILE, MISSING_ATTACHMENTS_FILE, RUN_REPORT_FILE};
    if (attachments_copied) {
        rep.artifacts.emplace_back(ATTACHMENTS_DIR);
    }
    rep.finished_at = report::now_utc();
    rapidjson::Document report_doc = rep.to_document();
    write_or_fail(out_dir / RUN_REPORT_FILE, report_doc);

    if (counters.messages_emitted == 0) {
        throw PipelineError(ErrorCode::NoValidRows,
                            "no record passed validation (" + std::to_string(counters.quarantined) +
                                " quarantined)",
                            platform::redact_path(platform::path_to_utf8(out_dir), home));
    }
    return result;
}

}  // namespace chatx::pipeline
