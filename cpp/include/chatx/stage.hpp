// ==============================================================================
// chatx/stage.hpp - Source Stager: приватная копия базы сообщений
// ==============================================================================
//
// Назначение:
// - Живая база: согласованная копия chat.db + -wal + -shm (повтор до
//   стабильного снимка или таймаута)
// - Бэкап: поиск sms.db через Manifest.db, копирование или расшифровка
// - WAL-аудит: сравнение множеств ROWID с WAL и без него
// - Приватный каталог 0700, удаляемый при разрушении StagedDatabase
//
// Фатальные ошибки бросаются как PipelineError (db_not_found,
// backup_*, staging_timeout, staging_failed, db_open_failed).
//
// ==============================================================================

#ifndef CHATX_STAGE_HPP
#define CHATX_STAGE_HPP

#include <chatx/backup.hpp>
#include <chatx/config.hpp>
#include <chatx/sqlite.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chatx::output {
class Writer;
}

namespace chatx::stage {

// ----------------------------------------------------------------------------
// Входные параметры
// ----------------------------------------------------------------------------

struct SourceDescriptor {
    config::SourceKind kind = config::SourceKind::Live;
    std::filesystem::path db_path;      // live
    std::filesystem::path backup_root;  // backup
    std::optional<std::string> password;
};

struct StageOptions {
    std::filesystem::path work_dir;  // пусто = $TMPDIR
    bool retain = false;
    std::chrono::milliseconds timeout{30000};
    std::chrono::seconds decrypt_timeout{300};
    bool wal_audit = true;
};

/// Результат сравнения видимых ROWID с WAL и без него
struct WalAudit {
    bool performed = false;
    std::set<std::int64_t> wal_only;        // есть только после применения WAL
    std::vector<std::int64_t> wal_deleted;  // были в основном файле, исчезли с WAL
};

// ----------------------------------------------------------------------------
// StagedDatabase
// ----------------------------------------------------------------------------

class StagedDatabase {
public:
    ~StagedDatabase();

    StagedDatabase(const StagedDatabase&) = delete;
    StagedDatabase& operator=(const StagedDatabase&) = delete;

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path db_path() const { return dir_ / "chat.db"; }
    bool has_wal() const;

    config::SourceKind kind() const { return kind_; }

    /// Путь оригинала (для source_ref.path)
    const std::filesystem::path& source_path() const { return source_path_; }

    /// Manifest бэкапа; nullptr для живого источника
    backup::Manifest* manifest() const { return manifest_.get(); }

    const WalAudit& wal_audit() const { return audit_; }

    /// Открыть приватную копию (WAL применяется), затем PRAGMA query_only.
    /// Бросает PipelineError(db_open_failed).
    sqlite::Database open() const;

    bool retained() const { return retain_; }

private:
    friend std::unique_ptr<StagedDatabase> stage(const SourceDescriptor&, const StageOptions&,
                                                 output::Writer&);

    StagedDatabase() = default;

    std::filesystem::path dir_;
    std::filesystem::path source_path_;
    config::SourceKind kind_ = config::SourceKind::Live;
    bool retain_ = false;
    std::unique_ptr<backup::Manifest> manifest_;
    WalAudit audit_;
};

/// Подготовить приватную копию источника
std::unique_ptr<StagedDatabase> stage(const SourceDescriptor& source, const StageOptions& options,
                                      output::Writer& writer);

/// ROWID всех строк таблицы message (по возрастанию)
std::set<std::int64_t> message_rowids(sqlite::Database& db);

}  // namespace chatx::stage

#endif  // CHATX_STAGE_HPP
