// ==============================================================================
// stage.cpp - Source Stager: приватная копия базы сообщений
// ==============================================================================
//
// Оригинал никогда не открывается на запись: копируются байты, а SQLite
// работает только с копией в приватном каталоге.
//
// ==============================================================================

#include "chatx/stage.hpp"

#include "chatx/output.hpp"
#include "chatx/platform.hpp"
#include "chatx/problem.hpp"

#include <algorithm>
#include <iterator>
#include <thread>

namespace chatx::stage {

namespace {

const char* const COMPANION_SUFFIXES[] = {"-wal", "-shm"};

/// Снимок размера и времени модификации файла
struct FileStamp {
    bool exists = false;
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime{};

    bool operator==(const FileStamp& other) const {
        return exists == other.exists && size == other.size && mtime == other.mtime;
    }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
};

FileStamp stamp(const std::filesystem::path& path) {
    FileStamp s;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return s;
    }
    s.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return s;
    }
    s.mtime = std::filesystem::last_write_time(path, ec);
    s.exists = !ec;
    return s;
}

std::filesystem::path with_suffix(const std::filesystem::path& path, const char* suffix) {
    std::filesystem::path out = path;
    out += suffix;
    return out;
}

std::vector<std::filesystem::path> snapshot_set(const std::filesystem::path& db) {
    std::vector<std::filesystem::path> files{db};
    for (const char* suffix : COMPANION_SUFFIXES) {
        files.push_back(with_suffix(db, suffix));
    }
    return files;
}

ErrorCode map_backup_error(backup::BackupErrorKind kind) {
    switch (kind) {
    case backup::BackupErrorKind::NotFound:
        return ErrorCode::BackupNotFound;
    case backup::BackupErrorKind::ManifestMissing:
        return ErrorCode::BackupManifestMissing;
    case backup::BackupErrorKind::EntryMissing:
        return ErrorCode::BackupEntryMissing;
    case backup::BackupErrorKind::NeedsPassword:
        return ErrorCode::BackupEncryptedNeedsPassword;
    case backup::BackupErrorKind::DecryptFailed:
        return ErrorCode::BackupDecryptFailed;
    case backup::BackupErrorKind::DecryptTimeout:
        return ErrorCode::DecryptTimeout;
    case backup::BackupErrorKind::Io:
        return ErrorCode::StagingFailed;
    }
    return ErrorCode::StagingFailed;
}

[[noreturn]] void throw_backup(const backup::BackupError& error) {
    throw PipelineError(map_backup_error(error.kind), error.format(), error.path);
}

// ----------------------------------------------------------------------------
// Живой источник
// ----------------------------------------------------------------------------

void stage_live(const std::filesystem::path& source, const std::filesystem::path& dir,
                std::chrono::milliseconds timeout, output::Writer& writer) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw PipelineError(ErrorCode::DbNotFound, "messages database does not exist",
                            platform::path_to_utf8(source));
    }

    const auto files = snapshot_set(source);
    const std::filesystem::path target = dir / "chat.db";
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int attempt = 0;

    while (true) {
        ++attempt;
        std::vector<FileStamp> before;
        for (const auto& f : files) {
            before.push_back(stamp(f));
        }

        for (std::size_t i = 0; i < files.size(); ++i) {
            std::filesystem::path dest = i == 0 ? target : with_suffix(target, COMPANION_SUFFIXES[i - 1]);
            if (!before[i].exists) {
                // Компаньон исчез между попытками: убрать устаревшую копию
                std::filesystem::remove(dest, ec);
                continue;
            }
            std::filesystem::copy_file(files[i], dest,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                throw PipelineError(ErrorCode::StagingFailed,
                                    "copy failed: " + ec.message(),
                                    platform::path_to_utf8(files[i]));
            }
        }

        std::vector<FileStamp> after;
        for (const auto& f : files) {
            after.push_back(stamp(f));
        }
        if (before == after) {
            writer.debug("staged live database in " + std::to_string(attempt) + " attempt(s)");
            return;
        }

        writer.trace("source changed during copy, retrying");
        if (std::chrono::steady_clock::now() >= deadline) {
            throw PipelineError(ErrorCode::StagingTimeout,
                                "database kept changing for " +
                                    std::to_string(timeout.count()) + "ms",
                                platform::path_to_utf8(source));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

// ----------------------------------------------------------------------------
// Бэкап
// ----------------------------------------------------------------------------

std::unique_ptr<backup::Manifest> stage_backup(const SourceDescriptor& source,
                                               const StageOptions& options,
                                               const std::filesystem::path& dir,
                                               output::Writer& writer) {
    auto pre = backup::preflight(source.backup_root);
    if (pre.exists) {
        writer.debug(std::string("backup preflight: manifest_db=") +
                     (pre.manifest_db ? "yes" : "no") +
                     " info_plist=" + (pre.info_plist ? "yes" : "no") +
                     " status_plist=" + (pre.status_plist ? "yes" : "no") +
                     " shards=" + (pre.shards_present ? "yes" : "no"));
        if (!pre.shards_present) {
            writer.warn("backup has no 00..ff shard directories, assuming flat layout");
        }
    }

    backup::OpenOptions open_options;
    open_options.password = source.password;
    open_options.work_dir = dir;
    open_options.decrypt_timeout = options.decrypt_timeout;

    backup::BackupError error;
    auto manifest = backup::Manifest::open(source.backup_root, open_options, error);
    if (!manifest) {
        throw_backup(error);
    }
    if (manifest->encrypted()) {
        writer.info("Encrypted backup unlocked");
    }

    auto entry = manifest->lookup(backup::HOME_DOMAIN, backup::SMS_DB_PATH);
    if (!entry) {
        throw PipelineError(ErrorCode::BackupEntryMissing,
                            std::string("Manifest.db has no entry for ") + backup::HOME_DOMAIN +
                                ":" + backup::SMS_DB_PATH,
                            platform::path_to_utf8(source.backup_root / "Manifest.db"));
    }
    if (!manifest->extract(*entry, dir / "chat.db", error)) {
        throw_backup(error);
    }

    for (const char* suffix : COMPANION_SUFFIXES) {
        auto companion =
            manifest->lookup(backup::HOME_DOMAIN, std::string(backup::SMS_DB_PATH) + suffix);
        if (!companion) {
            continue;
        }
        if (!manifest->extract(*companion, with_suffix(dir / "chat.db", suffix), error)) {
            // Компаньон без физического файла не мешает: база без него согласована
            if (error.kind != backup::BackupErrorKind::EntryMissing) {
                throw_backup(error);
            }
            writer.warn(error.format());
        }
    }
    return manifest;
}

// ----------------------------------------------------------------------------
// WAL-аудит
// ----------------------------------------------------------------------------

WalAudit audit_wal(const std::filesystem::path& dir, output::Writer& writer) {
    WalAudit audit;
    std::filesystem::path audit_dir = dir / "wal_audit";
    std::error_code ec;
    std::filesystem::create_directories(audit_dir, ec);
    if (ec) {
        writer.warn("WAL audit skipped: " + ec.message());
        return audit;
    }
    // Только основной файл, без -wal/-shm
    std::filesystem::copy_file(dir / "chat.db", audit_dir / "chat.db",
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        writer.warn("WAL audit skipped: " + ec.message());
        return audit;
    }

    std::set<std::int64_t> primary;
    std::set<std::int64_t> merged;
    try {
        sqlite::Database without_wal(audit_dir / "chat.db", sqlite::OpenMode::ReadWrite);
        primary = message_rowids(without_wal);
    } catch (const sqlite::SqliteError& e) {
        // Основной файл без WAL может быть несогласован: аудит невозможен
        writer.warn(std::string("WAL audit skipped: ") + e.what());
        std::filesystem::remove_all(audit_dir, ec);
        return audit;
    }
    std::filesystem::remove_all(audit_dir, ec);

    try {
        sqlite::Database with_wal(dir / "chat.db", sqlite::OpenMode::ReadWrite);
        merged = message_rowids(with_wal);
    } catch (const sqlite::SqliteError& e) {
        throw PipelineError(ErrorCode::DbOpenFailed, e.what(),
                            platform::path_to_utf8(dir / "chat.db"));
    }

    std::set_difference(merged.begin(), merged.end(), primary.begin(), primary.end(),
                        std::inserter(audit.wal_only, audit.wal_only.end()));
    std::set_difference(primary.begin(), primary.end(), merged.begin(), merged.end(),
                        std::back_inserter(audit.wal_deleted));
    audit.performed = true;

    writer.debug("WAL audit: " + std::to_string(audit.wal_only.size()) + " WAL-only row(s), " +
                 std::to_string(audit.wal_deleted.size()) + " deleted row(s)");
    return audit;
}

}  // namespace

// ----------------------------------------------------------------------------
// StagedDatabase
// ----------------------------------------------------------------------------

StagedDatabase::~StagedDatabase() {
    // Manifest держит открытый Manifest.db внутри каталога
    manifest_.reset();
    if (!retain_ && !dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }
}

bool StagedDatabase::has_wal() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(with_suffix(db_path(), "-wal"), ec);
}

sqlite::Database StagedDatabase::open() const {
    try {
        // READWRITE на приватной копии: SQLite применяет WAL к снимку
        sqlite::Database db(db_path(), sqlite::OpenMode::ReadWrite);
        db.exec("PRAGMA query_only = ON");
        db.exec("PRAGMA temp_store = MEMORY");
        if (!db.table_exists("message")) {
            throw PipelineError(ErrorCode::DbOpenFailed, "staged database has no message table",
                                platform::path_to_utf8(source_path_));
        }
        return db;
    } catch (const sqlite::SqliteError& e) {
        throw PipelineError(ErrorCode::DbOpenFailed, e.what(),
                            platform::path_to_utf8(source_path_));
    }
}

std::unique_ptr<StagedDatabase> stage(const SourceDescriptor& source, const StageOptions& options,
                                      output::Writer& writer) {
    std::unique_ptr<StagedDatabase> staged(new StagedDatabase());
    staged->kind_ = source.kind;
    staged->retain_ = options.retain;

    if (source.kind == config::SourceKind::Backup) {
        std::error_code ec;
        if (!std::filesystem::is_directory(source.backup_root, ec)) {
            throw PipelineError(ErrorCode::BackupNotFound,
                                std::string("backup directory does not exist; expected ") +
                                    backup::MOBILESYNC_HINT,
                                platform::path_to_utf8(source.backup_root));
        }
        staged->source_path_ = source.backup_root;
    } else {
        staged->source_path_ = source.db_path;
    }

    try {
        staged->dir_ = platform::make_private_dir("chatx_stage", options.work_dir);
    } catch (const std::runtime_error& e) {
        throw PipelineError(ErrorCode::StagingFailed, e.what(),
                            platform::path_to_utf8(options.work_dir));
    }
    writer.debug("staging directory: " + platform::path_to_utf8(staged->dir_));

    if (source.kind == config::SourceKind::Backup) {
        staged->manifest_ = stage_backup(source, options, staged->dir_, writer);
    } else {
        stage_live(source.db_path, staged->dir_, options.timeout, writer);
    }

    if (options.wal_audit && staged->has_wal()) {
        staged->audit_ = audit_wal(staged->dir_, writer);
    }
    return staged;
}

std::set<std::int64_t> message_rowids(sqlite::Database& db) {
    std::set<std::int64_t> rowids;
    sqlite::Statement stmt = db.prepare("SELECT ROWID FROM message");
    while (stmt.step()) {
        rowids.insert(stmt.column_int(0));
    }
    return rowids;
}

}  // namespace chatx::stage
