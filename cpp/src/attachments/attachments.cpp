// ==============================================================================
// attachments.cpp - Разрешение, материализация и учёт вложений
// ==============================================================================

#include "chatx/attachments.hpp"

#include "chatx/backup.hpp"
#include "chatx/crypto.hpp"
#include "chatx/output.hpp"
#include "chatx/parallel.hpp"
#include "chatx/platform.hpp"

#include <fstream>
#include <set>

#include <unistd.h>

namespace chatx::attachments {

namespace {

/// Шаги для вложений, выгруженных в iCloud
const char* const REMEDIATION_STEPS[] = {
    "Open Messages on the device that holds the conversation",
    "Open each affected conversation and download attachments marked for download",
    "For iCloud-optimized storage make sure the device has enough free space",
    "Wait for downloads to complete, then re-run the extraction",
    "Consider disabling 'Optimize Mac Storage' for Messages in iCloud",
};

std::optional<std::string> opt_text(const sqlite::Statement& stmt, int i) {
    if (stmt.column_is_null(i)) {
        return std::nullopt;
    }
    std::string s = stmt.column_text(i);
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

std::string column_or_null(const std::set<std::string>& columns, const char* name) {
    if (columns.count(name) != 0) {
        return std::string("a.") + sqlite::quote_identifier(name);
    }
    return "NULL";
}

std::string basename_of(std::string_view stored) {
    auto slash = stored.find_last_of('/');
    return std::string(slash == std::string_view::npos ? stored : stored.substr(slash + 1));
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

std::filesystem::path partial_path(const std::filesystem::path& dir) {
    static std::atomic<unsigned long> counter{0};
    return dir / (".partial-" + std::to_string(::getpid()) + "-" +
                  std::to_string(counter.fetch_add(1)));
}

}  // namespace

// ----------------------------------------------------------------------------
// Метаданные
// ----------------------------------------------------------------------------

AttachmentMap load_metadata(sqlite::Database& db, const schema::SchemaInfo& info) {
    AttachmentMap map;
    if (!info.attachments_available()) {
        return map;
    }

    std::set<std::string> columns;
    for (auto& name : db.table_columns("attachment")) {
        columns.insert(std::move(name));
    }

    const std::string sql = "SELECT maj.message_id, a.ROWID, " + column_or_null(columns, "filename") +
                            ", " + column_or_null(columns, "mime_type") + ", " +
                            column_or_null(columns, "uti") + ", " +
                            column_or_null(columns, "transfer_name") + ", " +
                            column_or_null(columns, "total_bytes") +
                            " FROM message_attachment_join maj"
                            " JOIN attachment a ON a.ROWID = maj.attachment_id"
                            " ORDER BY maj.message_id, a.ROWID";

    sqlite::Statement stmt = db.prepare(sql);
    while (stmt.step()) {
        message::AttachmentRef ref;
        std::int64_t message_rowid = stmt.column_int(0);
        ref.rowid = stmt.column_int(1);
        auto filename = opt_text(stmt, 2);
        ref.mime_type = opt_text(stmt, 3);
        ref.uti = opt_text(stmt, 4);
        ref.transfer_name = opt_text(stmt, 5);
        if (!stmt.column_is_null(6)) {
            ref.total_bytes = stmt.column_int(6);
        }
        if (filename) {
            ref.filename = *filename;
        }
        std::string display = filename ? *filename : ref.transfer_name.value_or("");
        ref.type = message::classify_attachment(ref.mime_type, ref.uti, display);
        map[message_rowid].push_back(std::move(ref));
    }
    return map;
}

std::optional<std::string> backup_relative_path(std::string_view stored) {
    static const std::string_view prefixes[] = {"~/", "/private/var/mobile/", "/var/mobile/"};
    for (std::string_view prefix : prefixes) {
        if (starts_with(stored, prefix)) {
            std::string_view rel = stored.substr(prefix.size());
            if (starts_with(rel, "Library/")) {
                return std::string(rel);
            }
            return std::nullopt;
        }
    }
    if (starts_with(stored, "Library/")) {
        return std::string(stored);
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// LiveSource
// ----------------------------------------------------------------------------

bool LiveSource::resolve(const message::AttachmentRef& ref, Resolution& out) {
    if (ref.filename.empty()) {
        out.reason = "no_filename";
        return false;
    }
    std::filesystem::path path = platform::expand_home(ref.filename, home_);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        out.reason = "missing_on_disk";
        return false;
    }
    out.readable = path;
    out.abs_path = platform::path_to_utf8(path);
    return true;
}

// ----------------------------------------------------------------------------
// BackupSource
// ----------------------------------------------------------------------------

BackupSource::BackupSource(backup::Manifest& manifest, std::filesystem::path scratch_dir)
    : manifest_(manifest), scratch_dir_(std::move(scratch_dir)) {}

bool BackupSource::resolve(const message::AttachmentRef& ref, Resolution& out) {
    if (ref.filename.empty()) {
        out.reason = "no_filename";
        return false;
    }
    auto rel = backup_relative_path(ref.filename);
    if (!rel) {
        out.reason = "not_a_backup_path";
        return false;
    }

    std::optional<backup::FileEntry> entry;
    for (const char* domain : {backup::MEDIA_DOMAIN, backup::HOME_DOMAIN}) {
        entry = manifest_.lookup(domain, *rel);
        if (entry) {
            break;
        }
    }
    if (!entry) {
        out.reason = "not_in_manifest";
        return false;
    }

    auto physical = manifest_.physical_path(entry->file_id);
    if (!physical) {
        out.reason = "missing_in_backup";
        return false;
    }
    out.abs_path = platform::path_to_utf8(*physical);

    if (!manifest_.encrypted()) {
        out.readable = *physical;
        return true;
    }

    // Зашифрованный бэкап: открытые байты только в приватном каталоге
    std::lock_guard<std::mutex> lock(extract_mutex_);
    auto cached = extracted_.find(entry->file_id);
    if (cached != extracted_.end()) {
        out.readable = cached->second;
        return true;
    }
    std::filesystem::path dest = scratch_dir_ / entry->file_id / basename_of(*rel);
    backup::BackupError error;
    if (!manifest_.extract(*entry, dest, error)) {
        out.reason = "decrypt_failed";
        return false;
    }
    extracted_.emplace(entry->file_id, dest);
    out.readable = dest;
    return true;
}

// ----------------------------------------------------------------------------
// Материализация
// ----------------------------------------------------------------------------

std::optional<Materialized> materialize(const std::filesystem::path& src,
                                        const std::filesystem::path& out_dir,
                                        const std::string& name, std::string& error) {
    std::filesystem::path root = out_dir / "attachments";
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        error = ec.message();
        return std::nullopt;
    }

    std::ifstream in(src, std::ios::binary);
    if (!in) {
        error = "cannot open " + platform::redact_path(platform::path_to_utf8(src));
        return std::nullopt;
    }

    // Копия и хэш за один проход: хэш относится к записанным байтам
    std::filesystem::path partial = partial_path(root);
    crypto::Sha256 hasher;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot create " + platform::path_to_utf8(partial);
            return std::nullopt;
        }
        char buffer[64 * 1024];
        while (in) {
            in.read(buffer, sizeof(buffer));
            std::streamsize n = in.gcount();
            if (n <= 0) {
                break;
            }
            out.write(buffer, n);
            hasher.update(buffer, static_cast<std::size_t>(n));
        }
        if (in.bad() || !out.flush()) {
            error = "copy failed for " + platform::redact_path(platform::path_to_utf8(src));
            out.close();
            std::filesystem::remove(partial, ec);
            return std::nullopt;
        }
    }

    Materialized result;
    result.sha256 = hasher.final_hex();
    std::string leaf = name.empty() ? result.sha256 : name;
    std::filesystem::path dir = root / result.sha256.substr(0, 2) / result.sha256;
    result.path = dir / leaf;

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error = ec.message();
        std::filesystem::remove(partial, ec);
        return std::nullopt;
    }

    if (std::filesystem::is_regular_file(result.path, ec)) {
        auto existing = crypto::sha256_file(result.path);
        if (existing && *existing == result.sha256) {
            result.reused = true;
            std::filesystem::remove(partial, ec);
            return result;
        }
    }

    std::filesystem::rename(partial, result.path, ec);
    if (ec) {
        error = ec.message();
        std::filesystem::remove(partial, ec);
        return std::nullopt;
    }
    return result;
}

// ----------------------------------------------------------------------------
// Resolver
// ----------------------------------------------------------------------------

Resolver::Resolver(ByteSource& source, ResolverOptions options, output::Writer& writer)
    : source_(source), options_(std::move(options)), writer_(writer) {}

void Resolver::run(std::vector<message::CanonicalMessage>& messages, AttachmentMap metadata,
                   const std::atomic<bool>* cancel) {
    // Присоединение метаданных последовательно: ROWID берётся из source_meta
    std::vector<std::size_t> targets;
    for (std::size_t i = 0; i < messages.size(); ++i) {
        const Value* rowid = messages[i].source_meta.get("rowid");
        std::int64_t id = 0;
        if (rowid == nullptr || !rowid->to_int64(id)) {
            continue;
        }
        auto it = metadata.find(id);
        if (it == metadata.end()) {
            continue;
        }
        messages[i].attachments = std::move(it->second);
        targets.push_back(i);
    }

    // Каждый воркер пишет только в свой слот: порядок вывода не зависит от потоков
    std::vector<std::vector<message::MissingAttachment>> slots(targets.size());
    std::atomic<std::size_t> total{0};
    std::atomic<std::size_t> resolved{0};
    std::atomic<std::size_t> copied{0};
    std::atomic<std::size_t> copy_failed{0};

    parallel_for(
        targets.size(), options_.workers,
        [&](std::size_t n) {
            message::CanonicalMessage& msg = messages[targets[n]];
            bool unresolved = false;
            for (auto& ref : msg.attachments) {
                ++total;
                Resolution res;
                if (!source_.resolve(ref, res)) {
                    unresolved = true;
                    message::MissingAttachment item;
                    item.conv_id = msg.conv_id;
                    item.msg_id = msg.msg_id;
                    item.filename = !ref.filename.empty()
                                        ? ref.filename
                                        : ref.transfer_name.value_or(
                                              "attachment_" + std::to_string(ref.rowid));
                    item.attachment_rowid = ref.rowid;
                    item.reason = res.reason;
                    slots[n].push_back(std::move(item));
                    continue;
                }

                ++resolved;
                ref.abs_path = res.abs_path;
                ref.local_path = platform::path_to_utf8(res.readable);

                if (!options_.copy_binaries) {
                    continue;
                }
                std::string name = ref.transfer_name.value_or(basename_of(ref.filename));
                std::string error;
                auto copy = materialize(res.readable, options_.out_dir, basename_of(name), error);
                if (!copy) {
                    ++copy_failed;
                    writer_.warn(msg.msg_id + ": attachment copy failed: " + error);
                    continue;
                }
                ++copied;
                ref.abs_path = platform::path_to_utf8(copy->path);
                ref.local_path = ref.abs_path;
                ref.sha256 = copy->sha256;
            }
            if (unresolved) {
                msg.source_meta.set("attachment_unresolved", Value(true));
            }
        },
        cancel);

    missing_.clear();
    for (auto& slot : slots) {
        for (auto& item : slot) {
            missing_.push_back(std::move(item));
        }
    }

    stats_.total = total.load();
    stats_.resolved = resolved.load();
    stats_.missing = missing_.size();
    stats_.copied = copied.load();
    stats_.copy_failed = copy_failed.load();

    if (!missing_.empty()) {
        writer_.warn(std::to_string(missing_.size()) +
                     " attachment(s) missing, see missing_attachments.json");
    }
}

// ----------------------------------------------------------------------------
// missing_attachments.json
// ----------------------------------------------------------------------------

rapidjson::Document missing_report(const std::vector<message::MissingAttachment>& missing) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    auto str = [&](const std::string& s) {
        return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    };

    // Группы в порядке первого появления беседы
    std::vector<std::string> order;
    std::map<std::string, std::vector<const message::MissingAttachment*>> groups;
    for (const auto& item : missing) {
        auto& group = groups[item.conv_id];
        if (group.empty()) {
            order.push_back(item.conv_id);
        }
        group.push_back(&item);
    }

    doc.AddMember("total_missing", static_cast<std::uint64_t>(missing.size()), alloc);

    rapidjson::Value conversations(rapidjson::kArrayType);
    for (const auto& conv : order) {
        const auto& group = groups[conv];
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("conv_id", str(conv), alloc);
        entry.AddMember("count", static_cast<std::uint64_t>(group.size()), alloc);
        rapidjson::Value items(rapidjson::kArrayType);
        for (const auto* item : group) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("msg_id", str(item->msg_id), alloc);
            obj.AddMember("filename", str(item->filename), alloc);
            obj.AddMember("attachment_rowid", static_cast<std::int64_t>(item->attachment_rowid),
                          alloc);
            obj.AddMember("reason", str(item->reason), alloc);
            items.PushBack(obj, alloc);
        }
        entry.AddMember("items", items, alloc);
        conversations.PushBack(entry, alloc);
    }
    doc.AddMember("conversations", conversations, alloc);

    rapidjson::Value steps(rapidjson::kArrayType);
    for (const char* step : REMEDIATION_STEPS) {
        steps.PushBack(rapidjson::StringRef(step), alloc);
    }
    doc.AddMember("remediation", steps, alloc);
    return doc;
}

}  // namespace chatx::attachments
