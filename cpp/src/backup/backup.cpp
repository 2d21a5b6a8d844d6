// ==============================================================================
// backup.cpp - Резервные копии MobileSync (обычные и зашифрованные)
// ==============================================================================

#include "chatx/backup.hpp"

#include "chatx/codec.hpp"
#include "chatx/crypto.hpp"
#include "chatx/platform.hpp"
#include "chatx/plist.hpp"
#include "chatx/sqlite.hpp"

#include <cstring>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>

namespace chatx::backup {

namespace {

constexpr std::uint32_t WRAP_PASSCODE = 2;
constexpr std::size_t KEY_SIZE = 32;
constexpr const char* SQLITE_MAGIC = "SQLite format 3";

bool is_hex2(const std::string& name) {
    auto hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };
    return name.size() == 2 && hex(name[0]) && hex(name[1]);
}

bool has_sqlite_header(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    char header[16] = {};
    in.read(header, sizeof(header));
    return in.gcount() == static_cast<std::streamsize>(sizeof(header)) &&
           std::memcmp(header, SQLITE_MAGIC, std::strlen(SQLITE_MAGIC)) == 0;
}

std::uint32_t be32(const Bytes& v) {
    return static_cast<std::uint32_t>(codec::read_be(v.data(), 4));
}

const Bytes* bytes_field(const Value& obj, const char* key) {
    const Value* v = obj.get(key);
    return v ? v->get_bytes() : nullptr;
}

/// Разделить "class(4, LE) + wrapped key"
bool split_class_key(const Bytes& blob, std::uint32_t& protection_class, Bytes& wrapped) {
    if (blob.size() <= 4) {
        return false;
    }
    protection_class = codec::read_le32(blob.data());
    wrapped.assign(blob.begin() + 4, blob.end());
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// BackupError
// ----------------------------------------------------------------------------

std::string BackupError::format() const {
    std::string prefix;
    switch (kind) {
    case BackupErrorKind::NotFound:
        prefix = "backup not found";
        break;
    case BackupErrorKind::ManifestMissing:
        prefix = "backup manifest missing";
        break;
    case BackupErrorKind::EntryMissing:
        prefix = "backup entry missing";
        break;
    case BackupErrorKind::NeedsPassword:
        prefix = "backup is encrypted";
        break;
    case BackupErrorKind::DecryptFailed:
        prefix = "backup decryption failed";
        break;
    case BackupErrorKind::DecryptTimeout:
        prefix = "backup key derivation timed out";
        break;
    case BackupErrorKind::Io:
        prefix = "backup i/o error";
        break;
    }
    std::string out = prefix + ": " + message;
    if (!path.empty()) {
        out += " (" + path + ")";
    }
    return out;
}

// ----------------------------------------------------------------------------
// Предварительная проверка
// ----------------------------------------------------------------------------

Preflight preflight(const std::filesystem::path& root) {
    Preflight result;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return result;
    }
    result.exists = true;
    result.manifest_db = std::filesystem::is_regular_file(root / "Manifest.db", ec);
    result.manifest_plist = std::filesystem::is_regular_file(root / "Manifest.plist", ec);
    result.info_plist = std::filesystem::is_regular_file(root / "Info.plist", ec);
    result.status_plist = std::filesystem::is_regular_file(root / "Status.plist", ec);

    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        if (entry.is_directory(ec) && is_hex2(entry.path().filename().string())) {
            result.shards_present = true;
            break;
        }
    }
    return result;
}

std::optional<bool> detect_encryption(const std::filesystem::path& root) {
    for (const char* name : {"Status.plist", "Manifest.plist", "Info.plist"}) {
        std::filesystem::path path = root / name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            continue;
        }
        // Ошибки разбора: файл не даёт ответа, смотрим следующий
        auto doc = plist::parse_file(path);
        if (!doc) {
            continue;
        }
        for (const char* key : {"IsEncrypted", "Encrypted", "UsesEncryptedBackups"}) {
            const Value* v = doc->get(key);
            if (v == nullptr) {
                continue;
            }
            if (const bool* b = v->get_bool()) {
                return *b;
            }
            std::int64_t n = 0;
            if (v->to_int64(n)) {
                return n != 0;
            }
        }
    }
    return std::nullopt;
}

std::string file_id_for(const std::string& domain, const std::string& relative_path) {
    return crypto::sha1_hex(domain + "-" + relative_path);
}

// ----------------------------------------------------------------------------
// Keybag
// ----------------------------------------------------------------------------

std::optional<Keybag> Keybag::parse(const Bytes& blob) {
    Keybag kb;
    std::optional<ClassKey> current;
    bool have_uuid = false;

    std::size_t pos = 0;
    while (pos + 8 <= blob.size()) {
        std::string tag(reinterpret_cast<const char*>(blob.data() + pos), 4);
        std::uint64_t len = codec::read_be(blob.data() + pos + 4, 4);
        pos += 8;
        if (len > blob.size() - pos) {
            return std::nullopt;
        }
        Bytes value(blob.begin() + static_cast<std::ptrdiff_t>(pos),
                    blob.begin() + static_cast<std::ptrdiff_t>(pos + len));
        pos += static_cast<std::size_t>(len);

        bool is_int = value.size() == 4;

        if (tag == "UUID") {
            if (!have_uuid) {
                kb.uuid_ = value;
                have_uuid = true;
            } else {
                // Каждый следующий UUID открывает новый классовый ключ
                if (current) {
                    kb.classes_[current->protection_class] = *current;
                }
                current = ClassKey{};
            }
            continue;
        }

        if (current) {
            if (tag == "CLAS" && is_int) {
                current->protection_class = be32(value);
            } else if (tag == "WRAP" && is_int) {
                current->wrap = be32(value);
            } else if (tag == "WPKY") {
                current->wrapped_key = value;
            }
            continue;
        }

        if (tag == "TYPE" && is_int) {
            kb.type_ = be32(value);
        } else if (tag == "SALT") {
            kb.salt_ = value;
        } else if (tag == "ITER" && is_int) {
            kb.iter_ = be32(value);
        } else if (tag == "DPSL") {
            kb.dpsl_ = value;
        } else if (tag == "DPIC" && is_int) {
            kb.dpic_ = be32(value);
        }
    }
    if (pos != blob.size()) {
        return std::nullopt;
    }
    if (current) {
        kb.classes_[current->protection_class] = *current;
    }
    if (kb.salt_.empty() || kb.iter_ == 0 || kb.classes_.empty()) {
        return std::nullopt;
    }
    return kb;
}

bool Keybag::unlock(const std::string& password) {
    Bytes secret(password.begin(), password.end());
    if (!dpsl_.empty() && dpic_ > 0) {
        secret = crypto::pbkdf2_sha256(secret, dpsl_, dpic_, KEY_SIZE);
    }
    Bytes passcode_key = crypto::pbkdf2_sha1(secret, salt_, iter_, KEY_SIZE);

    bool any = false;
    for (auto& [cls, ck] : classes_) {
        if (ck.wrapped_key.empty() || (ck.wrap & WRAP_PASSCODE) == 0) {
            continue;
        }
        auto key = crypto::aes_key_unwrap(passcode_key, ck.wrapped_key);
        if (!key) {
            return false;
        }
        ck.key = std::move(*key);
        any = true;
    }
    return any;
}

std::optional<Bytes> Keybag::unwrap_for_class(std::uint32_t protection_class,
                                              const Bytes& wrapped) const {
    auto it = classes_.find(protection_class);
    if (it == classes_.end() || !it->second.key) {
        return std::nullopt;
    }
    return crypto::aes_key_unwrap(*it->second.key, wrapped);
}

// ----------------------------------------------------------------------------
// Manifest::Impl
// ----------------------------------------------------------------------------

class Manifest::Impl {
public:
    std::filesystem::path root;
    std::optional<sqlite::Database> db;
    std::optional<Keybag> keybag;
    bool encrypted = false;
    bool has_file_column = false;
    std::mutex mutex;

    bool fail(BackupError& error, BackupErrorKind kind, std::string message,
              const std::filesystem::path& path) {
        error = BackupError{kind, std::move(message), platform::path_to_utf8(path)};
        return false;
    }

    /// Разблокировать keybag в отдельном потоке с таймаутом
    bool unlock_with_timeout(Keybag kb, const std::string& password,
                             std::chrono::seconds timeout, BackupError& error) {
        auto shared = std::make_shared<Keybag>(std::move(kb));
        std::promise<bool> promise;
        std::future<bool> result = promise.get_future();

        std::thread worker([shared, password, p = std::move(promise)]() mutable {
            try {
                p.set_value(shared->unlock(password));
            } catch (const std::exception&) {
                p.set_exception(std::current_exception());
            }
        });

        if (result.wait_for(timeout) != std::future_status::ready) {
            // PBKDF2 не прерывается: поток доживает в фоне, владея своей копией
            worker.detach();
            return fail(error, BackupErrorKind::DecryptTimeout,
                        "key derivation exceeded " + std::to_string(timeout.count()) + "s",
                        root);
        }
        worker.join();

        bool unlocked = false;
        try {
            unlocked = result.get();
        } catch (const std::exception& e) {
            return fail(error, BackupErrorKind::DecryptFailed, e.what(), root);
        }
        if (!unlocked) {
            return fail(error, BackupErrorKind::DecryptFailed,
                        "wrong password or corrupt keybag", root);
        }
        keybag = *shared;
        return true;
    }

    bool open_encrypted(const OpenOptions& options, BackupError& error) {
        if (!options.password || options.password->empty()) {
            return fail(error, BackupErrorKind::NeedsPassword,
                        "provide a backup password or create an unencrypted backup", root);
        }

        plist::PlistError perr;
        auto manifest_plist = plist::parse_file(root / "Manifest.plist", &perr);
        if (!manifest_plist) {
            return fail(error, BackupErrorKind::ManifestMissing, perr.format(),
                        root / "Manifest.plist");
        }
        const Bytes* keybag_blob = bytes_field(*manifest_plist, "BackupKeyBag");
        const Bytes* manifest_key = bytes_field(*manifest_plist, "ManifestKey");
        if (keybag_blob == nullptr || manifest_key == nullptr) {
            return fail(error, BackupErrorKind::ManifestMissing,
                        "Manifest.plist lacks BackupKeyBag or ManifestKey",
                        root / "Manifest.plist");
        }

        auto kb = Keybag::parse(*keybag_blob);
        if (!kb) {
            return fail(error, BackupErrorKind::ManifestMissing, "BackupKeyBag is corrupt",
                        root / "Manifest.plist");
        }
        if (!unlock_with_timeout(std::move(*kb), *options.password, options.decrypt_timeout,
                                 error)) {
            return false;
        }

        std::uint32_t cls = 0;
        Bytes wrapped;
        if (!split_class_key(*manifest_key, cls, wrapped)) {
            return fail(error, BackupErrorKind::DecryptFailed, "ManifestKey too short", root);
        }
        auto key = keybag->unwrap_for_class(cls, wrapped);
        if (!key) {
            return fail(error, BackupErrorKind::DecryptFailed, "cannot unwrap ManifestKey", root);
        }

        std::filesystem::path plain = options.work_dir / "Manifest.db";
        try {
            if (!crypto::aes256_cbc_decrypt_file(*key, Bytes(16, 0), root / "Manifest.db", plain,
                                                 std::nullopt)) {
                return fail(error, BackupErrorKind::DecryptFailed,
                            "cannot decrypt Manifest.db", root / "Manifest.db");
            }
        } catch (const crypto::CryptoError& e) {
            return fail(error, BackupErrorKind::DecryptFailed, e.what(), root / "Manifest.db");
        }
        if (!has_sqlite_header(plain)) {
            return fail(error, BackupErrorKind::DecryptFailed,
                        "decrypted Manifest.db is not a database", root / "Manifest.db");
        }
        return open_db(plain, error);
    }

    bool open_db(const std::filesystem::path& path, BackupError& error) {
        try {
            db.emplace(path, sqlite::OpenMode::ReadOnly);
            if (!db->table_exists("Files")) {
                return fail(error, BackupErrorKind::ManifestMissing,
                            "Manifest.db has no Files table", path);
            }
            for (const auto& col : db->table_columns("Files")) {
                if (col == "file") {
                    has_file_column = true;
                }
            }
        } catch (const sqlite::SqliteError& e) {
            return fail(error, BackupErrorKind::ManifestMissing, e.what(), path);
        }
        return true;
    }

    /// Разобрать архив MBFile из Files.file
    void decode_mbfile(const Bytes& blob, FileEntry& entry) {
        auto archive = plist::parse(blob);
        if (!archive) {
            return;
        }
        auto mbfile = plist::unarchive_top(*archive, "root");
        if (!mbfile || !mbfile->is_object()) {
            return;
        }
        std::int64_t n = 0;
        if (const Value* pc = mbfile->get("ProtectionClass"); pc && pc->to_int64(n)) {
            entry.protection_class = static_cast<std::uint32_t>(n);
        }
        if (const Value* size = mbfile->get("Size"); size && size->to_int64(n) && n >= 0) {
            entry.size = static_cast<std::uint64_t>(n);
        }
        if (const Bytes* key = bytes_field(*mbfile, "EncryptionKey")) {
            std::uint32_t cls = 0;
            Bytes wrapped;
            if (split_class_key(*key, cls, wrapped)) {
                entry.wrapped_key = std::move(wrapped);
                if (!entry.protection_class) {
                    entry.protection_class = cls;
                }
            }
        }
    }
};

// ----------------------------------------------------------------------------
// Manifest
// ----------------------------------------------------------------------------

Manifest::Manifest() : impl_(std::make_unique<Impl>()) {}

Manifest::~Manifest() = default;

std::unique_ptr<Manifest> Manifest::open(const std::filesystem::path& root,
                                         const OpenOptions& options, BackupError& error) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        error = BackupError{BackupErrorKind::NotFound,
                            std::string("expected a directory like ") + MOBILESYNC_HINT,
                            platform::path_to_utf8(root)};
        return nullptr;
    }

    std::filesystem::path manifest_db = root / "Manifest.db";
    if (!std::filesystem::is_regular_file(manifest_db, ec)) {
        error = BackupError{BackupErrorKind::ManifestMissing,
                            std::string("Manifest.db not found; expected ") + MOBILESYNC_HINT,
                            platform::path_to_utf8(manifest_db)};
        return nullptr;
    }

    std::unique_ptr<Manifest> manifest(new Manifest());
    Impl& impl = *manifest->impl_;
    impl.root = root;

    auto flagged = detect_encryption(root);
    impl.encrypted = flagged.value_or(false) ||
                     (!has_sqlite_header(manifest_db) &&
                      std::filesystem::is_regular_file(root / "Manifest.plist", ec));

    bool ok = impl.encrypted ? impl.open_encrypted(options, error) : impl.open_db(manifest_db, error);
    if (!ok) {
        return nullptr;
    }
    return manifest;
}

bool Manifest::encrypted() const {
    return impl_->encrypted;
}

const std::filesystem::path& Manifest::root() const {
    return impl_->root;
}

std::optional<FileEntry> Manifest::lookup(const std::string& domain,
                                          const std::string& relative_path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::string sql = impl_->has_file_column
                          ? "SELECT fileID, file FROM Files WHERE domain = ?1 AND relativePath = ?2"
                          : "SELECT fileID FROM Files WHERE domain = ?1 AND relativePath = ?2";

    std::vector<std::string> candidates{relative_path};
    std::string stripped = relative_path;
    while (!stripped.empty() && stripped.front() == '/') {
        stripped.erase(stripped.begin());
    }
    if (stripped != relative_path) {
        candidates.push_back(stripped);
    }

    for (const auto& candidate : candidates) {
        sqlite::Statement stmt = impl_->db->prepare(sql);
        stmt.bind_text(1, domain);
        stmt.bind_text(2, candidate);
        if (!stmt.step() || stmt.column_is_null(0)) {
            continue;
        }
        FileEntry entry;
        entry.file_id = stmt.column_text(0);
        entry.domain = domain;
        entry.relative_path = candidate;
        if (impl_->has_file_column && !stmt.column_is_null(1)) {
            impl_->decode_mbfile(stmt.column_blob(1), entry);
        }
        if (!entry.file_id.empty()) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> Manifest::physical_path(const std::string& file_id) const {
    if (file_id.size() < 2) {
        return std::nullopt;
    }
    std::error_code ec;
    std::filesystem::path sharded = impl_->root / file_id.substr(0, 2) / file_id;
    if (std::filesystem::is_regular_file(sharded, ec)) {
        return sharded;
    }
    std::filesystem::path flat = impl_->root / file_id;
    if (std::filesystem::is_regular_file(flat, ec)) {
        return flat;
    }
    return std::nullopt;
}

bool Manifest::extract(const FileEntry& entry, const std::filesystem::path& dest,
                       BackupError& error) {
    auto source = physical_path(entry.file_id);
    if (!source) {
        error = BackupError{BackupErrorKind::EntryMissing,
                            "no physical file for " + entry.domain + ":" + entry.relative_path,
                            platform::path_to_utf8(impl_->root / entry.file_id)};
        return false;
    }

    std::error_code ec;
    if (dest.has_parent_path()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
    }

    if (!impl_->encrypted) {
        std::filesystem::copy_file(*source, dest, std::filesystem::copy_options::overwrite_existing,
                                   ec);
        if (ec) {
            error = BackupError{BackupErrorKind::Io, ec.message(), platform::path_to_utf8(dest)};
            return false;
        }
        return true;
    }

    if (!entry.protection_class || entry.wrapped_key.empty() || !impl_->keybag) {
        error = BackupError{BackupErrorKind::DecryptFailed,
                            "no encryption key for " + entry.domain + ":" + entry.relative_path,
                            platform::path_to_utf8(*source)};
        return false;
    }
    auto key = impl_->keybag->unwrap_for_class(*entry.protection_class, entry.wrapped_key);
    if (!key) {
        error = BackupError{BackupErrorKind::DecryptFailed, "cannot unwrap file key",
                            platform::path_to_utf8(*source)};
        return false;
    }
    try {
        if (!crypto::aes256_cbc_decrypt_file(*key, Bytes(16, 0), *source, dest, entry.size)) {
            error = BackupError{BackupErrorKind::Io, "cannot decrypt file",
                                platform::path_to_utf8(*source)};
            return false;
        }
    } catch (const crypto::CryptoError& e) {
        error = BackupError{BackupErrorKind::DecryptFailed, e.what(),
                            platform::path_to_utf8(*source)};
        return false;
    }
    return true;
}

}  // namespace chatx::backup
