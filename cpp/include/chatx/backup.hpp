// ==============================================================================
// chatx/backup.hpp - Резервные копии MobileSync (обычные и зашифрованные)
// ==============================================================================
//
// Назначение:
// - Предварительная проверка структуры каталога бэкапа
// - Определение шифрования по Status.plist / Manifest.plist / Info.plist
// - BackupKeyBag: разбор TLV и разблокировка паролем
// - Manifest: поиск fileID по (domain, relativePath), физический путь,
//   извлечение файла (копия или расшифровка) в приватный каталог
//
// Схема зашифрованного бэкапа:
//   пароль --PBKDF2-SHA256(DPSL,DPIC)--> --PBKDF2-SHA1(SALT,ITER)--> passcode key
//   passcode key --unwrap--> class keys (WRAP & 2)
//   ManifestKey = class(4, LE) + wrapped key --unwrap--> ключ Manifest.db
//   Files.file (MBFile) EncryptionKey = class(4, LE) + wrapped key --> ключ файла
//   данные: AES-256-CBC, нулевой IV, PKCS#7, обрезка до MBFile.Size
//
// ==============================================================================

#ifndef CHATX_BACKUP_HPP
#define CHATX_BACKUP_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatx::backup {

using Bytes = std::vector<std::uint8_t>;

// Домены и пути базы сообщений внутри бэкапа
constexpr const char* HOME_DOMAIN = "HomeDomain";
constexpr const char* MEDIA_DOMAIN = "MediaDomain";
constexpr const char* SMS_DB_PATH = "Library/SMS/sms.db";

/// Подсказка о каноническом расположении бэкапов macOS
constexpr const char* MOBILESYNC_HINT = "~/Library/Application Support/MobileSync/Backup/<UDID>";

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class BackupErrorKind {
    NotFound,            // каталог бэкапа отсутствует
    ManifestMissing,     // нет Manifest.db / Manifest.plist или не читается
    EntryMissing,        // нет записи в Files или физического файла
    NeedsPassword,       // бэкап зашифрован, пароль не передан
    DecryptFailed,       // неверный пароль / повреждённые ключи
    DecryptTimeout,      // вывод ключа не уложился в таймаут
    Io                   // ошибка копирования/записи
};

struct BackupError {
    BackupErrorKind kind = BackupErrorKind::Io;
    std::string message;
    std::string path;

    std::string format() const;
};

// ----------------------------------------------------------------------------
// Предварительная проверка
// ----------------------------------------------------------------------------

struct Preflight {
    bool exists = false;
    bool manifest_db = false;
    bool manifest_plist = false;
    bool info_plist = false;
    bool status_plist = false;
    bool shards_present = false;  // каталоги 00..ff
};

Preflight preflight(const std::filesystem::path& root);

/// true/false если определимо, std::nullopt иначе
std::optional<bool> detect_encryption(const std::filesystem::path& root);

/// fileID = SHA1("<domain>-<relativePath>")
std::string file_id_for(const std::string& domain, const std::string& relative_path);

// ----------------------------------------------------------------------------
// Keybag
// ----------------------------------------------------------------------------

struct ClassKey {
    std::uint32_t protection_class = 0;
    std::uint32_t wrap = 0;
    Bytes wrapped_key;          // WPKY
    std::optional<Bytes> key;   // после unlock()
};

class Keybag {
public:
    /// Разобрать TLV блоб BackupKeyBag; std::nullopt при повреждении
    static std::optional<Keybag> parse(const Bytes& blob);

    /// Вывести ключ из пароля и развернуть классовые ключи.
    /// false при неверном пароле.
    bool unlock(const std::string& password);

    /// Развернуть ключ, обёрнутый ключом класса protection_class
    std::optional<Bytes> unwrap_for_class(std::uint32_t protection_class,
                                          const Bytes& wrapped) const;

    std::uint32_t iterations() const { return iter_; }
    std::uint32_t dp_iterations() const { return dpic_; }
    std::size_t class_count() const { return classes_.size(); }

private:
    std::uint32_t type_ = 0;
    Bytes uuid_;
    Bytes salt_;
    std::uint32_t iter_ = 0;
    Bytes dpsl_;
    std::uint32_t dpic_ = 0;
    std::map<std::uint32_t, ClassKey> classes_;
};

// ----------------------------------------------------------------------------
// Manifest
// ----------------------------------------------------------------------------

struct FileEntry {
    std::string file_id;
    std::string domain;
    std::string relative_path;
    std::optional<std::uint32_t> protection_class;  // только в зашифрованных бэкапах
    Bytes wrapped_key;                              // без 4-байтного префикса класса
    std::optional<std::uint64_t> size;
};

struct OpenOptions {
    std::optional<std::string> password;
    std::filesystem::path work_dir;  // сюда пишется расшифрованный Manifest.db
    std::chrono::seconds decrypt_timeout{300};
};

class Manifest {
public:
    /// Открыть бэкап. При ошибке возвращает nullptr и заполняет error.
    static std::unique_ptr<Manifest> open(const std::filesystem::path& root,
                                          const OpenOptions& options, BackupError& error);

    ~Manifest();

    Manifest(const Manifest&) = delete;
    Manifest& operator=(const Manifest&) = delete;

    bool encrypted() const;
    const std::filesystem::path& root() const;

    /// Найти запись Files по домену и относительному пути (потокобезопасно)
    std::optional<FileEntry> lookup(const std::string& domain, const std::string& relative_path);

    /// Физический путь: <root>/<id[0:2]>/<id>, иначе плоский <root>/<id>
    std::optional<std::filesystem::path> physical_path(const std::string& file_id) const;

    /// Скопировать (или расшифровать) файл записи в dest
    bool extract(const FileEntry& entry, const std::filesystem::path& dest, BackupError& error);

private:
    Manifest();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chatx::backup

#endif  // CHATX_BACKUP_HPP
