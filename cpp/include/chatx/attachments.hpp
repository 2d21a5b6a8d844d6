// ==============================================================================
// chatx/attachments.hpp - Attachment Resolver
// ==============================================================================
//
// Назначение:
// - Метаданные вложений: attachment через message_attachment_join
// - ByteSource: где лежат байты вложения
//     LiveSource   - путь из attachment.filename ("~" раскрывается)
//     BackupSource - (MediaDomain | HomeDomain, Library/SMS/Attachments/...)
//                    через тот же Manifest, что и при staging
// - Материализация: потоковое копирование с SHA-256 в
//     <out>/attachments/<sha[0:2]>/<sha>/<basename>
//   повторный прогон переиспользует идентичную копию
// - Список отсутствующих вложений, сгруппированный по беседам
//
// Отсутствующее вложение не ломает сообщение: оно выводится с
// abs_path = null и source_meta.attachment_unresolved = true.
//
// ==============================================================================

#ifndef CHATX_ATTACHMENTS_HPP
#define CHATX_ATTACHMENTS_HPP

#include <chatx/message.hpp>
#include <chatx/schema.hpp>
#include <chatx/sqlite.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace chatx::backup {
class Manifest;
}

namespace chatx::output {
class Writer;
}

namespace chatx::attachments {

/// Вложения по ROWID сообщения, в порядке строк join таблицы
using AttachmentMap = std::map<std::int64_t, std::vector<message::AttachmentRef>>;

/// Прочитать метаданные; пусто если таблиц вложений нет
AttachmentMap load_metadata(sqlite::Database& db, const schema::SchemaInfo& info);

/// "~/Library/SMS/Attachments/ab/12/x.jpg" → "Library/SMS/Attachments/ab/12/x.jpg".
/// std::nullopt если путь не относится к домашнему каталогу устройства.
std::optional<std::string> backup_relative_path(std::string_view stored);

// ----------------------------------------------------------------------------
// ByteSource
// ----------------------------------------------------------------------------

struct Resolution {
    std::filesystem::path readable;  // локальный файл с открытыми байтами
    std::string abs_path;            // путь для записи в AttachmentRef
    std::string reason;              // причина при неудаче
};

class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Найти байты вложения; false и reason при неудаче. Потокобезопасно.
    virtual bool resolve(const message::AttachmentRef& ref, Resolution& out) = 0;
};

class LiveSource : public ByteSource {
public:
    explicit LiveSource(std::filesystem::path home) : home_(std::move(home)) {}

    bool resolve(const message::AttachmentRef& ref, Resolution& out) override;

private:
    std::filesystem::path home_;
};

class BackupSource : public ByteSource {
public:
    /// scratch_dir: куда расшифровываются файлы зашифрованного бэкапа
    BackupSource(backup::Manifest& manifest, std::filesystem::path scratch_dir);

    bool resolve(const message::AttachmentRef& ref, Resolution& out) override;

private:
    backup::Manifest& manifest_;
    std::filesystem::path scratch_dir_;
    std::mutex extract_mutex_;
    std::map<std::string, std::filesystem::path> extracted_;  // fileID → файл
};

// ----------------------------------------------------------------------------
// Материализация
// ----------------------------------------------------------------------------

struct Materialized {
    std::filesystem::path path;
    std::string sha256;
    bool reused = false;  // идентичная копия уже была на месте
};

/// Скопировать src в out_dir/attachments/<sha[0:2]>/<sha>/<name>.
/// Хэш считается по скопированным байтам. std::nullopt и error при ошибке.
std::optional<Materialized> materialize(const std::filesystem::path& src,
                                        const std::filesystem::path& out_dir,
                                        const std::string& name, std::string& error);

// ----------------------------------------------------------------------------
// Resolver
// ----------------------------------------------------------------------------

struct ResolverOptions {
    bool copy_binaries = false;
    int workers = 4;
    std::filesystem::path out_dir;
};

struct AttachmentStats {
    std::size_t total = 0;
    std::size_t resolved = 0;
    std::size_t missing = 0;
    std::size_t copied = 0;
    std::size_t copy_failed = 0;
};

class Resolver {
public:
    Resolver(ByteSource& source, ResolverOptions options, output::Writer& writer);

    /// Присоединить вложения к сообщениям и разрешить их байты
    void run(std::vector<message::CanonicalMessage>& messages, AttachmentMap metadata,
             const std::atomic<bool>* cancel = nullptr);

    const AttachmentStats& stats() const { return stats_; }

    /// Отсутствующие вложения в порядке сообщений
    const std::vector<message::MissingAttachment>& missing() const { return missing_; }

private:
    ByteSource& source_;
    ResolverOptions options_;
    output::Writer& writer_;
    AttachmentStats stats_;
    std::vector<message::MissingAttachment> missing_;
};

/// Документ missing_attachments.json: группы по беседам и шаги исправления
rapidjson::Document missing_report(const std::vector<message::MissingAttachment>& missing);

}  // namespace chatx::attachments

#endif  // CHATX_ATTACHMENTS_HPP
