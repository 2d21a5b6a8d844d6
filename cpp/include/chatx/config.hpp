// ==============================================================================
// chatx/config.hpp - Конфигурация извлечения
// ==============================================================================
//
// Назначение:
// - ExtractConfig: все параметры прогона (источник, вывод, вложения,
//   транскрипция, staging, фильтр)
// - Загрузка из YAML (yaml-cpp) с проверкой значений
// - Наложение флагов CLI поверх файла
// - Разрешение пароля резервной копии (config → env → password file)
//
// Формат файла:
//
//   source:
//     db: ~/Library/Messages/chat.db     # либо backup
//     backup: /path/to/MobileSync/Backup/<udid>
//     home: /Users/someone               # для "~" в путях вложений
//     password_env: CHATX_BACKUP_PASSWORD
//     password_file: /path/to/secret
//   output:
//     dir: out
//   attachments:
//     include: true
//     copy_binaries: false
//     workers: 4
//   transcription:
//     mode: off                          # off | fixed | local
//     engine_path: /usr/local/bin/whisper-cli
//     model_path: /models/ggml-base.bin
//     language: auto
//     timeout_seconds: 120
//     fixed_text: "[transcript]"
//   staging:
//     retain: false
//     work_dir: ""
//     timeout_seconds: 30
//     decrypt_timeout_seconds: 300
//     wal_audit: true
//   filter:
//     conversation: iMessage;-;+15555550100
//
// ==============================================================================

#ifndef CHATX_CONFIG_HPP
#define CHATX_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace chatx::config {

// ----------------------------------------------------------------------------
// Секции
// ----------------------------------------------------------------------------

enum class SourceKind { Live, Backup };

struct SourceConfig {
    SourceKind kind = SourceKind::Live;
    std::filesystem::path db_path;      // live chat.db
    std::filesystem::path backup_root;  // каталог MobileSync backup
    std::filesystem::path home;         // для раскрытия "~" (пусто = $HOME)
    std::optional<std::string> password;
    std::string password_env = "CHATX_BACKUP_PASSWORD";
    std::filesystem::path password_file;
};

struct OutputSection {
    std::filesystem::path dir = "out";
};

struct AttachmentConfig {
    bool include = true;
    bool copy_binaries = false;
    int workers = 4;
};

enum class TranscriptionMode { Off, Fixed, Local };

struct TranscriptionConfig {
    TranscriptionMode mode = TranscriptionMode::Off;
    std::filesystem::path engine_path;
    std::filesystem::path model_path;
    std::string language = "auto";
    int timeout_seconds = 120;
    std::string fixed_text = "[transcript unavailable]";
};

struct StagingConfig {
    bool retain = false;
    std::filesystem::path work_dir;
    int timeout_seconds = 30;
    int decrypt_timeout_seconds = 300;
    bool wal_audit = true;
};

struct FilterConfig {
    std::optional<std::string> conversation;  // guid чата
};

struct ExtractConfig {
    SourceConfig source;
    OutputSection output;
    AttachmentConfig attachments;
    TranscriptionConfig transcription;
    StagingConfig staging;
    FilterConfig filter;
};

// ----------------------------------------------------------------------------
// Ошибки конфигурации
// ----------------------------------------------------------------------------

enum class ConfigErrorKind {
    FileNotFound,  // файл конфигурации не существует
    ParseError,    // YAML синтаксис
    InvalidValue,  // значение вне допустимого набора/диапазона
    MissingSource  // не задан ни db, ни backup
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::InvalidValue;
    std::string message;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    ExtractConfig config;
    ConfigError error;
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию из YAML файла поверх значений по умолчанию
LoadResult load_file(const std::filesystem::path& path);

/// Загрузить конфигурацию из YAML текста (для тестов и встраивания)
LoadResult load_string(const std::string& yaml_text);

/// Разобрать режим транскрипции ("off" | "fixed" | "local")
std::optional<TranscriptionMode> parse_transcription_mode(const std::string& text);

const char* transcription_mode_name(TranscriptionMode mode);

const char* source_kind_name(SourceKind kind);

/// Проверить итоговую конфигурацию (после наложения CLI)
std::optional<ConfigError> validate(const ExtractConfig& cfg);

/// Пароль резервной копии: явное значение → переменная окружения → файл.
/// Хвостовой перевод строки в файле отбрасывается.
std::optional<std::string> resolve_password(const SourceConfig& source);

}  // namespace chatx::config

#endif  // CHATX_CONFIG_HPP
