// ==============================================================================
// chatx/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Наложение флагов extract поверх ExtractConfig
// - Диагностические ошибки CLI (код завершения 2)
//
// ==============================================================================

#ifndef CHATX_CLI_HPP
#define CHATX_CLI_HPP

#include <chatx/config.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace chatx::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// extract - канонизация базы сообщений или бэкапа.
/// Незаданные флаги не трогают значения из файла конфигурации.
struct ExtractCommand {
    std::optional<std::filesystem::path> config;       // -c, --config
    std::optional<std::filesystem::path> db;           // --db
    std::optional<std::filesystem::path> backup;       // --from-backup
    std::optional<std::string> password_env;           // --backup-password-env
    std::optional<std::filesystem::path> out;          // -o, --out
    std::optional<std::string> conversation;           // --conversation
    std::optional<bool> include_attachments;           // --include-attachments / --no-attachments
    std::optional<bool> copy_binaries;                 // --copy-binaries
    std::optional<config::TranscriptionMode> transcribe;  // --transcribe
    std::optional<int> workers;                        // --workers
    std::optional<bool> keep_staging;                  // --keep-staging
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ExtractCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

std::string render_version();

/// Наложить заданные флаги на конфигурацию
void apply_overrides(const ExtractCommand& cmd, config::ExtractConfig& cfg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Canonicalize Messages databases and backups into validated JSONL";

}  // namespace chatx::cli

#endif  // CHATX_CLI_HPP
