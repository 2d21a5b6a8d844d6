// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv: одна подкоманда extract, флаги в стиле clap,
// ошибки использования печатаются без префикса [x] и дают код 2.
//
// ==============================================================================

#include "chatx/cli.hpp"

#include "chatx/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace chatx::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg +
           "\n\n"
           "Usage: chatx extract [OPTIONS] <--db <DB>|--from-backup <DIR>>\n\n"
           "For more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

/// "--name value" или "--name=value"; nullptr если у флага нет значения
const char* take_value(int argc, char** argv, int& i, const char* name) {
    const char* arg = argv[i];
    std::size_t len = std::strlen(name);
    if (std::strncmp(arg, name, len) == 0 && arg[len] == '=') {
        return arg + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    return nullptr;
}

bool matches(const char* arg, const char* name) {
    std::size_t len = std::strlen(name);
    return std::strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

std::optional<int> parse_positive(const char* text) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < 1 || value > 256) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("chatx ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: chatx [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  extract  Extract a chat.db or MobileSync backup into canonical JSONL\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the start banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Extract the live database of the current user:\n"
               "        ./chatx extract --db ~/Library/Messages/chat.db --out out/\n"
               "\n"
               "    Extract an encrypted backup and copy attachments:\n"
               "        ./chatx extract --from-backup backups/<udid> "
               "--backup-password-env BACKUP_PW --copy-binaries\n";
    }
    if (*command == "extract") {
        return "Extract a chat.db or MobileSync backup into canonical JSONL\n"
               "\n"
               "Usage: chatx extract [OPTIONS] <--db <DB>|--from-backup <DIR>>\n"
               "\n"
               "Options:\n"
               "  -c, --config <FILE>              YAML configuration file\n"
               "      --db <DB>                    Live chat.db to extract\n"
               "      --from-backup <DIR>          MobileSync backup directory\n"
               "      --backup-password-env <VAR>  Environment variable holding the backup "
               "password\n"
               "  -o, --out <DIR>                  Output directory [default: out]\n"
               "      --conversation <GUID>        Only extract this chat guid\n"
               "      --include-attachments        Resolve attachments (default)\n"
               "      --no-attachments             Skip attachment resolution\n"
               "      --copy-binaries              Copy attachment bytes into the output\n"
               "      --transcribe <MODE>          Audio transcription: off, fixed or local\n"
               "      --workers <N>                Attachment and transcription workers\n"
               "      --keep-staging               Keep the private staging directory\n"
               "  -h, --help                       Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        return result;
    }

    const char* cmd = argv[cmd_idx];
    if (str_eq(cmd, "help")) {
        HelpCommand help;
        if (cmd_idx + 1 < argc) {
            help.command = argv[cmd_idx + 1];
        }
        result.ok = true;
        result.command = help;
        return result;
    }
    if (!str_eq(cmd, "extract")) {
        return usage_error(result, std::string("unrecognized subcommand '") + cmd + "'");
    }

    ExtractCommand extract;
    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"extract"};
            return result;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-c") || matches(arg, "--config")) {
            if ((value = take_value(argc, argv, i, "--config")) == nullptr) {
                return usage_error(result, "a value is required for '--config <FILE>'");
            }
            extract.config = platform::path_from_utf8(value);
        } else if (matches(arg, "--db")) {
            if ((value = take_value(argc, argv, i, "--db")) == nullptr) {
                return usage_error(result, "a value is required for '--db <DB>'");
            }
            extract.db = platform::path_from_utf8(value);
        } else if (matches(arg, "--from-backup")) {
            if ((value = take_value(argc, argv, i, "--from-backup")) == nullptr) {
                return usage_error(result, "a value is required for '--from-backup <DIR>'");
            }
            extract.backup = platform::path_from_utf8(value);
        } else if (matches(arg, "--backup-password-env")) {
            if ((value = take_value(argc, argv, i, "--backup-password-env")) == nullptr) {
                return usage_error(result,
                                   "a value is required for '--backup-password-env <VAR>'");
            }
            extract.password_env = value;
        } else if (str_eq(arg, "-o") || matches(arg, "--out")) {
            if ((value = take_value(argc, argv, i, "--out")) == nullptr) {
                return usage_error(result, "a value is required for '--out <DIR>'");
            }
            extract.out = platform::path_from_utf8(value);
        } else if (matches(arg, "--conversation")) {
            if ((value = take_value(argc, argv, i, "--conversation")) == nullptr) {
                return usage_error(result, "a value is required for '--conversation <GUID>'");
            }
            extract.conversation = value;
        } else if (str_eq(arg, "--include-attachments")) {
            extract.include_attachments = true;
        } else if (str_eq(arg, "--no-attachments")) {
            extract.include_attachments = false;
        } else if (str_eq(arg, "--copy-binaries")) {
            extract.copy_binaries = true;
        } else if (str_eq(arg, "--keep-staging")) {
            extract.keep_staging = true;
        } else if (matches(arg, "--transcribe")) {
            if ((value = take_value(argc, argv, i, "--transcribe")) == nullptr) {
                return usage_error(result, "a value is required for '--transcribe <MODE>'");
            }
            extract.transcribe = config::parse_transcription_mode(value);
            if (!extract.transcribe) {
                return usage_error(result, std::string("invalid value '") + value +
                                               "' for '--transcribe <MODE>': must be off, "
                                               "fixed or local");
            }
        } else if (matches(arg, "--workers")) {
            if ((value = take_value(argc, argv, i, "--workers")) == nullptr) {
                return usage_error(result, "a value is required for '--workers <N>'");
            }
            extract.workers = parse_positive(value);
            if (!extract.workers) {
                return usage_error(result, std::string("invalid value '") + value +
                                               "' for '--workers <N>': expected 1..256");
            }
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (extract.db && extract.backup) {
        return usage_error(result,
                           "the argument '--db <DB>' cannot be used with '--from-backup <DIR>'");
    }

    result.ok = true;
    result.command = extract;
    return result;
}

// ----------------------------------------------------------------------------
// apply_overrides
// ----------------------------------------------------------------------------

void apply_overrides(const ExtractCommand& cmd, config::ExtractConfig& cfg) {
    if (cmd.db) {
        cfg.source.kind = config::SourceKind::Live;
        cfg.source.db_path = *cmd.db;
        cfg.source.backup_root.clear();
    }
    if (cmd.backup) {
        cfg.source.kind = config::SourceKind::Backup;
        cfg.source.backup_root = *cmd.backup;
        cfg.source.db_path.clear();
    }
    if (cmd.password_env) {
        cfg.source.password_env = *cmd.password_env;
    }
    if (cmd.out) {
        cfg.output.dir = *cmd.out;
    }
    if (cmd.conversation) {
        cfg.filter.conversation = cmd.conversation;
    }
    if (cmd.include_attachments) {
        cfg.attachments.include = *cmd.include_attachments;
    }
    if (cmd.copy_binaries) {
        cfg.attachments.copy_binaries = *cmd.copy_binaries;
    }
    if (cmd.transcribe) {
        cfg.transcription.mode = *cmd.transcribe;
    }
    if (cmd.workers) {
        cfg.attachments.workers = *cmd.workers;
    }
    if (cmd.keep_staging) {
        cfg.staging.retain = *cmd.keep_staging;
    }
}

}  // namespace chatx::cli
