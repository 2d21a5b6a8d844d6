// ==============================================================================
// config.cpp - Конфигурация извлечения (yaml-cpp)
// ==============================================================================

#include "chatx/config.hpp"

#include "chatx/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace chatx::config {

namespace {

// ----------------------------------------------------------------------------
// Чтение скаляров с проверкой типа
// ----------------------------------------------------------------------------

struct InvalidValue {
    std::string message;
};

bool read_bool(const YAML::Node& node, const char* key, bool fallback) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    try {
        return value.as<bool>();
    } catch (const YAML::Exception&) {
        throw InvalidValue{std::string(key) + ": expected a boolean"};
    }
}

int read_int(const YAML::Node& node, const char* key, int fallback, int min_value) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    int result = 0;
    try {
        result = value.as<int>();
    } catch (const YAML::Exception&) {
        throw InvalidValue{std::string(key) + ": expected an integer"};
    }
    if (result < min_value) {
        throw InvalidValue{std::string(key) + ": must be >= " + std::to_string(min_value)};
    }
    return result;
}

std::optional<std::string> read_string(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        throw InvalidValue{std::string(key) + ": expected a string"};
    }
    return value.as<std::string>();
}

void parse_source(const YAML::Node& node, SourceConfig& out) {
    if (!node) {
        return;
    }
    auto db = read_string(node, "db");
    auto backup = read_string(node, "backup");
    if (db && backup) {
        throw InvalidValue{"source: db and backup are mutually exclusive"};
    }
    if (db) {
        out.kind = SourceKind::Live;
        out.db_path = platform::path_from_utf8(*db);
    }
    if (backup) {
        out.kind = SourceKind::Backup;
        out.backup_root = platform::path_from_utf8(*backup);
    }
    if (auto home = read_string(node, "home")) {
        out.home = platform::path_from_utf8(*home);
    }
    if (auto password = read_string(node, "password")) {
        out.password = *password;
    }
    if (auto env = read_string(node, "password_env")) {
        out.password_env = *env;
    }
    if (auto file = read_string(node, "password_file")) {
        out.password_file = platform::path_from_utf8(*file);
    }
}

void parse_transcription(const YAML::Node& node, TranscriptionConfig& out) {
    if (!node) {
        return;
    }
    if (auto mode = read_string(node, "mode")) {
        auto parsed = parse_transcription_mode(*mode);
        if (!parsed) {
            throw InvalidValue{"transcription.mode: unknown mode '" + *mode + "'"};
        }
        out.mode = *parsed;
    }
    if (auto engine = read_string(node, "engine_path")) {
        out.engine_path = platform::path_from_utf8(*engine);
    }
    if (auto model = read_string(node, "model_path")) {
        out.model_path = platform::path_from_utf8(*model);
    }
    if (auto language = read_string(node, "language")) {
        out.language = *language;
    }
    out.timeout_seconds = read_int(node, "timeout_seconds", out.timeout_seconds, 1);
    if (auto text = read_string(node, "fixed_text")) {
        out.fixed_text = *text;
    }
}

LoadResult parse_root(const YAML::Node& root) {
    LoadResult result;
    ExtractConfig& cfg = result.config;

    if (root && !root.IsNull() && !root.IsMap()) {
        result.error = ConfigError{ConfigErrorKind::ParseError, "top level must be a mapping"};
        return result;
    }

    try {
        parse_source(root["source"], cfg.source);

        if (const YAML::Node out = root["output"]) {
            if (auto dir = read_string(out, "dir")) {
                cfg.output.dir = platform::path_from_utf8(*dir);
            }
        }

        if (const YAML::Node att = root["attachments"]) {
            cfg.attachments.include = read_bool(att, "include", cfg.attachments.include);
            cfg.attachments.copy_binaries =
                read_bool(att, "copy_binaries", cfg.attachments.copy_binaries);
            cfg.attachments.workers = read_int(att, "workers", cfg.attachments.workers, 1);
        }

        parse_transcription(root["transcription"], cfg.transcription);

        if (const YAML::Node st = root["staging"]) {
            cfg.staging.retain = read_bool(st, "retain", cfg.staging.retain);
            if (auto dir = read_string(st, "work_dir")) {
                cfg.staging.work_dir = platform::path_from_utf8(*dir);
            }
            cfg.staging.timeout_seconds =
                read_int(st, "timeout_seconds", cfg.staging.timeout_seconds, 1);
            cfg.staging.decrypt_timeout_seconds =
                read_int(st, "decrypt_timeout_seconds", cfg.staging.decrypt_timeout_seconds, 1);
            cfg.staging.wal_audit = read_bool(st, "wal_audit", cfg.staging.wal_audit);
        }

        if (const YAML::Node filter = root["filter"]) {
            cfg.filter.conversation = read_string(filter, "conversation");
        }
    } catch (const InvalidValue& e) {
        result.error = ConfigError{ConfigErrorKind::InvalidValue, e.message};
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

std::string ConfigError::format() const {
    switch (kind) {
    case ConfigErrorKind::FileNotFound:
        return "config file not found: " + message;
    case ConfigErrorKind::ParseError:
        return "config parse error: " + message;
    case ConfigErrorKind::InvalidValue:
        return "invalid config value: " + message;
    case ConfigErrorKind::MissingSource:
        return "no source: " + message;
    }
    return message;
}

LoadResult load_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LoadResult result;
        result.error = ConfigError{ConfigErrorKind::FileNotFound, platform::path_to_utf8(path)};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(platform::path_to_utf8(path));
        return parse_root(root);
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = ConfigError{ConfigErrorKind::ParseError, e.what()};
        return result;
    }
}

LoadResult load_string(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return parse_root(root);
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = ConfigError{ConfigErrorKind::ParseError, e.what()};
        return result;
    }
}

std::optional<TranscriptionMode> parse_transcription_mode(const std::string& text) {
    if (text == "off" || text == "false" || text == "none") {
        return TranscriptionMode::Off;
    }
    if (text == "fixed") {
        return TranscriptionMode::Fixed;
    }
    if (text == "local") {
        return TranscriptionMode::Local;
    }
    return std::nullopt;
}

const char* transcription_mode_name(TranscriptionMode mode) {
    switch (mode) {
    case TranscriptionMode::Off:
        return "off";
    case TranscriptionMode::Fixed:
        return "fixed";
    case TranscriptionMode::Local:
        return "local";
    }
    return "off";
}

const char* source_kind_name(SourceKind kind) {
    return kind == SourceKind::Backup ? "backup" : "live";
}

std::optional<ConfigError> validate(const ExtractConfig& cfg) {
    if (cfg.source.kind == SourceKind::Live && cfg.source.db_path.empty()) {
        return ConfigError{ConfigErrorKind::MissingSource, "set source.db or source.backup"};
    }
    if (cfg.source.kind == SourceKind::Backup && cfg.source.backup_root.empty()) {
        return ConfigError{ConfigErrorKind::MissingSource, "source.backup is empty"};
    }
    if (cfg.output.dir.empty()) {
        return ConfigError{ConfigErrorKind::InvalidValue, "output.dir is empty"};
    }
    if (cfg.attachments.workers < 1) {
        return ConfigError{ConfigErrorKind::InvalidValue, "attachments.workers must be >= 1"};
    }
    if (cfg.transcription.mode == TranscriptionMode::Local &&
        cfg.transcription.engine_path.empty()) {
        return ConfigError{ConfigErrorKind::InvalidValue,
                           "transcription.engine_path is required for mode local"};
    }
    if (cfg.staging.timeout_seconds < 1 || cfg.staging.decrypt_timeout_seconds < 1) {
        return ConfigError{ConfigErrorKind::InvalidValue, "staging timeouts must be >= 1"};
    }
    if (cfg.filter.conversation && cfg.filter.conversation->empty()) {
        return ConfigError{ConfigErrorKind::InvalidValue, "filter.conversation is empty"};
    }
    return std::nullopt;
}

std::optional<std::string> resolve_password(const SourceConfig& source) {
    if (source.password && !source.password->empty()) {
        return source.password;
    }
    if (!source.password_env.empty()) {
        if (auto value = platform::get_env(source.password_env)) {
            return value;
        }
    }
    if (!source.password_file.empty()) {
        std::ifstream in(source.password_file, std::ios::binary);
        if (in) {
            std::ostringstream ss;
            ss << in.rdbuf();
            std::string text = ss.str();
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                text.pop_back();
            }
            if (!text.empty()) {
                return text;
            }
        }
    }
    return std::nullopt;
}

}  // namespace chatx::config
