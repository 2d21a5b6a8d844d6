// ==============================================================================
// problem.cpp - Фатальные ошибки прогона
// ==============================================================================

#include "chatx/problem.hpp"

#include "chatx/output.hpp"
#include "chatx/platform.hpp"

namespace chatx {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::ConfigInvalid:
        return "config_invalid";
    case ErrorCode::DbNotFound:
        return "db_not_found";
    case ErrorCode::BackupNotFound:
        return "backup_not_found";
    case ErrorCode::BackupManifestMissing:
        return "backup_manifest_missing";
    case ErrorCode::BackupEntryMissing:
        return "backup_entry_missing";
    case ErrorCode::BackupEncryptedNeedsPassword:
        return "backup_encrypted_needs_password";
    case ErrorCode::BackupDecryptFailed:
        return "backup_decrypt_failed";
    case ErrorCode::DecryptTimeout:
        return "decrypt_timeout";
    case ErrorCode::StagingTimeout:
        return "staging_timeout";
    case ErrorCode::StagingFailed:
        return "staging_failed";
    case ErrorCode::DbOpenFailed:
        return "db_open_failed";
    case ErrorCode::NoValidRows:
        return "no_valid_rows";
    case ErrorCode::OutputFailed:
        return "output_failed";
    case ErrorCode::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* error_code_title(ErrorCode code) {
    switch (code) {
    case ErrorCode::ConfigInvalid:
        return "Invalid configuration";
    case ErrorCode::DbNotFound:
        return "Messages database not found";
    case ErrorCode::BackupNotFound:
        return "Backup directory not found";
    case ErrorCode::BackupManifestMissing:
        return "Backup manifest missing or unreadable";
    case ErrorCode::BackupEntryMissing:
        return "Messages database not present in backup";
    case ErrorCode::BackupEncryptedNeedsPassword:
        return "Encrypted backup requires a password";
    case ErrorCode::BackupDecryptFailed:
        return "Backup decryption failed";
    case ErrorCode::DecryptTimeout:
        return "Backup key derivation timed out";
    case ErrorCode::StagingTimeout:
        return "Database did not reach a stable snapshot";
    case ErrorCode::StagingFailed:
        return "Staging copy failed";
    case ErrorCode::DbOpenFailed:
        return "Staged database could not be opened or read";
    case ErrorCode::NoValidRows:
        return "No valid rows";
    case ErrorCode::OutputFailed:
        return "Output could not be written";
    case ErrorCode::Cancelled:
        return "Run cancelled";
    }
    return "Unknown error";
}

int exit_code_for(ErrorCode code) {
    switch (code) {
    case ErrorCode::ConfigInvalid:
        return 2;
    case ErrorCode::NoValidRows:
        return 4;
    case ErrorCode::OutputFailed:
        return 5;
    case ErrorCode::Cancelled:
        return 130;
    default:
        // Ошибки получения данных (staging, backup, open)
        return 3;
    }
}

int http_status_for(ErrorCode code) {
    switch (code) {
    case ErrorCode::ConfigInvalid:
    case ErrorCode::BackupEncryptedNeedsPassword:
        return 400;
    case ErrorCode::BackupDecryptFailed:
        return 401;
    case ErrorCode::DbNotFound:
    case ErrorCode::BackupNotFound:
    case ErrorCode::BackupManifestMissing:
    case ErrorCode::BackupEntryMissing:
        return 404;
    case ErrorCode::DecryptTimeout:
    case ErrorCode::StagingTimeout:
        return 408;
    case ErrorCode::NoValidRows:
        return 422;
    case ErrorCode::Cancelled:
        return 499;
    default:
        return 500;
    }
}

// ----------------------------------------------------------------------------
// Problem
// ----------------------------------------------------------------------------

std::string Problem::type_uri() const {
    return std::string("https://chatx.local/problems/") + error_code_name(code);
}

void Problem::to_rapidjson(rapidjson::Value& out,
                           rapidjson::Document::AllocatorType& alloc) const {
    out.SetObject();
    auto add_string = [&](const char* key, const std::string& value) {
        rapidjson::Value v;
        v.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), alloc);
        out.AddMember(rapidjson::StringRef(key), v, alloc);
    };
    add_string("type", type_uri());
    add_string("title", title);
    out.AddMember("status", status, alloc);
    add_string("detail", detail);
    add_string("instance", instance);
    add_string("code", error_code_name(code));
}

std::string Problem::to_json() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return output::to_json(doc);
}

std::string Problem::format() const {
    return std::string(error_code_name(code)) + ": " + detail;
}

Problem make_problem(ErrorCode code, std::string detail, std::string_view instance) {
    Problem p;
    p.code = code;
    p.title = error_code_title(code);
    p.status = http_status_for(code);
    auto home = platform::home_dir();
    if (home) {
        p.detail = platform::redact_path(detail, *home);
        // detail может содержать путь в середине строки
        std::string home_str = platform::path_to_utf8(*home);
        if (home_str.size() > 1) {
            std::string::size_type pos = 0;
            while ((pos = p.detail.find(home_str + "/", pos)) != std::string::npos) {
                p.detail.replace(pos, home_str.size(), "~");
                pos += 1;
            }
        }
        p.instance = instance.empty() ? std::string() : platform::redact_path(instance, *home);
    } else {
        p.detail = std::move(detail);
        p.instance = std::string(instance);
    }
    return p;
}

// ----------------------------------------------------------------------------
// PipelineError
// ----------------------------------------------------------------------------

PipelineError::PipelineError(Problem problem)
    : std::runtime_error(problem.format()), problem_(std::move(problem)) {}

PipelineError::PipelineError(ErrorCode code, std::string detail, std::string_view instance)
    : PipelineError(make_problem(code, std::move(detail), instance)) {}

}  // namespace chatx
