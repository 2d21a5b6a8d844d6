// ==============================================================================
// chatx/problem.hpp - Фатальные ошибки прогона
// ==============================================================================
//
// Назначение:
// - Закрытый набор кодов фатальных ошибок (ErrorCode)
// - Problem: структурированный документ {type,title,status,detail,instance,code}
// - PipelineError: исключение, несущее Problem до границы приложения
// - Отображение ErrorCode -> код завершения процесса
//
// Пути в instance/detail редактируются: домашний каталог заменяется на "~".
//
// ==============================================================================

#ifndef CHATX_PROBLEM_HPP
#define CHATX_PROBLEM_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include <rapidjson/document.h>

namespace chatx {

// ----------------------------------------------------------------------------
// Коды ошибок
// ----------------------------------------------------------------------------

enum class ErrorCode {
    ConfigInvalid,
    DbNotFound,
    BackupNotFound,
    BackupManifestMissing,
    BackupEntryMissing,
    BackupEncryptedNeedsPassword,
    BackupDecryptFailed,
    DecryptTimeout,
    StagingTimeout,
    StagingFailed,
    DbOpenFailed,
    NoValidRows,
    OutputFailed,
    Cancelled
};

/// Стабильное строковое имя кода (snake_case), например "db_not_found"
const char* error_code_name(ErrorCode code);

/// Заголовок для человека
const char* error_code_title(ErrorCode code);

/// Код завершения процесса: 2 config, 3 acquisition, 4 no valid rows,
/// 5 output, 130 cancelled
int exit_code_for(ErrorCode code);

/// HTTP-подобный статус для поля status
int http_status_for(ErrorCode code);

// ----------------------------------------------------------------------------
// Problem
// ----------------------------------------------------------------------------

struct Problem {
    ErrorCode code = ErrorCode::StagingFailed;
    std::string title;
    int status = 500;
    std::string detail;
    std::string instance;  // редактированный путь или пустая строка

    /// type URI: https://chatx.local/problems/<code>
    std::string type_uri() const;

    /// Сериализовать в JSON объект (поля в фиксированном порядке)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    std::string to_json() const;

    /// "<code>: <detail>"
    std::string format() const;
};

/// Собрать Problem: заполняет title/status из кода и редактирует instance
Problem make_problem(ErrorCode code, std::string detail, std::string_view instance = {});

// ----------------------------------------------------------------------------
// PipelineError
// ----------------------------------------------------------------------------

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(Problem problem);
    PipelineError(ErrorCode code, std::string detail, std::string_view instance = {});

    const Problem& problem() const noexcept { return problem_; }
    ErrorCode code() const noexcept { return problem_.code; }

private:
    Problem problem_;
};

}  // namespace chatx

#endif  // CHATX_PROBLEM_HPP
