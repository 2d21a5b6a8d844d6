// ==============================================================================
// chatx/validate.hpp - Validator / Quarantine Gate
// ==============================================================================
//
// Назначение:
// - Проверка готовой записи по канонической JSON схеме (RapidJSON
//   SchemaValidator, схема встроена в бинарь)
// - Смысловые проверки, которые схема не выражает (диапазон времени)
// - QuarantineSink: quarantine/messages_bad.jsonl с причиной отказа
//
// Непрошедшая запись не останавливает прогон.
//
// ==============================================================================

#ifndef CHATX_VALIDATE_HPP
#define CHATX_VALIDATE_HPP

#include <chatx/message.hpp>
#include <chatx/output.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <rapidjson/document.h>

namespace chatx::validate {

/// Допустимый диапазон timestamp: [2001-01-01, 2100-01-01)
constexpr std::int64_t MIN_TIMESTAMP = 978307200;
constexpr std::int64_t MAX_TIMESTAMP = 4102444800;

/// Текст канонической схемы (JSON Schema draft-04)
const char* canonical_schema();

class Validator {
public:
    Validator();
    ~Validator();

    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;

    /// std::nullopt если запись валидна, иначе причина отказа
    std::optional<std::string> check(const message::CanonicalMessage& msg,
                                     const rapidjson::Value& doc) const;

    /// Только схема (для произвольного JSON)
    std::optional<std::string> check_schema(const rapidjson::Value& doc) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ----------------------------------------------------------------------------
// Карантин
// ----------------------------------------------------------------------------

class QuarantineSink {
public:
    explicit QuarantineSink(std::filesystem::path path) : path_(std::move(path)) {}

    /// Создать (перезаписать) файл карантина
    bool open();

    /// {index, msg_id, error, row}; false при ошибке записи
    bool write(std::size_t index, const std::string& msg_id, const std::string& error,
               const rapidjson::Value& row);

    bool close();

    std::size_t count() const { return count_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    output::JsonlFile file_;
    std::size_t count_ = 0;
};

}  // namespace chatx::validate

#endif  // CHATX_VALIDATE_HPP
