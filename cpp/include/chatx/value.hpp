// ==============================================================================
// chatx/value.hpp - Типизированная модель документа (Value)
// ==============================================================================
//
// Назначение:
// - Открытый "мешок" полей для source_meta и для результатов разбора plist
// - Конверсия из/в RapidJSON Value
// - Явная типизация чисел: UInt64 → Int64 → Double
// - Байтовые полезные нагрузки (Bytes) сериализуются как base64
//
// Объекты упорядочены по ключу (std::map): одинаковый вход должен давать
// побайтно одинаковый JSON при каждом запуске.
//
// ==============================================================================

#ifndef CHATX_VALUE_HPP
#define CHATX_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace chatx {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (упорядоченный map string -> Value)
using ValueObject = std::map<std::string, Value>;

/// Сырые байты (BLOB колонки, data в plist)
using ValueBytes = std::vector<std::uint8_t>;

/// Каноническое представление документа
class Value {
public:
    // Внутренние типы для variant
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Bytes = ValueBytes;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Bytes>,
                 std::shared_ptr<Array>, std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Bytes v) : data_(std::make_shared<Bytes>(std::move(v))) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_bytes(Bytes v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_bytes() const { return std::holds_alternative<std::shared_ptr<Bytes>>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// Проверка на числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Bytes& as_bytes() const { return *std::get<std::shared_ptr<Bytes>>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    Array& as_array_mut() { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    Object& as_object_mut() { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Bool* get_bool() const { return std::get_if<Bool>(&data_); }
    const Int64* get_int() const { return std::get_if<Int64>(&data_); }
    const UInt64* get_uint() const { return std::get_if<UInt64>(&data_); }
    const Double* get_double() const { return std::get_if<Double>(&data_); }
    const String* get_string() const { return std::get_if<String>(&data_); }

    const Bytes* get_bytes() const {
        auto* ptr = std::get_if<std::shared_ptr<Bytes>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Целое значение для Int64/UInt64 (UInt64 > INT64_MAX не помещается)
    bool to_int64(std::int64_t& out) const;

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Удалить поле (no-op если нет или не объект)
    void erase(const std::string& key) {
        if (auto* obj = get_object_mut()) {
            obj->erase(key);
        }
    }

    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Изменяемый доступ к полю; создаёт Null поле при отсутствии
    Value* get_or_insert(const std::string& key) {
        if (auto* obj = get_object_mut()) {
            return &(*obj)[key];
        }
        return nullptr;
    }

    bool has(const std::string& key) const {
        if (const auto* obj = get_object()) {
            return obj->find(key) != obj->end();
        }
        return false;
    }

    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (Number → UInt → Int → Float)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value; Bytes пишутся как base64 строка
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

    /// Компактный JSON текст
    std::string to_json_string() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

}  // namespace chatx

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // CHATX_VALUE_HPP
