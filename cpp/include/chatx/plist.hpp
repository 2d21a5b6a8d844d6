// ==============================================================================
// chatx/plist.hpp - Property lists (binary bplist00 и XML)
// ==============================================================================
//
// Назначение:
// - Разбор binary plist (bplist00) в Value
// - Разбор XML plist (pugixml) в Value
// - Разворачивание графа NSKeyedArchiver ($objects/$top) в обычный Value
//
// Отображение типов:
//   dict → Object, array/set → Array, string → String, integer → Int64,
//   real → Double, date → Double (секунды от 2001-01-01), data → Bytes,
//   true/false → Bool, UID → Object {"CF$UID": n}
//
// Использование:
//   plist::PlistError err;
//   auto root = plist::parse(bytes, &err);
//   if (!root) { ... err.format() ... }
//   auto msg = plist::unarchive_top(*root, "root");
//
// ==============================================================================

#ifndef CHATX_PLIST_HPP
#define CHATX_PLIST_HPP

#include <chatx/value.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatx::plist {

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class PlistErrorKind {
    Truncated,    // буфер короче заголовка/трейлера
    BadMagic,     // не bplist00 и не XML
    BadOffset,    // ссылка за пределы буфера/таблицы
    BadObject,    // неизвестный маркер, цикл, слишком глубокая вложенность
    XmlParse,     // ошибка pugixml
    Io            // не удалось прочитать файл
};

struct PlistError {
    PlistErrorKind kind = PlistErrorKind::BadObject;
    std::string message;

    std::string format() const;
};

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

/// Binary plist (должен начинаться с "bplist00")
std::optional<Value> parse_binary(const std::uint8_t* data, std::size_t size,
                                  PlistError* error = nullptr);

/// XML plist (<plist><dict>...</dict></plist>)
std::optional<Value> parse_xml(std::string_view text, PlistError* error = nullptr);

/// Автоопределение формата по сигнатуре
std::optional<Value> parse(const std::vector<std::uint8_t>& data, PlistError* error = nullptr);

/// Прочитать файл и разобрать
std::optional<Value> parse_file(const std::filesystem::path& path, PlistError* error = nullptr);

/// Есть ли у буфера сигнатура bplist00
bool is_binary_plist(const std::uint8_t* data, std::size_t size);

// ----------------------------------------------------------------------------
// NSKeyedArchiver
// ----------------------------------------------------------------------------

/// Является ли значение UID-ссылкой {"CF$UID": n}
bool is_uid(const Value& v, std::uint64_t& out);

/// Развернуть объект архива с ключом key из $top.
/// NSString → String, NSData → Bytes, NSArray/NSSet → Array,
/// NSDictionary → Object, NSAttributedString → его NSString,
/// прочие классы → Object с полем "$classname".
/// std::nullopt если root не архив или ключа нет.
std::optional<Value> unarchive_top(const Value& root, const std::string& key = "root");

/// Развернуть объект архива по индексу в $objects
std::optional<Value> unarchive_object(const Value& root, std::uint64_t index);

}  // namespace chatx::plist

#endif  // CHATX_PLIST_HPP
