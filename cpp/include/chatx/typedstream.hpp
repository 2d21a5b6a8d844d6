// ==============================================================================
// chatx/typedstream.hpp - Извлечение строки из архива streamtyped
// ==============================================================================
//
// attributedBody в chat.db хранится как архив NeXT typedstream
// (NSArchiver). Полный граф объектов не восстанавливается: нужна только
// строка NSString/NSMutableString, которая в архиве выглядит как
//
//   04 0B "streamtyped" ... "NSString" 01 94 84 01 '+' <len> <utf-8 bytes>
//
// Длина кодируется одним байтом (< 0x80), либо 0x81 + int16 LE,
// либо 0x82 + int32 LE.
//
// ==============================================================================

#ifndef CHATX_TYPEDSTREAM_HPP
#define CHATX_TYPEDSTREAM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatx::typedstream {

enum class TypedstreamErrorKind {
    NoHeader,     // нет сигнатуры streamtyped
    NoString,     // нет класса NSString или маркера '+'
    BadLength,    // длина выходит за буфер
    InvalidUtf8   // байты строки не UTF-8
};

struct TypedstreamError {
    TypedstreamErrorKind kind = TypedstreamErrorKind::NoHeader;
    std::string message;

    std::string format() const;
};

/// Начинается ли буфер с заголовка typedstream
bool has_header(const std::uint8_t* data, std::size_t size);

/// Извлечь первую строку NSString из архива
std::optional<std::string> extract_string(const std::uint8_t* data, std::size_t size,
                                          TypedstreamError* error = nullptr);

inline std::optional<std::string> extract_string(const std::vector<std::uint8_t>& data,
                                                 TypedstreamError* error = nullptr) {
    return extract_string(data.data(), data.size(), error);
}

}  // namespace chatx::typedstream

#endif  // CHATX_TYPEDSTREAM_HPP
