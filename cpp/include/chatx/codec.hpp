// ==============================================================================
// chatx/codec.hpp - Кодирование байтов: base64, hex, UTF-8
// ==============================================================================
//
// Назначение:
// - base64 (RFC 4648, с padding) для сырых payload-ов в source_meta
// - hex для хэшей и fileID
// - проверка и очистка UTF-8 (текст сообщений из BLOB может быть битым)
//
// ==============================================================================

#ifndef CHATX_CODEC_HPP
#define CHATX_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatx::codec {

using Bytes = std::vector<std::uint8_t>;

/// Кодировать байты в base64 (стандартный алфавит, с '=')
std::string base64_encode(const Bytes& data);

/// Кодировать строку в base64
std::string base64_encode(std::string_view data);

/// Декодировать base64; std::nullopt при недопустимом символе или длине
std::optional<Bytes> base64_decode(std::string_view text);

/// Нижний регистр hex
std::string hex_encode(const std::uint8_t* data, std::size_t size);
std::string hex_encode(const Bytes& data);

/// Декодировать hex (чётная длина, [0-9a-fA-F])
std::optional<Bytes> hex_decode(std::string_view text);

/// Проверить корректность UTF-8 (без overlong и суррогатов)
bool is_valid_utf8(std::string_view text);

/// Заменить некорректные последовательности на U+FFFD
std::string sanitize_utf8(std::string_view text);

/// Удалить управляющие символы Apple (U+FFFC object replacement) и обрезать пробелы
std::string strip_object_replacement(std::string_view text);

/// Читать little-endian целые из буфера (без проверки границ)
std::uint16_t read_le16(const std::uint8_t* p);
std::uint32_t read_le32(const std::uint8_t* p);
std::uint64_t read_le64(const std::uint8_t* p);

/// Читать big-endian целое длиной width байт (1..8)
std::uint64_t read_be(const std::uint8_t* p, std::size_t width);

}  // namespace chatx::codec

#endif  // CHATX_CODEC_HPP
