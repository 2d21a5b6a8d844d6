// ==============================================================================
// typedstream.cpp - Извлечение строки из архива streamtyped
// ==============================================================================

#include "chatx/typedstream.hpp"

#include "chatx/codec.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>

namespace chatx::typedstream {

namespace {

constexpr std::uint8_t HEADER[] = {0x04, 0x0B, 's', 't', 'r', 'e', 'a', 'm',
                                   't',  'y',  'p', 'e', 'd'};
constexpr std::uint8_t STRING_MARKER = 0x2B;  // '+'
constexpr std::uint8_t LEN_INT16 = 0x81;
constexpr std::uint8_t LEN_INT32 = 0x82;

// Маркер '+' стоит в нескольких байтах после имени класса
constexpr std::size_t MARKER_WINDOW = 16;

bool fail(TypedstreamError* error, TypedstreamErrorKind kind, std::string message) {
    if (error != nullptr) {
        *error = TypedstreamError{kind, std::move(message)};
    }
    return false;
}

/// Позиция конца первого вхождения имени класса (NSString или NSMutableString)
std::optional<std::size_t> find_string_class(const std::uint8_t* data, std::size_t size) {
    std::string_view haystack(reinterpret_cast<const char*>(data), size);
    std::size_t best = std::string_view::npos;
    std::size_t best_end = 0;
    for (std::string_view name : {std::string_view("NSString"), std::string_view("NSMutableString")}) {
        std::size_t pos = haystack.find(name);
        if (pos != std::string_view::npos && pos < best) {
            best = pos;
            best_end = pos + name.size();
        }
    }
    if (best == std::string_view::npos) {
        return std::nullopt;
    }
    return best_end;
}

}  // namespace

std::string TypedstreamError::format() const {
    switch (kind) {
    case TypedstreamErrorKind::NoHeader:
        return "typedstream: missing header: " + message;
    case TypedstreamErrorKind::NoString:
        return "typedstream: no string payload: " + message;
    case TypedstreamErrorKind::BadLength:
        return "typedstream: bad length: " + message;
    case TypedstreamErrorKind::InvalidUtf8:
        return "typedstream: invalid utf-8: " + message;
    }
    return message;
}

bool has_header(const std::uint8_t* data, std::size_t size) {
    return size >= sizeof(HEADER) && std::memcmp(data, HEADER, sizeof(HEADER)) == 0;
}

std::optional<std::string> extract_string(const std::uint8_t* data, std::size_t size,
                                          TypedstreamError* error) {
    if (!has_header(data, size)) {
        fail(error, TypedstreamErrorKind::NoHeader, "expected 04 0B streamtyped");
        return std::nullopt;
    }

    auto class_end = find_string_class(data, size);
    if (!class_end) {
        fail(error, TypedstreamErrorKind::NoString, "no NSString class in archive");
        return std::nullopt;
    }

    std::size_t window_end = std::min(size, *class_end + MARKER_WINDOW);
    const std::uint8_t* marker = std::find(data + *class_end, data + window_end, STRING_MARKER);
    if (marker == data + window_end) {
        fail(error, TypedstreamErrorKind::NoString, "no '+' marker after NSString");
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(marker - data) + 1;
    if (pos >= size) {
        fail(error, TypedstreamErrorKind::BadLength, "archive ends after marker");
        return std::nullopt;
    }

    std::size_t length = 0;
    std::uint8_t first = data[pos];
    if (first == LEN_INT16) {
        if (pos + 3 > size) {
            fail(error, TypedstreamErrorKind::BadLength, "truncated int16 length");
            return std::nullopt;
        }
        length = codec::read_le16(data + pos + 1);
        pos += 3;
    } else if (first == LEN_INT32) {
        if (pos + 5 > size) {
            fail(error, TypedstreamErrorKind::BadLength, "truncated int32 length");
            return std::nullopt;
        }
        length = codec::read_le32(data + pos + 1);
        pos += 5;
    } else if (first < 0x80) {
        length = first;
        pos += 1;
    } else {
        fail(error, TypedstreamErrorKind::BadLength,
             "unsupported length tag 0x" + codec::hex_encode(&first, 1));
        return std::nullopt;
    }

    if (length > size - pos) {
        fail(error, TypedstreamErrorKind::BadLength,
             "length " + std::to_string(length) + " exceeds archive");
        return std::nullopt;
    }

    std::string text(reinterpret_cast<const char*>(data + pos), length);
    if (!codec::is_valid_utf8(text)) {
        fail(error, TypedstreamErrorKind::InvalidUtf8, "string payload is not utf-8");
        return std::nullopt;
    }
    return text;
}

}  // namespace chatx::typedstream
