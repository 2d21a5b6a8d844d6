// ==============================================================================
// codec.cpp - base64 / hex / UTF-8
// ==============================================================================

#include <chatx/codec.hpp>

namespace chatx::codec {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// Длина корректной UTF-8 последовательности в позиции i, 0 если некорректна
std::size_t utf8_sequence_length(std::string_view text, std::size_t i) {
    auto byte = [&](std::size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char c = byte(i);
    if (c < 0x80) {
        return 1;
    }

    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        return 0;
    }

    if (i + len > text.size()) {
        return 0;
    }
    for (std::size_t k = 1; k < len; ++k) {
        unsigned char cc = byte(i + k);
        if ((cc & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }

    // overlong / суррогаты / за пределами Unicode
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
        return 0;
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) {
        return 0;
    }
    if (cp > 0x10FFFF) {
        return 0;
    }
    return len;
}

}  // namespace

// ----------------------------------------------------------------------------
// base64
// ----------------------------------------------------------------------------

std::string base64_encode(const Bytes& data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    unsigned int val = 0;
    int valb = -6;

    for (std::uint8_t c : data) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            result.push_back(BASE64_CHARS[static_cast<size_t>((val >> valb) & 0x3F)]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(BASE64_CHARS[static_cast<size_t>(((val << 8) >> (valb + 8)) & 0x3F)]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string base64_encode(std::string_view data) {
    return base64_encode(Bytes(data.begin(), data.end()));
}

std::optional<Bytes> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(text.size() / 4 * 3);

    unsigned int val = 0;
    int valb = -8;
    std::size_t padding = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '=') {
            // '=' допустим только в последних двух позициях
            if (i + 2 < text.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        int idx = base64_index(c);
        if (idx < 0) {
            return std::nullopt;
        }
        val = (val << 6) + static_cast<unsigned int>(idx);
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return out;
}

// ----------------------------------------------------------------------------
// hex
// ----------------------------------------------------------------------------

std::string hex_encode(const std::uint8_t* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        result.push_back(digits[data[i] >> 4]);
        result.push_back(digits[data[i] & 0x0F]);
    }
    return result;
}

std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

std::optional<Bytes> hex_decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string sanitize_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            out += "\xEF\xBF\xBD";  // U+FFFD
            ++i;
            continue;
        }
        out.append(text.substr(i, len));
        i += len;
    }
    return out;
}

std::string strip_object_replacement(std::string_view text) {
    // U+FFFC в UTF-8: EF BF BC
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (i + 3 <= text.size() && text.compare(i, 3, "\xEF\xBF\xBC") == 0) {
            i += 3;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }

    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    std::size_t begin = 0;
    while (begin < out.size() && is_space(out[begin])) {
        ++begin;
    }
    std::size_t end = out.size();
    while (end > begin && is_space(out[end - 1])) {
        --end;
    }
    return out.substr(begin, end - begin);
}

// ----------------------------------------------------------------------------
// Целые из буфера
// ----------------------------------------------------------------------------

std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint64_t read_le64(const std::uint8_t* p) {
    return static_cast<std::uint64_t>(read_le32(p)) |
           (static_cast<std::uint64_t>(read_le32(p + 4)) << 32);
}

std::uint64_t read_be(const std::uint8_t* p, std::size_t width) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

}  // namespace chatx::codec
