// ==============================================================================
// plist.cpp - Property lists (binary bplist00 и XML)
// ==============================================================================
//
// Формат bplist00:
//   [0..8)        "bplist00"
//   объекты       маркер (старший ниббл = тип, младший = размер/длина)
//   offset table  num_objects смещений по offset_int_size байт (BE)
//   trailer (32)  6 unused, offset_int_size, object_ref_size,
//                 num_objects(8), top_object(8), offset_table_offset(8)
//
// ==============================================================================

#include "chatx/plist.hpp"

#include "chatx/codec.hpp"
#include "chatx/platform.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <pugixml.hpp>
#include <set>
#include <stdexcept>
#include <vector>

namespace chatx::plist {

namespace {

constexpr std::size_t TRAILER_SIZE = 32;
constexpr int MAX_DEPTH = 64;
constexpr const char* UID_KEY = "CF$UID";

void set_error(PlistError* error, PlistErrorKind kind, std::string message) {
    if (error != nullptr) {
        *error = PlistError{kind, std::move(message)};
    }
}

/// UTF-16BE → UTF-8 (с суррогатными парами)
std::string utf16be_to_utf8(const std::uint8_t* p, std::size_t units) {
    std::string out;
    out.reserve(units);
    for (std::size_t i = 0; i < units; ++i) {
        std::uint32_t cp = static_cast<std::uint32_t>((p[i * 2] << 8) | p[i * 2 + 1]);
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < units) {
            std::uint32_t lo = static_cast<std::uint32_t>((p[(i + 1) * 2] << 8) | p[(i + 1) * 2 + 1]);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }

        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// BinaryParser
// ----------------------------------------------------------------------------

class BinaryParser {
public:
    BinaryParser(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    std::optional<Value> parse() {
        if (size_ < 8 + TRAILER_SIZE) {
            return fail(PlistErrorKind::Truncated, "buffer shorter than header and trailer");
        }
        if (std::memcmp(data_, "bplist00", 8) != 0) {
            return fail(PlistErrorKind::BadMagic, "missing bplist00 signature");
        }

        const std::uint8_t* trailer = data_ + size_ - TRAILER_SIZE;
        offset_size_ = trailer[6];
        ref_size_ = trailer[7];
        num_objects_ = codec::read_be(trailer + 8, 8);
        std::uint64_t top = codec::read_be(trailer + 16, 8);
        offset_table_ = codec::read_be(trailer + 24, 8);

        if (offset_size_ == 0 || offset_size_ > 8 || ref_size_ == 0 || ref_size_ > 8) {
            return fail(PlistErrorKind::BadObject, "invalid trailer integer sizes");
        }
        if (offset_table_ >= size_ ||
            num_objects_ > (size_ - offset_table_) / offset_size_) {
            return fail(PlistErrorKind::BadOffset, "offset table out of range");
        }
        if (top >= num_objects_) {
            return fail(PlistErrorKind::BadOffset, "top object out of range");
        }

        cache_.assign(static_cast<std::size_t>(num_objects_), std::nullopt);
        auto value = read_object(top, 0);
        if (!value) {
            return std::nullopt;
        }
        return value;
    }

    const PlistError& error() const { return error_; }

private:
    std::optional<Value> fail(PlistErrorKind kind, std::string message) {
        error_ = PlistError{kind, std::move(message)};
        return std::nullopt;
    }

    bool object_offset(std::uint64_t index, std::uint64_t& out) {
        if (index >= num_objects_) {
            return false;
        }
        out = codec::read_be(data_ + offset_table_ + index * offset_size_, offset_size_);
        return out >= 8 && out < offset_table_;
    }

    bool in_range(std::uint64_t pos, std::uint64_t len) const {
        return pos <= offset_table_ && len <= offset_table_ - pos;
    }

    /// Длина для data/string/array/dict: младший ниббл или следующий int-объект
    bool read_length(std::uint8_t marker, std::uint64_t& pos, std::uint64_t& out) {
        std::uint8_t low = marker & 0x0F;
        if (low != 0x0F) {
            out = low;
            return true;
        }
        if (!in_range(pos, 1)) {
            return false;
        }
        std::uint8_t int_marker = data_[pos];
        if ((int_marker & 0xF0) != 0x10) {
            return false;
        }
        std::uint64_t width = 1ULL << (int_marker & 0x0F);
        if (width > 8 || !in_range(pos + 1, width)) {
            return false;
        }
        out = codec::read_be(data_ + pos + 1, static_cast<std::size_t>(width));
        pos += 1 + width;
        return true;
    }

    /// Объект по индексу; общие ссылки разбираются один раз
    std::optional<Value> read_object(std::uint64_t index, int depth) {
        if (index < cache_.size() && cache_[index]) {
            return cache_[index];
        }
        auto value = parse_object(index, depth);
        if (value && index < cache_.size()) {
            cache_[index] = value;
        }
        return value;
    }

    std::optional<Value> parse_object(std::uint64_t index, int depth) {
        if (depth > MAX_DEPTH) {
            return fail(PlistErrorKind::BadObject, "nesting too deep");
        }
        if (active_.count(index) != 0) {
            return fail(PlistErrorKind::BadObject, "reference cycle");
        }

        std::uint64_t pos = 0;
        if (!object_offset(index, pos)) {
            return fail(PlistErrorKind::BadOffset,
                        "object " + std::to_string(index) + " offset out of range");
        }

        std::uint8_t marker = data_[pos];
        std::uint8_t type = marker >> 4;
        std::uint8_t low = marker & 0x0F;
        ++pos;

        switch (type) {
        case 0x0:
            if (marker == 0x08) {
                return Value(false);
            }
            if (marker == 0x09) {
                return Value(true);
            }
            return Value();

        case 0x1: {
            std::uint64_t width = 1ULL << low;
            if (width > 16 || !in_range(pos, width)) {
                return fail(PlistErrorKind::BadOffset, "integer out of range");
            }
            if (width == 16) {
                // 128-битные целые: берём младшие 8 байт
                pos += 8;
                width = 8;
            }
            // 1/2/4 байта беззнаковые, 8 байт со знаком
            std::uint64_t raw = codec::read_be(data_ + pos, static_cast<std::size_t>(width));
            return Value(static_cast<std::int64_t>(raw));
        }

        case 0x2: {
            std::uint64_t width = 1ULL << low;
            if ((width != 4 && width != 8) || !in_range(pos, width)) {
                return fail(PlistErrorKind::BadOffset, "real out of range");
            }
            return Value(read_real(pos, width));
        }

        case 0x3:
            if (!in_range(pos, 8)) {
                return fail(PlistErrorKind::BadOffset, "date out of range");
            }
            return Value(read_real(pos, 8));

        case 0x4: {
            std::uint64_t len = 0;
            if (!read_length(marker, pos, len) || !in_range(pos, len)) {
                return fail(PlistErrorKind::BadOffset, "data out of range");
            }
            return Value(Value::Bytes(data_ + pos, data_ + pos + len));
        }

        case 0x5: {
            std::uint64_t len = 0;
            if (!read_length(marker, pos, len) || !in_range(pos, len)) {
                return fail(PlistErrorKind::BadOffset, "ascii string out of range");
            }
            return Value(std::string(reinterpret_cast<const char*>(data_ + pos),
                                     static_cast<std::size_t>(len)));
        }

        case 0x6: {
            std::uint64_t units = 0;
            if (!read_length(marker, pos, units) || units > offset_table_ ||
                !in_range(pos, units * 2)) {
                return fail(PlistErrorKind::BadOffset, "utf16 string out of range");
            }
            return Value(utf16be_to_utf8(data_ + pos, static_cast<std::size_t>(units)));
        }

        case 0x8: {
            std::uint64_t width = static_cast<std::uint64_t>(low) + 1;
            if (!in_range(pos, width)) {
                return fail(PlistErrorKind::BadOffset, "uid out of range");
            }
            Value uid = Value::make_object();
            uid.set(UID_KEY, Value(static_cast<std::int64_t>(
                                 codec::read_be(data_ + pos, static_cast<std::size_t>(width)))));
            return uid;
        }

        case 0xA:
        case 0xC: {
            std::uint64_t count = 0;
            if (!read_length(marker, pos, count) || count > num_objects_ * 2 + 16 ||
                !in_range(pos, count * ref_size_)) {
                return fail(PlistErrorKind::BadOffset, "array out of range");
            }
            active_.insert(index);
            Value::Array arr;
            arr.reserve(static_cast<std::size_t>(count));
            for (std::uint64_t i = 0; i < count; ++i) {
                std::uint64_t ref = codec::read_be(data_ + pos + i * ref_size_, ref_size_);
                auto item = read_object(ref, depth + 1);
                if (!item) {
                    return std::nullopt;
                }
                arr.push_back(std::move(*item));
            }
            active_.erase(index);
            return Value(std::move(arr));
        }

        case 0xD: {
            std::uint64_t count = 0;
            if (!read_length(marker, pos, count) || count > num_objects_ * 2 + 16 ||
                !in_range(pos, count * 2 * ref_size_)) {
                return fail(PlistErrorKind::BadOffset, "dict out of range");
            }
            active_.insert(index);
            Value::Object obj;
            for (std::uint64_t i = 0; i < count; ++i) {
                std::uint64_t key_ref = codec::read_be(data_ + pos + i * ref_size_, ref_size_);
                std::uint64_t val_ref =
                    codec::read_be(data_ + pos + (count + i) * ref_size_, ref_size_);
                auto key = read_object(key_ref, depth + 1);
                if (!key) {
                    return std::nullopt;
                }
                const std::string* key_str = key->get_string();
                if (key_str == nullptr) {
                    return fail(PlistErrorKind::BadObject, "dict key is not a string");
                }
                auto val = read_object(val_ref, depth + 1);
                if (!val) {
                    return std::nullopt;
                }
                obj[*key_str] = std::move(*val);
            }
            active_.erase(index);
            return Value(std::move(obj));
        }

        default:
            return fail(PlistErrorKind::BadObject,
                        "unknown object marker 0x" + codec::hex_encode(&marker, 1));
        }
    }

    double read_real(std::uint64_t pos, std::uint64_t width) const {
        if (width == 4) {
            std::uint32_t bits = static_cast<std::uint32_t>(codec::read_be(data_ + pos, 4));
            float f = 0;
            std::memcpy(&f, &bits, sizeof(f));
            return static_cast<double>(f);
        }
        std::uint64_t bits = codec::read_be(data_ + pos, 8);
        double d = 0;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_size_ = 0;
    std::size_t ref_size_ = 0;
    std::uint64_t num_objects_ = 0;
    std::uint64_t offset_table_ = 0;
    std::set<std::uint64_t> active_;
    std::vector<std::optional<Value>> cache_;
    PlistError error_;
};

// ----------------------------------------------------------------------------
// XML plist
// ----------------------------------------------------------------------------

std::string trimmed(const char* text) {
    std::string s = text ? text : "";
    auto start = s.find_first_not_of(" \t\r\n");
    auto end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    return s.substr(start, end - start + 1);
}

std::optional<Value> xml_element_to_value(const pugi::xml_node& node, int depth,
                                          PlistError* error) {
    if (depth > MAX_DEPTH) {
        set_error(error, PlistErrorKind::BadObject, "nesting too deep");
        return std::nullopt;
    }

    std::string name = node.name();

    if (name == "dict") {
        Value::Object obj;
        std::string pending_key;
        bool have_key = false;
        for (const auto& child : node.children()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            if (std::string(child.name()) == "key") {
                pending_key = child.child_value();
                have_key = true;
                continue;
            }
            if (!have_key) {
                set_error(error, PlistErrorKind::XmlParse, "dict value without key");
                return std::nullopt;
            }
            auto v = xml_element_to_value(child, depth + 1, error);
            if (!v) {
                return std::nullopt;
            }
            obj[pending_key] = std::move(*v);
            have_key = false;
        }
        return Value(std::move(obj));
    }

    if (name == "array") {
        Value::Array arr;
        for (const auto& child : node.children()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            auto v = xml_element_to_value(child, depth + 1, error);
            if (!v) {
                return std::nullopt;
            }
            arr.push_back(std::move(*v));
        }
        return Value(std::move(arr));
    }

    if (name == "string" || name == "date") {
        return Value(std::string(node.child_value()));
    }

    if (name == "integer") {
        std::string text = trimmed(node.child_value());
        try {
            std::size_t used = 0;
            long long v = std::stoll(text, &used, 10);
            if (used != text.size()) {
                throw std::invalid_argument(text);
            }
            return Value(static_cast<std::int64_t>(v));
        } catch (const std::exception&) {
            set_error(error, PlistErrorKind::XmlParse, "invalid integer '" + text + "'");
            return std::nullopt;
        }
    }

    if (name == "real") {
        std::string text = trimmed(node.child_value());
        try {
            return Value(std::stod(text));
        } catch (const std::exception&) {
            set_error(error, PlistErrorKind::XmlParse, "invalid real '" + text + "'");
            return std::nullopt;
        }
    }

    if (name == "true") {
        return Value(true);
    }
    if (name == "false") {
        return Value(false);
    }

    if (name == "data") {
        std::string compact;
        for (const char* p = node.child_value(); *p != '\0'; ++p) {
            if (*p != ' ' && *p != '\t' && *p != '\r' && *p != '\n') {
                compact.push_back(*p);
            }
        }
        auto bytes = codec::base64_decode(compact);
        if (!bytes) {
            set_error(error, PlistErrorKind::XmlParse, "invalid base64 in <data>");
            return std::nullopt;
        }
        return Value(std::move(*bytes));
    }

    set_error(error, PlistErrorKind::XmlParse, "unsupported element <" + name + ">");
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// NSKeyedArchiver
// ----------------------------------------------------------------------------

class Unarchiver {
public:
    explicit Unarchiver(const Value::Array& objects) : objects_(objects) {}

    std::optional<Value> resolve(std::uint64_t index, int depth) {
        if (index >= objects_.size() || depth > MAX_DEPTH || active_.count(index) != 0) {
            return std::nullopt;
        }
        auto cached = resolved_.find(index);
        if (cached != resolved_.end()) {
            return cached->second;
        }
        const Value& raw = objects_[index];

        if (const auto* s = raw.get_string()) {
            if (*s == "$null") {
                return Value();
            }
            return raw;
        }
        if (!raw.is_object()) {
            return raw;
        }

        active_.insert(index);
        auto result = resolve_object(raw, depth);
        active_.erase(index);
        if (result) {
            resolved_.emplace(index, *result);
        }
        return result;
    }

private:
    /// Значение поля: UID разворачивается, остальное как есть
    std::optional<Value> resolve_field(const Value& v, int depth) {
        std::uint64_t uid = 0;
        if (is_uid(v, uid)) {
            return resolve(uid, depth + 1);
        }
        if (const auto* arr = v.get_array()) {
            Value::Array out;
            for (const auto& item : *arr) {
                auto r = resolve_field(item, depth + 1);
                if (!r) {
                    return std::nullopt;
                }
                out.push_back(std::move(*r));
            }
            return Value(std::move(out));
        }
        return v;
    }

    std::string class_name(const Value& raw) {
        const Value* cls = raw.get("$class");
        std::uint64_t uid = 0;
        if (cls == nullptr || !is_uid(*cls, uid) || uid >= objects_.size()) {
            return {};
        }
        const Value* name = objects_[uid].get("$classname");
        if (name != nullptr && name->is_string()) {
            return name->as_string();
        }
        return {};
    }

    std::optional<Value> resolve_object(const Value& raw, int depth) {
        std::string cls = class_name(raw);

        if (cls == "NSString" || cls == "NSMutableString") {
            if (const Value* s = raw.get("NS.string")) {
                return resolve_field(*s, depth);
            }
            if (const Value* b = raw.get("NS.bytes")) {
                if (const auto* bytes = b->get_bytes()) {
                    return Value(std::string(bytes->begin(), bytes->end()));
                }
            }
            return Value(std::string());
        }

        if (cls == "NSAttributedString" || cls == "NSMutableAttributedString") {
            if (const Value* s = raw.get("NSString")) {
                return resolve_field(*s, depth);
            }
            return Value(std::string());
        }

        if (cls == "NSData" || cls == "NSMutableData") {
            if (const Value* d = raw.get("NS.data")) {
                return resolve_field(*d, depth);
            }
            return Value(Value::Bytes{});
        }

        if (cls == "NSDictionary" || cls == "NSMutableDictionary") {
            const Value* keys = raw.get("NS.keys");
            const Value* vals = raw.get("NS.objects");
            Value::Object out;
            if (keys != nullptr && vals != nullptr && keys->is_array() && vals->is_array()) {
                const auto& k = keys->as_array();
                const auto& v = vals->as_array();
                for (std::size_t i = 0; i < k.size() && i < v.size(); ++i) {
                    auto key = resolve_field(k[i], depth);
                    auto val = resolve_field(v[i], depth);
                    if (!key || !val || !key->is_string()) {
                        return std::nullopt;
                    }
                    out[key->as_string()] = std::move(*val);
                }
            }
            return Value(std::move(out));
        }

        if (cls == "NSArray" || cls == "NSMutableArray" || cls == "NSSet" ||
            cls == "NSMutableSet") {
            if (const Value* items = raw.get("NS.objects")) {
                return resolve_field(*items, depth);
            }
            return Value::make_array();
        }

        // Произвольный класс (MBFile и т.п.): поля разворачиваются по одному
        Value::Object out;
        for (const auto& [key, val] : raw.as_object()) {
            if (key == "$class") {
                continue;
            }
            auto r = resolve_field(val, depth);
            if (!r) {
                return std::nullopt;
            }
            out[key] = std::move(*r);
        }
        if (!cls.empty()) {
            out["$classname"] = Value(cls);
        }
        return Value(std::move(out));
    }

    const Value::Array& objects_;
    std::set<std::uint64_t> active_;
    std::map<std::uint64_t, Value> resolved_;
};

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::string PlistError::format() const {
    switch (kind) {
    case PlistErrorKind::Truncated:
        return "plist truncated: " + message;
    case PlistErrorKind::BadMagic:
        return "not a plist: " + message;
    case PlistErrorKind::BadOffset:
        return "plist offset error: " + message;
    case PlistErrorKind::BadObject:
        return "plist object error: " + message;
    case PlistErrorKind::XmlParse:
        return "plist xml error: " + message;
    case PlistErrorKind::Io:
        return "plist io error: " + message;
    }
    return message;
}

bool is_binary_plist(const std::uint8_t* data, std::size_t size) {
    return size >= 8 && std::memcmp(data, "bplist00", 8) == 0;
}

std::optional<Value> parse_binary(const std::uint8_t* data, std::size_t size, PlistError* error) {
    BinaryParser parser(data, size);
    auto value = parser.parse();
    if (!value && error != nullptr) {
        *error = parser.error();
    }
    return value;
}

std::optional<Value> parse_xml(std::string_view text, PlistError* error) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(text.data(), text.size());
    if (!result) {
        set_error(error, PlistErrorKind::XmlParse,
                  std::string(result.description()) + " at offset " +
                      std::to_string(result.offset));
        return std::nullopt;
    }

    pugi::xml_node root = doc.document_element();
    if (!root || std::string(root.name()) != "plist") {
        set_error(error, PlistErrorKind::BadMagic, "root element is not <plist>");
        return std::nullopt;
    }
    for (const auto& child : root.children()) {
        if (child.type() == pugi::node_element) {
            return xml_element_to_value(child, 0, error);
        }
    }
    return Value();
}

std::optional<Value> parse(const std::vector<std::uint8_t>& data, PlistError* error) {
    if (is_binary_plist(data.data(), data.size())) {
        return parse_binary(data.data(), data.size(), error);
    }
    // XML допускает BOM и пробелы перед '<'
    std::size_t i = 0;
    if (data.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        i = 3;
    }
    while (i < data.size() && (data[i] == ' ' || data[i] == '\n' || data[i] == '\r' ||
                               data[i] == '\t')) {
        ++i;
    }
    if (i < data.size() && data[i] == '<') {
        return parse_xml(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()),
                         error);
    }
    set_error(error, PlistErrorKind::BadMagic, "neither bplist00 nor XML");
    return std::nullopt;
}

std::optional<Value> parse_file(const std::filesystem::path& path, PlistError* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        set_error(error, PlistErrorKind::Io, "cannot open " + platform::path_to_utf8(path));
        return std::nullopt;
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
    return parse(data, error);
}

bool is_uid(const Value& v, std::uint64_t& out) {
    if (!v.is_object() || v.object_size() != 1) {
        return false;
    }
    const Value* uid = v.get(UID_KEY);
    std::int64_t n = 0;
    if (uid == nullptr || !uid->to_int64(n) || n < 0) {
        return false;
    }
    out = static_cast<std::uint64_t>(n);
    return true;
}

std::optional<Value> unarchive_object(const Value& root, std::uint64_t index) {
    const Value* objects = root.get("$objects");
    if (objects == nullptr || !objects->is_array()) {
        return std::nullopt;
    }
    Unarchiver unarchiver(objects->as_array());
    return unarchiver.resolve(index, 0);
}

std::optional<Value> unarchive_top(const Value& root, const std::string& key) {
    const Value* top = root.get("$top");
    if (top == nullptr) {
        return std::nullopt;
    }
    const Value* entry = top->get(key);
    std::uint64_t uid = 0;
    if (entry == nullptr || !is_uid(*entry, uid)) {
        return std::nullopt;
    }
    return unarchive_object(root, uid);
}

}  // namespace chatx::plist
