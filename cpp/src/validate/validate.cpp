// ==============================================================================
// validate.cpp - Проверка записей и карантин
// ==============================================================================

#include "chatx/validate.hpp"

#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

#include <stdexcept>

namespace chatx::validate {

namespace {

constexpr const char* TIMESTAMP_PATTERN =
    "^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}Z$";

const std::string& schema_text() {
    static const std::string text = std::string(R"({
  "$schema": "http://json-schema.org/draft-04/schema#",
  "title": "CanonicalMessage",
  "type": "object",
  "required": ["msg_id", "conv_id", "platform", "timestamp", "sender", "sender_id", "is_me",
               "text", "reply_to_msg_id", "reactions", "attachments", "source_ref",
               "source_meta"],
  "additionalProperties": false,
  "properties": {
    "msg_id": {"type": "string", "pattern": "^msg_-?[0-9]+$"},
    "conv_id": {"type": "string", "minLength": 1},
    "platform": {"enum": ["imessage"]},
    "timestamp": {"type": "string", "pattern": ")") + TIMESTAMP_PATTERN + R"("},
    "sender": {"type": "string", "minLength": 1},
    "sender_id": {"type": "string", "minLength": 1},
    "is_me": {"type": "boolean"},
    "text": {"type": "string"},
    "reply_to_msg_id": {"type": ["string", "null"]},
    "reactions": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["from", "kind", "ts"],
        "additionalProperties": false,
        "properties": {
          "from": {"type": "string", "minLength": 1},
          "kind": {"enum": ["love", "like", "dislike", "amused", "emphasize", "question",
                            "custom"]},
          "ts": {"type": "string", "pattern": ")" + TIMESTAMP_PATTERN + R"("},
          "emoji": {"type": "string"}
        }
      }
    },
    "attachments": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["type", "filename", "abs_path"],
        "additionalProperties": false,
        "properties": {
          "type": {"enum": ["image", "video", "audio", "file", "unknown"]},
          "filename": {"type": "string"},
          "abs_path": {"type": ["string", "null"]},
          "mime_type": {"type": ["string", "null"]},
          "uti": {"type": ["string", "null"]},
          "transfer_name": {"type": ["string", "null"]},
          "sha256": {"type": "string", "pattern": "^[0-9a-f]{64}$"},
          "total_bytes": {"type": "integer"}
        }
      }
    },
    "source_ref": {
      "type": "object",
      "required": ["guid", "path"],
      "properties": {
        "guid": {"type": "string", "minLength": 1},
        "path": {"type": "string"}
      }
    },
    "source_meta": {"type": "object"}
  }
})";
    return text;
}

}  // namespace

const char* canonical_schema() {
    return schema_text().c_str();
}

// ----------------------------------------------------------------------------
// Validator
// ----------------------------------------------------------------------------

struct Validator::Impl {
    explicit Impl(const rapidjson::Document& doc) : schema(doc) {}
    rapidjson::SchemaDocument schema;
};

Validator::Validator() {
    rapidjson::Document doc;
    doc.Parse(schema_text().c_str());
    if (doc.HasParseError()) {
        throw std::logic_error("embedded message schema is not valid JSON");
    }
    impl_ = std::make_unique<Impl>(doc);
}

Validator::~Validator() = default;

std::optional<std::string> Validator::check_schema(const rapidjson::Value& doc) const {
    rapidjson::SchemaValidator validator(impl_->schema);
    if (doc.Accept(validator)) {
        return std::nullopt;
    }
    rapidjson::StringBuffer pointer;
    validator.GetInvalidDocumentPointer().StringifyUriFragment(pointer);
    std::string where = pointer.GetString();
    return std::string("schema: ") + validator.GetInvalidSchemaKeyword() + " violated at " +
           (where.empty() ? "#" : where);
}

std::optional<std::string> Validator::check(const message::CanonicalMessage& msg,
                                            const rapidjson::Value& doc) const {
    if (auto error = check_schema(doc)) {
        return error;
    }
    if (msg.timestamp < MIN_TIMESTAMP || msg.timestamp >= MAX_TIMESTAMP) {
        return "timestamp out of range: " + std::to_string(msg.timestamp);
    }
    for (const auto& r : msg.reactions) {
        if (r.ts < MIN_TIMESTAMP || r.ts >= MAX_TIMESTAMP) {
            return "reaction timestamp out of range: " + std::to_string(r.ts);
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// QuarantineSink
// ----------------------------------------------------------------------------

bool QuarantineSink::open() {
    return file_.open(path_);
}

bool QuarantineSink::write(std::size_t index, const std::string& msg_id, const std::string& error,
                           const rapidjson::Value& row) {
    if (!file_.is_open() && !open()) {
        return false;
    }
    rapidjson::Document entry;
    entry.SetObject();
    auto& alloc = entry.GetAllocator();
    entry.AddMember("index", static_cast<std::uint64_t>(index), alloc);
    entry.AddMember("msg_id",
                    rapidjson::Value(msg_id.c_str(),
                                     static_cast<rapidjson::SizeType>(msg_id.size()), alloc),
                    alloc);
    entry.AddMember("error",
                    rapidjson::Value(error.c_str(),
                                     static_cast<rapidjson::SizeType>(error.size()), alloc),
                    alloc);
    rapidjson::Value copy(row, alloc);
    entry.AddMember("row", copy, alloc);
    if (!file_.write(entry)) {
        return false;
    }
    ++count_;
    return true;
}

bool QuarantineSink::close() {
    return file_.close();
}

}  // namespace chatx::validate
