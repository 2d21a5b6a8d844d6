// ==============================================================================
// message.cpp - Каноническая модель сообщения и её JSON представление
// ==============================================================================

#include "chatx/message.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatx::message {

namespace {

using Alloc = rapidjson::Document::AllocatorType;

void add_string(rapidjson::Value& obj, const char* key, const std::string& value, Alloc& alloc) {
    rapidjson::Value v(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), alloc);
    obj.AddMember(rapidjson::StringRef(key), v, alloc);
}

void add_optional(rapidjson::Value& obj, const char* key, const std::optional<std::string>& value,
                  Alloc& alloc) {
    if (value) {
        add_string(obj, key, *value, alloc);
    } else {
        obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(rapidjson::kNullType), alloc);
    }
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

}  // namespace

// ----------------------------------------------------------------------------
// Имена перечислений
// ----------------------------------------------------------------------------

const char* reaction_kind_name(ReactionKind kind) {
    switch (kind) {
    case ReactionKind::Love:
        return "love";
    case ReactionKind::Like:
        return "like";
    case ReactionKind::Dislike:
        return "dislike";
    case ReactionKind::Amused:
        return "amused";
    case ReactionKind::Emphasize:
        return "emphasize";
    case ReactionKind::Question:
        return "question";
    case ReactionKind::Custom:
        return "custom";
    }
    return "custom";
}

std::optional<ReactionKind> parse_reaction_kind(std::string_view name) {
    static const ReactionKind all[] = {ReactionKind::Love,     ReactionKind::Like,
                                       ReactionKind::Dislike,  ReactionKind::Amused,
                                       ReactionKind::Emphasize, ReactionKind::Question,
                                       ReactionKind::Custom};
    for (ReactionKind kind : all) {
        if (name == reaction_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* attachment_type_name(AttachmentType type) {
    switch (type) {
    case AttachmentType::Image:
        return "image";
    case AttachmentType::Video:
        return "video";
    case AttachmentType::Audio:
        return "audio";
    case AttachmentType::File:
        return "file";
    case AttachmentType::Unknown:
        return "unknown";
    }
    return "unknown";
}

const char* relation_kind_name(RelationKind kind) {
    switch (kind) {
    case RelationKind::Reply:
        return "reply";
    case RelationKind::Reaction:
        return "reaction";
    case RelationKind::ReactionRemoval:
        return "reaction_removal";
    }
    return "reply";
}

// ----------------------------------------------------------------------------
// Классификация вложений
// ----------------------------------------------------------------------------

AttachmentType classify_attachment(const std::optional<std::string>& mime_type,
                                   const std::optional<std::string>& uti,
                                   std::string_view filename) {
    if (mime_type && !mime_type->empty()) {
        std::string mime = lower(*mime_type);
        if (starts_with(mime, "image/")) {
            return AttachmentType::Image;
        }
        if (starts_with(mime, "video/")) {
            return AttachmentType::Video;
        }
        if (starts_with(mime, "audio/")) {
            return AttachmentType::Audio;
        }
        return AttachmentType::File;
    }

    if (uti && !uti->empty()) {
        static const char* const audio_utis[] = {"public.audio", "public.mp3",
                                                 "public.mpeg-4-audio",
                                                 "com.apple.coreaudio-format",
                                                 "com.apple.m4a-audio"};
        for (const char* a : audio_utis) {
            if (*uti == a) {
                return AttachmentType::Audio;
            }
        }
        if (*uti == "public.jpeg" || *uti == "public.png" || *uti == "public.heic" ||
            *uti == "public.image" || *uti == "com.compuserve.gif") {
            return AttachmentType::Image;
        }
        if (*uti == "public.movie" || *uti == "com.apple.quicktime-movie" ||
            *uti == "public.mpeg-4") {
            return AttachmentType::Video;
        }
    }

    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) {
        return (mime_type || uti) ? AttachmentType::File : AttachmentType::Unknown;
    }
    std::string ext = lower(filename.substr(dot + 1));
    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "heic" ||
        ext == "webp") {
        return AttachmentType::Image;
    }
    if (ext == "mov" || ext == "mp4" || ext == "m4v") {
        return AttachmentType::Video;
    }
    if (ext == "caf" || ext == "m4a" || ext == "mp3" || ext == "wav" || ext == "amr" ||
        ext == "aac") {
        return AttachmentType::Audio;
    }
    return AttachmentType::File;
}

// ----------------------------------------------------------------------------
// Идентификаторы и время
// ----------------------------------------------------------------------------

std::string make_msg_id(std::int64_t rowid) {
    return "msg_" + std::to_string(rowid);
}

std::string format_timestamp(std::int64_t unix_seconds) {
    std::time_t time = static_cast<std::time_t>(unix_seconds);
    std::tm tm_result{};
    if (gmtime_r(&time, &tm_result) == nullptr) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << (tm_result.tm_year + 1900) << "-" << std::setw(2)
        << (tm_result.tm_mon + 1) << "-" << std::setw(2) << tm_result.tm_mday << "T" << std::setw(2)
        << tm_result.tm_hour << ":" << std::setw(2) << tm_result.tm_min << ":" << std::setw(2)
        << tm_result.tm_sec << "Z";
    return oss.str();
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void to_rapidjson(const CanonicalMessage& msg, rapidjson::Value& out, Alloc& alloc) {
    out.SetObject();
    add_string(out, "msg_id", msg.msg_id, alloc);
    add_string(out, "conv_id", msg.conv_id, alloc);
    add_string(out, "platform", msg.platform, alloc);
    add_string(out, "timestamp", format_timestamp(msg.timestamp), alloc);
    add_string(out, "sender", msg.sender, alloc);
    add_string(out, "sender_id", msg.sender_id, alloc);
    out.AddMember("is_me", msg.is_me, alloc);
    add_string(out, "text", msg.text, alloc);
    add_optional(out, "reply_to_msg_id", msg.reply_to_msg_id, alloc);

    rapidjson::Value reactions(rapidjson::kArrayType);
    for (const auto& r : msg.reactions) {
        rapidjson::Value item(rapidjson::kObjectType);
        add_string(item, "from", r.from, alloc);
        item.AddMember("kind", rapidjson::StringRef(reaction_kind_name(r.kind)), alloc);
        add_string(item, "ts", format_timestamp(r.ts), alloc);
        if (r.emoji) {
            add_string(item, "emoji", *r.emoji, alloc);
        }
        reactions.PushBack(item, alloc);
    }
    out.AddMember("reactions", reactions, alloc);

    rapidjson::Value attachments(rapidjson::kArrayType);
    for (const auto& a : msg.attachments) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("type", rapidjson::StringRef(attachment_type_name(a.type)), alloc);
        add_string(item, "filename", a.filename, alloc);
        add_optional(item, "abs_path", a.abs_path, alloc);
        add_optional(item, "mime_type", a.mime_type, alloc);
        add_optional(item, "uti", a.uti, alloc);
        add_optional(item, "transfer_name", a.transfer_name, alloc);
        if (a.sha256) {
            add_string(item, "sha256", *a.sha256, alloc);
        }
        if (a.total_bytes) {
            item.AddMember("total_bytes", static_cast<std::int64_t>(*a.total_bytes), alloc);
        }
        attachments.PushBack(item, alloc);
    }
    out.AddMember("attachments", attachments, alloc);

    rapidjson::Value source_ref(rapidjson::kObjectType);
    add_string(source_ref, "guid", msg.source_ref.guid, alloc);
    add_string(source_ref, "path", msg.source_ref.path, alloc);
    out.AddMember("source_ref", source_ref, alloc);

    rapidjson::Value meta;
    msg.source_meta.to_rapidjson(meta, alloc);
    out.AddMember("source_meta", meta, alloc);
}

rapidjson::Document to_document(const CanonicalMessage& msg) {
    rapidjson::Document doc;
    to_rapidjson(msg, doc, doc.GetAllocator());
    return doc;
}

}  // namespace chatx::message
