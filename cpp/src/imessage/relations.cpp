// ==============================================================================
// relations.cpp - Свёртка реакций и разрешение ответов
// ==============================================================================

#include "chatx/relations.hpp"

#include <iterator>
#include <unordered_map>

namespace chatx::relations {

namespace {

message::ReactionKind kind_for_offset(std::int64_t offset) {
    static const message::ReactionKind kinds[] = {
        message::ReactionKind::Love,     message::ReactionKind::Like,
        message::ReactionKind::Dislike,  message::ReactionKind::Amused,
        message::ReactionKind::Emphasize, message::ReactionKind::Question,
        message::ReactionKind::Custom};
    return kinds[offset];
}

bool in_range(std::int64_t code, std::int64_t base) {
    return code >= base && code < base + REACTION_KIND_COUNT;
}

}  // namespace

Association classify_association(std::int64_t code, bool has_key) {
    if (in_range(code, REACTION_BASE)) {
        return ReactionAdd{kind_for_offset(code - REACTION_BASE)};
    }
    if (in_range(code, REMOVAL_BASE)) {
        return ReactionRemove{kind_for_offset(code - REMOVAL_BASE)};
    }
    if (has_key) {
        return ReplyCandidate{code};
    }
    return NoAssociation{};
}

bool is_reaction_row(const Association& association) {
    return std::holds_alternative<ReactionAdd>(association) ||
           std::holds_alternative<ReactionRemove>(association);
}

std::string strip_association_prefix(std::string_view key) {
    if (key.substr(0, 2) == "p:") {
        auto slash = key.find('/');
        if (slash != std::string_view::npos) {
            return std::string(key.substr(slash + 1));
        }
    }
    if (key.substr(0, 3) == "bp:") {
        return std::string(key.substr(3));
    }
    return std::string(key);
}

ResolveResult resolve(std::vector<decode::DecodedRow> rows) {
    ResolveResult result;

    // ------------------------------------------------------------------------
    // Фаза 1: индекс
    // ------------------------------------------------------------------------

    std::vector<Association> associations;
    associations.reserve(rows.size());
    std::vector<std::size_t> position(rows.size(), 0);
    std::unordered_map<std::string, std::size_t> by_guid;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        associations.push_back(
            classify_association(rows[i].association_type, rows[i].association_key.has_value()));
        if (is_reaction_row(associations.back())) {
            continue;
        }
        position[i] = result.messages.size();
        if (!rows[i].guid.empty()) {
            // При повторе guid побеждает первая строка
            by_guid.emplace(rows[i].guid, position[i]);
        }
        result.messages.push_back(std::move(rows[i].message));
    }

    auto find_target = [&](const std::string& key) -> message::CanonicalMessage* {
        auto it = by_guid.find(strip_association_prefix(key));
        return it == by_guid.end() ? nullptr : &result.messages[it->second];
    };

    auto record = [&](const decode::DecodedRow& row, const std::string& key,
                      message::RelationKind kind) {
        message::UnresolvedRelation rel;
        rel.origin_rowid = row.rowid;
        rel.origin_msg_id = message::make_msg_id(row.rowid);
        rel.association_key = key;
        rel.kind = kind;
        result.unresolved.push_back(std::move(rel));
    };

    // ------------------------------------------------------------------------
    // Фаза 2: свёртка в порядке сканирования
    // ------------------------------------------------------------------------

    for (std::size_t i = 0; i < rows.size(); ++i) {
        const decode::DecodedRow& row = rows[i];
        const Association& association = associations[i];
        const std::string key = row.association_key.value_or("");

        if (const auto* add = std::get_if<ReactionAdd>(&association)) {
            // Строка-реакция не попала в messages: её message ещё на месте
            const message::CanonicalMessage& self = row.message;
            message::CanonicalMessage* target = key.empty() ? nullptr : find_target(key);
            if (target == nullptr) {
                record(row, key, message::RelationKind::Reaction);
                ++result.stats.reactions_unresolved;
                continue;
            }

            message::Reaction reaction;
            reaction.from = self.sender_id;
            reaction.kind = add->kind;
            reaction.ts = self.timestamp;
            if (add->kind == message::ReactionKind::Custom) {
                if (row.association_emoji && !row.association_emoji->empty()) {
                    reaction.emoji = row.association_emoji;
                } else if (!self.text.empty()) {
                    reaction.emoji = self.text;
                }
            }

            bool duplicate = false;
            for (const auto& existing : target->reactions) {
                if (existing.from == reaction.from && existing.kind == reaction.kind &&
                    existing.ts == reaction.ts) {
                    duplicate = true;
                    break;
                }
            }
            if (duplicate) {
                ++result.stats.reactions_deduplicated;
                continue;
            }
            target->reactions.push_back(std::move(reaction));
            ++result.stats.reactions_folded;
            continue;
        }

        if (const auto* remove = std::get_if<ReactionRemove>(&association)) {
            message::CanonicalMessage* target = key.empty() ? nullptr : find_target(key);
            if (target == nullptr) {
                record(row, key, message::RelationKind::ReactionRemoval);
                ++result.stats.reactions_unresolved;
                continue;
            }
            // Снимается последняя реакция того же автора и вида
            auto& reactions = target->reactions;
            for (auto it = reactions.rbegin(); it != reactions.rend(); ++it) {
                if (it->from == row.message.sender_id && it->kind == remove->kind) {
                    reactions.erase(std::next(it).base());
                    ++result.stats.reaction_removals;
                    break;
                }
            }
            continue;
        }

        // Ответ: ключ ассоциации, иначе thread_originator_guid
        std::string reply_key;
        if (std::holds_alternative<ReplyCandidate>(association)) {
            reply_key = key;
        } else if (row.thread_originator_guid) {
            reply_key = *row.thread_originator_guid;
        } else {
            continue;
        }

        message::CanonicalMessage& msg = result.messages[position[i]];
        const message::CanonicalMessage* target = find_target(reply_key);
        if (target != nullptr && target != &msg) {
            msg.reply_to_msg_id = target->msg_id;
            ++result.stats.replies_resolved;
        } else {
            record(row, reply_key, message::RelationKind::Reply);
            ++result.stats.replies_unresolved;
        }
    }

    return result;
}

}  // namespace chatx::relations
