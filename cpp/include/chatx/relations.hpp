// ==============================================================================
// chatx/relations.hpp - Relationship Resolver: реакции и ответы
// ==============================================================================
//
// Назначение:
// - Association: закрытый вариант кода associated_message_type
// - Две фазы над полным набором строк в порядке сканирования:
//   1) индекс guid → сообщение по всем строкам, не являющимся реакциями
//   2) свёртка реакций в целевое сообщение, разрешение ответов
//
// Коды:
//   2000..2006  реакция (love like dislike amused emphasize question custom)
//   3000..3006  снятие реакции того же вида
//   прочие с ключом  кандидат в ответ (возможно неразрешённый)
//
// Ни одна связь не выдумывается: ненайденная цель остаётся NULL и
// записывается как UnresolvedRelation.
//
// ==============================================================================

#ifndef CHATX_RELATIONS_HPP
#define CHATX_RELATIONS_HPP

#include <chatx/decode.hpp>
#include <chatx/message.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chatx::relations {

// ----------------------------------------------------------------------------
// Association
// ----------------------------------------------------------------------------

struct NoAssociation {};

struct ReactionAdd {
    message::ReactionKind kind;
};

struct ReactionRemove {
    message::ReactionKind kind;
};

/// Любой иной код при заданном ключе, включая неизвестные
struct ReplyCandidate {
    std::int64_t code = 0;
};

using Association = std::variant<NoAssociation, ReactionAdd, ReactionRemove, ReplyCandidate>;

constexpr std::int64_t REACTION_BASE = 2000;
constexpr std::int64_t REMOVAL_BASE = 3000;
constexpr std::int64_t REACTION_KIND_COUNT = 7;

Association classify_association(std::int64_t code, bool has_key);

/// Является ли строка реакцией (добавлением или снятием)
bool is_reaction_row(const Association& association);

/// Убрать префикс части из ключа: "p:0/GUID" → "GUID", "bp:GUID" → "GUID"
std::string strip_association_prefix(std::string_view key);

// ----------------------------------------------------------------------------
// Разрешение
// ----------------------------------------------------------------------------

struct RelationStats {
    std::size_t reactions_folded = 0;
    std::size_t reactions_deduplicated = 0;
    std::size_t reaction_removals = 0;
    std::size_t reactions_unresolved = 0;
    std::size_t replies_resolved = 0;
    std::size_t replies_unresolved = 0;
};

struct ResolveResult {
    /// Сообщения в порядке сканирования, без строк-реакций
    std::vector<message::CanonicalMessage> messages;
    std::vector<message::UnresolvedRelation> unresolved;
    RelationStats stats;
};

ResolveResult resolve(std::vector<decode::DecodedRow> rows);

}  // namespace chatx::relations

#endif  // CHATX_RELATIONS_HPP
