#pragma once

/**
 * @file typed_id.hpp
 * @brief Immutable {kind, UUID} identifier value
 *
 * Text forms:
 *   canonical   user-550e8400-e29b-41d4-a716-446655440000
 *   short       user_2aUyqjCzEIiEcYMKj7TZtw   (base62 of the UUID as a 128-bit integer)
 *   debug       UserId('user-550e8400-e29b-41d4-a716-446655440000')
 *
 * Every construction path yields a fully valid value or throws a
 * TypedIdError subtype; there is no "empty" TypedId.
 *
 * Ordering: by type tag first, then by UUID as an unsigned 128-bit integer.
 *
 * Usage:
 *   const IdKind& user = TypeRegistry::global().registerOrGet("User", "user");
 *   TypedId id = TypedId::generate(user);
 *   TypedId same = TypedId::fromShort(user, id.shortString());
 */

#include "tagid/id_kind.hpp"
#include "tagid/uuid.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace tagid {

class TypedId {
public:
    TypedId(const IdKind& kind, const Uuid& uuid) : kind_(&kind), uuid_(uuid) {}

    // ========================================================================
    // Construction
    // ========================================================================

    /// New identifier with a random version 4 UUID
    [[nodiscard]] static TypedId generate(const IdKind& kind);

    /// Parse canonical text ("user-<uuid>") or a plain UUID ("<uuid>").
    /// Throws TypeTagMismatchError if the prefix names another tag,
    /// InvalidUuidError if the text is malformed.
    [[nodiscard]] static TypedId fromString(const IdKind& kind, std::string_view text);

    /// Parse short text ("user_<base62>").
    /// Throws InvalidUuidError if there is no underscore or the body is not
    /// valid base62, TypeTagMismatchError if the prefix names another tag.
    [[nodiscard]] static TypedId fromShort(const IdKind& kind, std::string_view text);

    /// Accept any representation for this kind. A TypedId of the same kind
    /// is returned as-is; one of another kind throws TypeTagMismatchError.
    [[nodiscard]] static const TypedId& validate(const IdKind& kind, const TypedId& value);
    [[nodiscard]] static TypedId validate(const IdKind& kind, const Uuid& value);
    [[nodiscard]] static TypedId validate(const IdKind& kind, std::string_view value);

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const IdKind& kind() const { return *kind_; }
    [[nodiscard]] const std::string& typeTag() const { return kind_->typeTag(); }
    [[nodiscard]] const Uuid& uuid() const { return uuid_; }

    /// True if this identifier belongs to exactly this kind object
    [[nodiscard]] bool is(const IdKind& kind) const { return kind_ == &kind; }

    // ========================================================================
    // Formatting
    // ========================================================================

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] std::string shortString() const;
    [[nodiscard]] std::string debugString() const;

    /// UUID part only, without the tag
    [[nodiscard]] std::string uuidString() const { return uuid_.toString(); }

    /// UTF-8 bytes of the canonical text
    [[nodiscard]] std::vector<uint8_t> toBytes() const;

    // ========================================================================
    // Comparison
    // ========================================================================

    bool operator==(const TypedId& other) const {
        return typeTag() == other.typeTag() && uuid_ == other.uuid_;
    }

    std::strong_ordering operator<=>(const TypedId& other) const;

    /// Compares against canonical text
    bool operator==(std::string_view text) const { return toString() == text; }

private:
    const IdKind* kind_;
    Uuid uuid_;
};

/// Writes the canonical text; honors stream width and fill
std::ostream& operator<<(std::ostream& os, const TypedId& id);

}  // namespace tagid

template<>
struct std::hash<tagid::TypedId> {
    size_t operator()(const tagid::TypedId& id) const noexcept {
        size_t h = std::hash<std::string>{}(id.typeTag());
        return h ^ (std::hash<tagid::Uuid>{}(id.uuid()) + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2));
    }
};
