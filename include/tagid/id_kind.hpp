#pragma once

/**
 * @file id_kind.hpp
 * @brief Descriptor for one kind of typed identifier (e.g. "User" / "user")
 *
 * Kinds are created only by TypeRegistry and live as long as the registry
 * that created them. There is exactly one IdKind object per tag per
 * registry, so "is this the User kind" is an address comparison.
 */

#include <string>
#include <string_view>

namespace tagid {

class TypeRegistry;

class IdKind {
public:
    IdKind(const IdKind&) = delete;
    IdKind& operator=(const IdKind&) = delete;

    /// Display name as registered, casing preserved ("User")
    [[nodiscard]] const std::string& displayName() const { return displayName_; }

    /// Normalized (lowercase) type tag ("user")
    [[nodiscard]] const std::string& typeTag() const { return typeTag_; }

    /// Type name used in debug output ("UserId")
    [[nodiscard]] const std::string& typeName() const { return typeName_; }

    /// Regex matching this kind's canonical text form (use case-insensitively)
    [[nodiscard]] std::string formatPattern() const;

    /// True if the tag names this kind (case-insensitive)
    [[nodiscard]] bool matchesTag(std::string_view tag) const;

private:
    friend class TypeRegistry;

    IdKind(std::string displayName, std::string typeTag);

    std::string displayName_;
    std::string typeTag_;
    std::string typeName_;
};

}  // namespace tagid
