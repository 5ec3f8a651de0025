#pragma once

/**
 * @file auto_parser.hpp
 * @brief Tag-agnostic parsing: detect the text form, resolve the kind
 *
 * Form detection is decided from the separators alone:
 *   canonical  '-' at offset 1..8, before any '_', followed by 36 characters
 *   short      '_' at offset 1..8, before any '-'
 * Anything else is rejected with InvalidUuidError.
 *
 * The tag and body are checked structurally before the registry is
 * consulted, so UnknownTypeTagError is only raised for well-formed text.
 */

#include "tagid/type_registry.hpp"
#include "tagid/typed_id.hpp"

#include <string_view>

namespace tagid {

class AutoParser {
public:
    enum class Form {
        Canonical,
        Short,
        Unrecognized
    };

    explicit AutoParser(const TypeRegistry& registry = TypeRegistry::global())
        : registry_(registry) {}

    /// Which form the text looks like (no validation beyond separators)
    [[nodiscard]] static Form detectForm(std::string_view text);

    /// Parse canonical or short text into an identifier of the registered kind.
    /// Throws InvalidUuidError (malformed) or UnknownTypeTagError.
    [[nodiscard]] TypedId parse(std::string_view text) const;

private:
    [[nodiscard]] TypedId parseCanonical(std::string_view text, size_t sep) const;
    [[nodiscard]] TypedId parseShort(std::string_view text, size_t sep) const;
    [[nodiscard]] const IdKind& resolve(std::string_view tag) const;

    const TypeRegistry& registry_;
};

/// Shorthand for AutoParser(registry).parse(text)
[[nodiscard]] TypedId parseTypedId(std::string_view text,
                                   const TypeRegistry& registry = TypeRegistry::global());

}  // namespace tagid
