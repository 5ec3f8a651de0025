#pragma once

/**
 * @file serialization.hpp
 * @brief Persisted forms of typed identifiers
 *
 * Text form (database columns, JSON, validation models): the canonical
 * string, e.g. "user-550e8400-e29b-41d4-a716-446655440000".
 *
 * Binary state form: CBOR map with exactly the fields needed to rebuild
 * the value where its kind is registered:
 *   { "type_id": text, "uuid": bytes(16) }
 * A list is a CBOR array of such maps. Decoding re-validates the tag and
 * resolves it through the registry; unknown map keys are skipped.
 */

#include "tagid/type_registry.hpp"
#include "tagid/typed_id.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tagid {

/// Plain {tag, uuid} pair, independent of any registry
struct IdState {
    std::string typeTag;
    Uuid uuid;

    bool operator==(const IdState&) const = default;
};

// ============================================================================
// Text form
// ============================================================================

/// Canonical string; also the value written when an identifier is a JSON field.
[[nodiscard]] std::string toText(const TypedId& id);

/// Parse text produced by toText() (short form is accepted too).
/// Throws InvalidUuidError or UnknownTypeTagError.
[[nodiscard]] TypedId fromText(std::string_view text,
                               const TypeRegistry& registry = TypeRegistry::global());

// ============================================================================
// State form
// ============================================================================

[[nodiscard]] IdState stateOf(const TypedId& id);

/// Rebuild from a state. Throws InvalidTypeTagError if the tag is malformed,
/// UnknownTypeTagError if it is not registered.
[[nodiscard]] TypedId fromState(const IdState& state,
                                const TypeRegistry& registry = TypeRegistry::global());

[[nodiscard]] std::vector<uint8_t> encodeState(const TypedId& id);
[[nodiscard]] std::vector<uint8_t> encodeStates(const std::vector<TypedId>& ids);

/// Decode CBOR produced by encodeState(). Structural problems (truncation,
/// wrong types, missing fields, trailing data) throw InvalidUuidError.
[[nodiscard]] TypedId decodeState(std::span<const uint8_t> data,
                                  const TypeRegistry& registry = TypeRegistry::global());
[[nodiscard]] std::vector<TypedId> decodeStates(std::span<const uint8_t> data,
                                                const TypeRegistry& registry = TypeRegistry::global());

}  // namespace tagid
