#pragma once

/**
 * @file uuid.hpp
 * @brief 128-bit UUID value (RFC 4122 layout, big-endian bytes)
 *
 * Text form is the standard 8-4-4-4-12 hyphenated hex. Parsing accepts any
 * hex case; formatting is always lowercase.
 */

#include "tagid/uint128.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tagid {

class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    // Length of the hyphenated text form
    static constexpr size_t TEXT_LENGTH = 36;

    /// Nil UUID (all zero bits)
    constexpr Uuid() = default;
    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// Random version 4 UUID from the OS entropy source
    [[nodiscard]] static Uuid generate();

    /// Parse hyphenated text. Throws InvalidUuidError if malformed.
    [[nodiscard]] static Uuid fromString(std::string_view text);

    /// Parse hyphenated text. Returns nullopt if malformed.
    [[nodiscard]] static std::optional<Uuid> tryParse(std::string_view text);

    [[nodiscard]] static Uuid fromUint128(const Uint128& value);

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] Uint128 toUint128() const;

    [[nodiscard]] const Bytes& bytes() const { return bytes_; }
    [[nodiscard]] bool isNil() const;

    /// Version nibble (4 for generated UUIDs)
    [[nodiscard]] int version() const { return bytes_[6] >> 4; }

    // Byte-wise comparison of big-endian bytes equals unsigned 128-bit order
    bool operator==(const Uuid&) const = default;
    auto operator<=>(const Uuid&) const = default;

private:
    Bytes bytes_{};
};

}  // namespace tagid

template<>
struct std::hash<tagid::Uuid> {
    size_t operator()(const tagid::Uuid& uuid) const noexcept {
        auto v = uuid.toUint128();
        return std::hash<uint64_t>{}(v.hi) ^ (std::hash<uint64_t>{}(v.lo) * 0x9E3779B97F4A7C15ull);
    }
};
