#pragma once

/**
 * @file base62.hpp
 * @brief Base62 codec for 128-bit values (short identifier form)
 *
 * Alphabet: 0-9, A-Z, a-z (digit value = index).
 * encode() produces the minimal representation; zero encodes as "0".
 */

#include "tagid/uint128.hpp"

#include <string>
#include <string_view>

namespace tagid {
namespace base62 {

constexpr std::string_view ALPHABET =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

constexpr uint32_t BASE = 62;

// Longest encoding of a 128-bit value (62^22 > 2^128)
constexpr size_t MAX_ENCODED_LENGTH = 22;

/// Digit value of a character, or -1 if outside the alphabet
[[nodiscard]] constexpr int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

[[nodiscard]] std::string encode(Uint128 value);

/// Decode base62 text.
/// Throws MalformedShortEncodingError on empty input, a character outside
/// the alphabet, or a value that does not fit in 128 bits.
[[nodiscard]] Uint128 decode(std::string_view text);

}  // namespace base62
}  // namespace tagid
