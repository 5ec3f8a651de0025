#pragma once

/**
 * @file uint128.hpp
 * @brief Fixed-width 128-bit unsigned integer
 *
 * Only the operations the base62 codec needs: comparison, division by a
 * small divisor with remainder, and multiply-add by small factors with
 * overflow detection. Arithmetic is done on 32-bit limbs so no
 * intermediate ever exceeds 64 bits.
 */

#include <compare>
#include <cstdint>
#include <limits>

namespace tagid {

struct Uint128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    constexpr Uint128() = default;
    constexpr Uint128(uint64_t high, uint64_t low) : hi(high), lo(low) {}

    [[nodiscard]] static constexpr Uint128 fromU64(uint64_t value) { return {0, value}; }

    [[nodiscard]] static constexpr Uint128 max() {
        return {std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max()};
    }

    [[nodiscard]] constexpr bool isZero() const { return hi == 0 && lo == 0; }

    /// Divide in place by a non-zero divisor, returning the remainder.
    uint32_t divMod(uint32_t divisor);

    /// this = this * factor + addend.
    /// Returns false (leaving *this unspecified) if the result exceeds 128 bits.
    [[nodiscard]] bool mulAdd(uint32_t factor, uint32_t addend);

    constexpr bool operator==(const Uint128&) const = default;
    constexpr auto operator<=>(const Uint128&) const = default;
};

}  // namespace tagid
