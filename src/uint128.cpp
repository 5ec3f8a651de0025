#include "tagid/uint128.hpp"

#include <array>

namespace tagid {

namespace {

constexpr uint64_t LIMB_MASK = 0xFFFFFFFFull;

// Most significant limb first
std::array<uint64_t, 4> toLimbs(const Uint128& v) {
    return {v.hi >> 32, v.hi & LIMB_MASK, v.lo >> 32, v.lo & LIMB_MASK};
}

Uint128 fromLimbs(const std::array<uint64_t, 4>& limbs) {
    return {(limbs[0] << 32) | limbs[1], (limbs[2] << 32) | limbs[3]};
}

}  // namespace

uint32_t Uint128::divMod(uint32_t divisor) {
    auto limbs = toLimbs(*this);
    uint64_t remainder = 0;
    for (auto& limb : limbs) {
        uint64_t current = (remainder << 32) | limb;
        limb = current / divisor;
        remainder = current % divisor;
    }
    *this = fromLimbs(limbs);
    return static_cast<uint32_t>(remainder);
}

bool Uint128::mulAdd(uint32_t factor, uint32_t addend) {
    auto limbs = toLimbs(*this);
    uint64_t carry = addend;
    for (auto it = limbs.rbegin(); it != limbs.rend(); ++it) {
        uint64_t current = *it * factor + carry;
        *it = current & LIMB_MASK;
        carry = current >> 32;
    }
    if (carry != 0) {
        return false;
    }
    *this = fromLimbs(limbs);
    return true;
}

}  // namespace tagid
