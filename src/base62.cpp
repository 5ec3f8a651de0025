#include "tagid/base62.hpp"
#include "tagid/errors.hpp"

#include <algorithm>

namespace tagid {
namespace base62 {

std::string encode(Uint128 value) {
    if (value.isZero()) {
        return "0";
    }

    std::string digits;
    digits.reserve(MAX_ENCODED_LENGTH);
    while (!value.isZero()) {
        digits.push_back(ALPHABET[value.divMod(BASE)]);
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

Uint128 decode(std::string_view text) {
    if (text.empty()) {
        throw MalformedShortEncodingError("Empty base62 string");
    }

    Uint128 value;
    for (char c : text) {
        int digit = digitValue(c);
        if (digit < 0) {
            throw MalformedShortEncodingError(
                "Invalid base62 character '" + std::string(1, c) + "' in '" + std::string(text) + "'");
        }
        if (!value.mulAdd(BASE, static_cast<uint32_t>(digit))) {
            throw MalformedShortEncodingError(
                "Base62 value '" + std::string(text) + "' exceeds 128 bits");
        }
    }
    return value;
}

}  // namespace base62
}  // namespace tagid
