#include "tagid/uuid.hpp"
#include "tagid/errors.hpp"

#include <random>

namespace tagid {

namespace {

// Offsets of the four hyphens in "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
constexpr bool isHyphenPosition(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

}  // namespace

Uuid Uuid::generate() {
    // random_device reads the OS CSPRNG on the platforms we build for.
    // One per thread: concurrent calls on a shared instance are not safe.
    thread_local std::random_device device;

    Bytes bytes;
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t word = device();
        bytes[i] = static_cast<uint8_t>(word >> 24);
        bytes[i + 1] = static_cast<uint8_t>(word >> 16);
        bytes[i + 2] = static_cast<uint8_t>(word >> 8);
        bytes[i + 3] = static_cast<uint8_t>(word);
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::tryParse(std::string_view text) {
    if (text.size() != TEXT_LENGTH) {
        return std::nullopt;
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isHyphenPosition(i)) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            continue;
        }
        int value = hexValue(text[i]);
        if (value < 0) {
            return std::nullopt;
        }
        bytes[nibble / 2] = static_cast<uint8_t>(bytes[nibble / 2] | (value << (nibble % 2 == 0 ? 4 : 0)));
        ++nibble;
    }
    return Uuid(bytes);
}

Uuid Uuid::fromString(std::string_view text) {
    auto uuid = tryParse(text);
    if (!uuid) {
        throw InvalidUuidError("Invalid UUID format: '" + std::string(text) + "'");
    }
    return *uuid;
}

Uuid Uuid::fromUint128(const Uint128& value) {
    Bytes bytes;
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value.hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<uint8_t>(value.lo >> (56 - 8 * i));
    }
    return Uuid(bytes);
}

Uint128 Uuid::toUint128() const {
    Uint128 value;
    for (size_t i = 0; i < 8; ++i) {
        value.hi = (value.hi << 8) | bytes_[i];
        value.lo = (value.lo << 8) | bytes_[8 + i];
    }
    return value;
}

std::string Uuid::toString() const {
    std::string text;
    text.reserve(TEXT_LENGTH);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(HEX_DIGITS[bytes_[i] >> 4]);
        text.push_back(HEX_DIGITS[bytes_[i] & 0x0F]);
    }
    return text;
}

bool Uuid::isNil() const {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

}  // namespace tagid
