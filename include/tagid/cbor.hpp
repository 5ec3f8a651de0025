#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoding and decoding
 *
 * Covers the definite-length subset used by the identifier state format:
 * unsigned integers, byte strings, text strings, arrays and maps.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagid {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;
constexpr uint8_t TAG = 6;
constexpr uint8_t SIMPLE = 7;

// Deepest container nesting skipValue() will walk
constexpr int MAX_SKIP_DEPTH = 64;

// ============================================================================
// Encoding
// ============================================================================

// Encode a CBOR header (major type + argument)
inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    uint8_t mt = static_cast<uint8_t>(majorType << 5);

    if (value < 24) {
        out.push_back(mt | static_cast<uint8_t>(value));
        return;
    }

    int width;
    if (value <= 0xFF) {
        out.push_back(mt | 24);
        width = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        width = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        width = 4;
    } else {
        out.push_back(mt | 27);
        width = 8;
    }
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline void encodeBytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    encodeHeader(out, BYTE_STRING, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

inline void encodeArrayHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, ARRAY, count);
}

// ============================================================================
// Decoding
// ============================================================================
//
// Reading past the end yields zero bytes and sets overran(); callers check
// it once after decoding a value instead of after every read.
//
class Decoder {
public:
    Decoder(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}
    Decoder(std::span<const uint8_t> span) : data_(span.data()), size_(span.size()), pos_(0) {}

    [[nodiscard]] bool hasMore() const { return pos_ < size_; }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }
    [[nodiscard]] bool overran() const { return overran_; }

    uint8_t read() {
        if (pos_ >= size_) {
            overran_ = true;
            return 0;
        }
        return data_[pos_++];
    }

    // Read CBOR header, returns (major type, argument value).
    // Indefinite lengths and reserved values are reported as overran().
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = read();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (additional < 24) {
            return {majorType, additional};
        }

        int width;
        switch (additional) {
            case 24: width = 1; break;
            case 25: width = 2; break;
            case 26: width = 4; break;
            case 27: width = 8; break;
            default:
                overran_ = true;
                return {majorType, 0};
        }

        uint64_t value = 0;
        for (int i = 0; i < width; ++i) {
            value = (value << 8) | read();
        }
        return {majorType, value};
    }

    std::string readString(uint64_t length) {
        if (length > remaining()) {
            overran_ = true;
            return {};
        }
        std::string result(reinterpret_cast<const char*>(data_ + pos_), length);
        pos_ += length;
        return result;
    }

    std::vector<uint8_t> readBytes(uint64_t length) {
        if (length > remaining()) {
            overran_ = true;
            return {};
        }
        std::vector<uint8_t> result(data_ + pos_, data_ + pos_ + length);
        pos_ += length;
        return result;
    }

    // Skip a CBOR value (useful for unknown fields).
    // Nesting deeper than MAX_SKIP_DEPTH is reported as overran().
    void skipValue(int depth = 0) {
        if (depth >= MAX_SKIP_DEPTH) {
            overran_ = true;
            pos_ = size_;
            return;
        }

        auto [majorType, value] = readHeader();
        switch (majorType) {
            case BYTE_STRING:
            case TEXT_STRING:
                if (value > remaining()) {
                    overran_ = true;
                    pos_ = size_;
                } else {
                    pos_ += value;
                }
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value && !overran_; ++i) {
                    skipValue(depth + 1);
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value && !overran_; ++i) {
                    skipValue(depth + 1);  // key
                    skipValue(depth + 1);  // value
                }
                break;
            case TAG:
                skipValue(depth + 1);
                break;
            default:
                // Integers and simple values carry no payload beyond the header
                break;
        }
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    bool overran_ = false;
};

}  // namespace cbor
}  // namespace tagid
