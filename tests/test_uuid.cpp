#include <gtest/gtest.h>
#include "tagid/errors.hpp"
#include "tagid/uuid.hpp"

#include <unordered_set>

using namespace tagid;

namespace {
constexpr const char* SAMPLE = "550e8400-e29b-41d4-a716-446655440000";
}

TEST(UuidTest, DefaultIsNil) {
    Uuid uuid;
    EXPECT_TRUE(uuid.isNil());
    EXPECT_EQ(uuid.toString(), "00000000-0000-0000-0000-000000000000");
}

TEST(UuidTest, ParseAndFormat) {
    Uuid uuid = Uuid::fromString(SAMPLE);
    EXPECT_EQ(uuid.toString(), SAMPLE);
    EXPECT_EQ(uuid.bytes()[0], 0x55);
    EXPECT_EQ(uuid.bytes()[15], 0x00);
}

TEST(UuidTest, UppercaseNormalizesToLowercase) {
    Uuid uuid = Uuid::fromString("550E8400-E29B-41D4-A716-446655440000");
    EXPECT_EQ(uuid.toString(), SAMPLE);
    EXPECT_EQ(uuid, Uuid::fromString(SAMPLE));
}

TEST(UuidTest, RejectsMalformedText) {
    EXPECT_FALSE(Uuid::tryParse("").has_value());
    EXPECT_FALSE(Uuid::tryParse("not-a-valid-uuid").has_value());
    EXPECT_FALSE(Uuid::tryParse("550e8400e29b41d4a716446655440000").has_value());
    EXPECT_FALSE(Uuid::tryParse("550e8400-e29b-41d4-a716-44665544000g").has_value());
    EXPECT_FALSE(Uuid::tryParse("550e8400-e29b-41d4-a716_446655440000").has_value());
    EXPECT_FALSE(Uuid::tryParse("550e8400-e29b-41d4-a716-4466554400000").has_value());

    EXPECT_THROW((void)Uuid::fromString("invalid"), InvalidUuidError);
}

TEST(UuidTest, Uint128RoundTrip) {
    Uuid uuid = Uuid::fromString(SAMPLE);
    Uint128 value = uuid.toUint128();
    EXPECT_EQ(value.hi, 0x550e8400e29b41d4ull);
    EXPECT_EQ(value.lo, 0xa716446655440000ull);
    EXPECT_EQ(Uuid::fromUint128(value), uuid);
}

TEST(UuidTest, SmallIntegerIsZeroPadded) {
    Uuid uuid = Uuid::fromUint128(Uint128::fromU64(1));
    EXPECT_EQ(uuid.toString(), "00000000-0000-0000-0000-000000000001");
}

TEST(UuidTest, GenerateIsVersion4) {
    Uuid uuid = Uuid::generate();
    EXPECT_EQ(uuid.version(), 4);
    EXPECT_EQ(uuid.bytes()[8] & 0xC0, 0x80);
}

TEST(UuidTest, GenerateIsUnique) {
    std::unordered_set<Uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(Uuid::generate());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(UuidTest, OrderingMatchesUnsignedInteger) {
    Uuid one = Uuid::fromString("00000000-0000-0000-0000-000000000001");
    Uuid two = Uuid::fromString("00000000-0000-0000-0000-000000000002");
    Uuid high = Uuid::fromString("80000000-0000-0000-0000-000000000000");

    EXPECT_LT(one, two);
    EXPECT_LT(two, high);
    EXPECT_LT(one.toUint128(), high.toUint128());
}
