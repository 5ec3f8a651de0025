#include <gtest/gtest.h>
#include "tagid/cbor.hpp"
#include "tagid/errors.hpp"
#include "tagid/serialization.hpp"

using namespace tagid;

namespace {
constexpr const char* SAMPLE_TYPED = "user-550e8400-e29b-41d4-a716-446655440000";
}

class SerializationTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    const IdKind& user = registry.registerOrGet("User", "user");

    TypedId sample() const { return TypedId::fromString(user, SAMPLE_TYPED); }
};

// ============================================================================
// Text form
// ============================================================================

TEST_F(SerializationTest, TextIsCanonical) {
    EXPECT_EQ(toText(sample()), SAMPLE_TYPED);
}

TEST_F(SerializationTest, FromTextResolvesKind) {
    TypedId id = fromText(SAMPLE_TYPED, registry);
    EXPECT_TRUE(id.is(user));
    EXPECT_EQ(id, sample());
}

TEST_F(SerializationTest, FromTextUnknownTag) {
    EXPECT_THROW((void)fromText("order-550e8400-e29b-41d4-a716-446655440000", registry),
                 UnknownTypeTagError);
}

// ============================================================================
// State form
// ============================================================================

TEST_F(SerializationTest, StateHoldsTagAndUuid) {
    IdState state = stateOf(sample());
    EXPECT_EQ(state.typeTag, "user");
    EXPECT_EQ(state.uuid, sample().uuid());
}

TEST_F(SerializationTest, FromStateRevalidatesTag) {
    IdState state{"USER", sample().uuid()};
    EXPECT_EQ(fromState(state, registry), sample());

    state.typeTag = "user-id";
    EXPECT_THROW((void)fromState(state, registry), InvalidTypeTagError);

    state.typeTag = "order";
    EXPECT_THROW((void)fromState(state, registry), UnknownTypeTagError);
}

TEST_F(SerializationTest, EncodedStateLayout) {
    auto data = encodeState(sample());

    cbor::Decoder dec(data);
    auto [mapType, count] = dec.readHeader();
    EXPECT_EQ(mapType, cbor::MAP);
    EXPECT_EQ(count, 2u);

    auto [k1Type, k1Len] = dec.readHeader();
    EXPECT_EQ(k1Type, cbor::TEXT_STRING);
    EXPECT_EQ(dec.readString(k1Len), "type_id");
    auto [v1Type, v1Len] = dec.readHeader();
    EXPECT_EQ(v1Type, cbor::TEXT_STRING);
    EXPECT_EQ(dec.readString(v1Len), "user");

    auto [k2Type, k2Len] = dec.readHeader();
    EXPECT_EQ(k2Type, cbor::TEXT_STRING);
    EXPECT_EQ(dec.readString(k2Len), "uuid");
    auto [v2Type, v2Len] = dec.readHeader();
    EXPECT_EQ(v2Type, cbor::BYTE_STRING);
    EXPECT_EQ(v2Len, 16u);
    auto bytes = dec.readBytes(v2Len);
    EXPECT_EQ(bytes[0], 0x55);

    EXPECT_FALSE(dec.hasMore());
    EXPECT_FALSE(dec.overran());
}

TEST_F(SerializationTest, StateRoundTrip) {
    TypedId original = TypedId::generate(user);
    TypedId restored = decodeState(encodeState(original), registry);
    EXPECT_EQ(restored, original);
    EXPECT_TRUE(restored.is(user));
    EXPECT_EQ(restored.toString(), original.toString());
}

TEST_F(SerializationTest, StateListRoundTrip) {
    std::vector<TypedId> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back(TypedId::generate(user));
    }

    auto restored = decodeStates(encodeStates(ids), registry);
    ASSERT_EQ(restored.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(restored[i], ids[i]);
    }
}

TEST_F(SerializationTest, EmptyListRoundTrip) {
    EXPECT_TRUE(decodeStates(encodeStates({}), registry).empty());
}

TEST_F(SerializationTest, DecodeInAnotherRegistry) {
    auto data = encodeState(sample());

    TypeRegistry destination;
    EXPECT_THROW((void)decodeState(data, destination), UnknownTypeTagError);

    const IdKind& remoteUser = destination.registerOrGet("User", "user");
    TypedId restored = decodeState(data, destination);
    EXPECT_TRUE(restored.is(remoteUser));
    EXPECT_EQ(restored.toString(), SAMPLE_TYPED);
}

TEST_F(SerializationTest, UnknownKeysAreSkipped) {
    std::vector<uint8_t> data;
    cbor::encodeMapHeader(data, 3);
    cbor::encodeString(data, "comment");
    cbor::encodeString(data, "ignored");
    cbor::encodeString(data, "type_id");
    cbor::encodeString(data, "user");
    cbor::encodeString(data, "uuid");
    cbor::encodeBytes(data, sample().uuid().bytes());

    EXPECT_EQ(decodeState(data, registry), sample());
}

TEST_F(SerializationTest, CorruptDataThrows) {
    auto data = encodeState(sample());

    // Truncated
    std::vector<uint8_t> truncated(data.begin(), data.end() - 3);
    EXPECT_THROW((void)decodeState(truncated, registry), InvalidUuidError);

    // Trailing garbage
    auto trailing = data;
    trailing.push_back(0x00);
    EXPECT_THROW((void)decodeState(trailing, registry), InvalidUuidError);

    // Not a map
    std::vector<uint8_t> notMap;
    cbor::encodeString(notMap, SAMPLE_TYPED);
    EXPECT_THROW((void)decodeState(notMap, registry), InvalidUuidError);

    // Empty
    EXPECT_THROW((void)decodeState(std::vector<uint8_t>{}, registry), InvalidUuidError);
}

TEST_F(SerializationTest, MissingFieldThrows) {
    std::vector<uint8_t> data;
    cbor::encodeMapHeader(data, 1);
    cbor::encodeString(data, "type_id");
    cbor::encodeString(data, "user");
    EXPECT_THROW((void)decodeState(data, registry), InvalidUuidError);
}

TEST_F(SerializationTest, WrongUuidLengthThrows) {
    std::vector<uint8_t> data;
    std::vector<uint8_t> shortUuid(8, 0xAB);
    cbor::encodeMapHeader(data, 2);
    cbor::encodeString(data, "type_id");
    cbor::encodeString(data, "user");
    cbor::encodeString(data, "uuid");
    cbor::encodeBytes(data, shortUuid);
    EXPECT_THROW((void)decodeState(data, registry), InvalidUuidError);
}

TEST_F(SerializationTest, DeeplyNestedUnknownValueThrows) {
    std::vector<uint8_t> data;
    cbor::encodeMapHeader(data, 1);
    cbor::encodeString(data, "zzz");
    data.insert(data.end(), 2000000, 0x81);  // array of one element, nested
    data.push_back(0x00);
    EXPECT_THROW((void)decodeState(data, registry), InvalidUuidError);
}

TEST_F(SerializationTest, ShallowNestedUnknownValueIsSkipped) {
    std::vector<uint8_t> data;
    cbor::encodeMapHeader(data, 3);
    cbor::encodeString(data, "extra");
    data.insert(data.end(), 50, 0x81);
    data.push_back(0x00);
    cbor::encodeString(data, "type_id");
    cbor::encodeString(data, "user");
    cbor::encodeString(data, "uuid");
    cbor::encodeBytes(data, sample().uuid().bytes());

    EXPECT_EQ(decodeState(data, registry), sample());
}

// ============================================================================
// CBOR primitives
// ============================================================================

TEST(CborTest, HeaderWidths) {
    std::vector<uint8_t> out;
    cbor::encodeHeader(out, cbor::UNSIGNED_INT, 23);
    EXPECT_EQ(out.size(), 1u);

    out.clear();
    cbor::encodeHeader(out, cbor::UNSIGNED_INT, 24);
    EXPECT_EQ(out.size(), 2u);

    out.clear();
    cbor::encodeHeader(out, cbor::UNSIGNED_INT, 0x10000);
    EXPECT_EQ(out.size(), 5u);

    out.clear();
    cbor::encodeHeader(out, cbor::UNSIGNED_INT, 0x100000000ull);
    EXPECT_EQ(out.size(), 9u);

    cbor::Decoder dec(out);
    auto [type, value] = dec.readHeader();
    EXPECT_EQ(type, cbor::UNSIGNED_INT);
    EXPECT_EQ(value, 0x100000000ull);
}

TEST(CborTest, ReadingPastEndSetsOverran) {
    std::vector<uint8_t> data = {0x78};  // text string, 1-byte length follows
    cbor::Decoder dec(data);
    (void)dec.readHeader();
    EXPECT_TRUE(dec.overran());
}

TEST(CborTest, SkipStopsAtDepthLimit) {
    std::vector<uint8_t> data(cbor::MAX_SKIP_DEPTH, 0x81);
    data.push_back(0x00);
    cbor::Decoder dec(data);
    dec.skipValue();
    EXPECT_TRUE(dec.overran());

    std::vector<uint8_t> shallow(cbor::MAX_SKIP_DEPTH - 1, 0x81);
    shallow.push_back(0x00);
    cbor::Decoder ok(shallow);
    ok.skipValue();
    EXPECT_FALSE(ok.overran());
    EXPECT_FALSE(ok.hasMore());
}
