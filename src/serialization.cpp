#include "tagid/serialization.hpp"
#include "tagid/auto_parser.hpp"
#include "tagid/cbor.hpp"
#include "tagid/errors.hpp"
#include "tagid/type_tag.hpp"

#include <algorithm>
#include <optional>

namespace tagid {

namespace {

constexpr std::string_view KEY_TYPE_ID = "type_id";
constexpr std::string_view KEY_UUID = "uuid";

[[noreturn]] void throwCorrupt(const std::string& what) {
    throw InvalidUuidError("Invalid identifier state: " + what);
}

void writeState(std::vector<uint8_t>& out, const TypedId& id) {
    cbor::encodeMapHeader(out, 2);
    cbor::encodeString(out, KEY_TYPE_ID);
    cbor::encodeString(out, id.typeTag());
    cbor::encodeString(out, KEY_UUID);
    cbor::encodeBytes(out, id.uuid().bytes());
}

IdState readState(cbor::Decoder& dec) {
    auto [majorType, count] = dec.readHeader();
    if (dec.overran() || majorType != cbor::MAP) {
        throwCorrupt("expected map");
    }

    std::optional<std::string> typeTag;
    std::optional<Uuid> uuid;

    for (uint64_t i = 0; i < count; ++i) {
        auto [keyType, keyLen] = dec.readHeader();
        if (dec.overran() || keyType != cbor::TEXT_STRING) {
            throwCorrupt("expected text key");
        }
        std::string key = dec.readString(keyLen);

        if (key == KEY_TYPE_ID) {
            auto [valueType, len] = dec.readHeader();
            if (valueType != cbor::TEXT_STRING) {
                throwCorrupt("type_id must be text");
            }
            typeTag = dec.readString(len);
        } else if (key == KEY_UUID) {
            auto [valueType, len] = dec.readHeader();
            if (valueType != cbor::BYTE_STRING || len != 16) {
                throwCorrupt("uuid must be 16 bytes");
            }
            auto bytes = dec.readBytes(len);
            if (bytes.size() == 16) {
                Uuid::Bytes raw;
                std::copy(bytes.begin(), bytes.end(), raw.begin());
                uuid = Uuid(raw);
            }
        } else {
            dec.skipValue();
        }

        if (dec.overran()) {
            throwCorrupt("truncated data");
        }
    }

    if (!typeTag || !uuid) {
        throwCorrupt("missing type_id or uuid");
    }
    return {std::move(*typeTag), *uuid};
}

}  // namespace

std::string toText(const TypedId& id) {
    return id.toString();
}

TypedId fromText(std::string_view text, const TypeRegistry& registry) {
    return parseTypedId(text, registry);
}

IdState stateOf(const TypedId& id) {
    return {id.typeTag(), id.uuid()};
}

TypedId fromState(const IdState& state, const TypeRegistry& registry) {
    std::string tag = normalizeTypeTag(state.typeTag);
    const IdKind* kind = registry.find(tag);
    if (kind == nullptr) {
        throw UnknownTypeTagError(tag);
    }
    return TypedId(*kind, state.uuid);
}

std::vector<uint8_t> encodeState(const TypedId& id) {
    std::vector<uint8_t> out;
    writeState(out, id);
    return out;
}

std::vector<uint8_t> encodeStates(const std::vector<TypedId>& ids) {
    std::vector<uint8_t> out;
    cbor::encodeArrayHeader(out, ids.size());
    for (const auto& id : ids) {
        writeState(out, id);
    }
    return out;
}

TypedId decodeState(std::span<const uint8_t> data, const TypeRegistry& registry) {
    cbor::Decoder dec(data);
    IdState state = readState(dec);
    if (dec.hasMore()) {
        throwCorrupt("trailing data");
    }
    return fromState(state, registry);
}

std::vector<TypedId> decodeStates(std::span<const uint8_t> data, const TypeRegistry& registry) {
    cbor::Decoder dec(data);
    auto [majorType, count] = dec.readHeader();
    if (dec.overran() || majorType != cbor::ARRAY) {
        throwCorrupt("expected array");
    }
    // Each entry needs at least one byte; rejects absurd counts before reserving
    if (count > dec.remaining()) {
        throwCorrupt("truncated data");
    }

    std::vector<TypedId> ids;
    ids.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        ids.push_back(fromState(readState(dec), registry));
    }
    if (dec.hasMore()) {
        throwCorrupt("trailing data");
    }
    return ids;
}

}  // namespace tagid
