#include "tagid/typed_id.hpp"
#include "tagid/base62.hpp"
#include "tagid/errors.hpp"
#include "tagid/type_tag.hpp"

#include <ostream>

namespace tagid {

// Malformed text is reported as InvalidUuidError before the tag is compared,
// so TypeTagMismatchError always means "a well-formed identifier of another kind".

TypedId TypedId::generate(const IdKind& kind) {
    return TypedId(kind, Uuid::generate());
}

TypedId TypedId::fromString(const IdKind& kind, std::string_view text) {
    if (text.empty()) {
        throw InvalidUuidError("Empty identifier string");
    }

    // Plain UUID: attach this kind's tag
    if (auto plain = Uuid::tryParse(text)) {
        return TypedId(kind, *plain);
    }

    auto sep = text.find('-');
    if (sep == std::string_view::npos) {
        throw InvalidUuidError("Invalid identifier format: '" + std::string(text) + "'");
    }

    std::string_view prefix = text.substr(0, sep);
    auto uuid = Uuid::tryParse(text.substr(sep + 1));
    if (!uuid || !isValidTypeTag(prefix)) {
        throw InvalidUuidError("Invalid identifier format: '" + std::string(text) + "'");
    }
    if (!kind.matchesTag(prefix)) {
        throw TypeTagMismatchError(kind.typeTag(), std::string(prefix));
    }
    return TypedId(kind, *uuid);
}

TypedId TypedId::fromShort(const IdKind& kind, std::string_view text) {
    auto sep = text.find('_');
    if (sep == std::string_view::npos) {
        throw InvalidUuidError("Invalid short identifier format: '" + std::string(text) + "'");
    }

    std::string_view prefix = text.substr(0, sep);
    if (!isValidTypeTag(prefix)) {
        throw InvalidUuidError("Invalid short identifier format: '" + std::string(text) + "'");
    }
    Uint128 value = base62::decode(text.substr(sep + 1));
    if (!kind.matchesTag(prefix)) {
        throw TypeTagMismatchError(kind.typeTag(), std::string(prefix));
    }
    return TypedId(kind, Uuid::fromUint128(value));
}

const TypedId& TypedId::validate(const IdKind& kind, const TypedId& value) {
    if (value.typeTag() != kind.typeTag()) {
        throw TypeTagMismatchError(kind.typeTag(), value.typeTag());
    }
    return value;
}

TypedId TypedId::validate(const IdKind& kind, const Uuid& value) {
    return TypedId(kind, value);
}

TypedId TypedId::validate(const IdKind& kind, std::string_view value) {
    bool shortForm = value.find('_') != std::string_view::npos &&
                     value.find('-') == std::string_view::npos;
    return shortForm ? fromShort(kind, value) : fromString(kind, value);
}

std::string TypedId::toString() const {
    return typeTag() + "-" + uuid_.toString();
}

std::string TypedId::shortString() const {
    return typeTag() + "_" + base62::encode(uuid_.toUint128());
}

std::string TypedId::debugString() const {
    return kind_->typeName() + "('" + toString() + "')";
}

std::vector<uint8_t> TypedId::toBytes() const {
    std::string text = toString();
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::strong_ordering TypedId::operator<=>(const TypedId& other) const {
    if (auto cmp = typeTag().compare(other.typeTag()); cmp != 0) {
        return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    return uuid_ <=> other.uuid_;
}

std::ostream& operator<<(std::ostream& os, const TypedId& id) {
    return os << id.toString();
}

}  // namespace tagid
