#include "tagid/auto_parser.hpp"
#include "tagid/base62.hpp"
#include "tagid/errors.hpp"
#include "tagid/type_tag.hpp"

namespace tagid {

namespace {

bool separatorInTagRange(size_t pos) {
    return pos != std::string_view::npos && pos >= 1 && pos <= MAX_TYPE_TAG_LENGTH;
}

[[noreturn]] void throwMalformed(std::string_view text) {
    throw InvalidUuidError("Invalid typed identifier format: '" + std::string(text) + "'");
}

}  // namespace

AutoParser::Form AutoParser::detectForm(std::string_view text) {
    size_t dash = text.find('-');
    size_t underscore = text.find('_');

    if (separatorInTagRange(dash) && dash < underscore &&
        text.size() - dash - 1 == Uuid::TEXT_LENGTH) {
        return Form::Canonical;
    }
    if (separatorInTagRange(underscore) && underscore < dash) {
        return Form::Short;
    }
    return Form::Unrecognized;
}

TypedId AutoParser::parse(std::string_view text) const {
    if (text.empty()) {
        throw InvalidUuidError("Empty identifier string");
    }

    switch (detectForm(text)) {
        case Form::Canonical:
            return parseCanonical(text, text.find('-'));
        case Form::Short:
            return parseShort(text, text.find('_'));
        case Form::Unrecognized:
            break;
    }
    throwMalformed(text);
}

TypedId AutoParser::parseCanonical(std::string_view text, size_t sep) const {
    std::string_view tag = text.substr(0, sep);
    if (!isValidTypeTag(tag)) {
        throwMalformed(text);
    }
    auto uuid = Uuid::tryParse(text.substr(sep + 1));
    if (!uuid) {
        throwMalformed(text);
    }
    return TypedId(resolve(tag), *uuid);
}

TypedId AutoParser::parseShort(std::string_view text, size_t sep) const {
    std::string_view tag = text.substr(0, sep);
    if (!isValidTypeTag(tag)) {
        throwMalformed(text);
    }
    Uint128 value = base62::decode(text.substr(sep + 1));
    return TypedId(resolve(tag), Uuid::fromUint128(value));
}

const IdKind& AutoParser::resolve(std::string_view tag) const {
    const IdKind* kind = registry_.find(tag);
    if (kind == nullptr) {
        throw UnknownTypeTagError(foldTypeTag(tag));
    }
    return *kind;
}

TypedId parseTypedId(std::string_view text, const TypeRegistry& registry) {
    return AutoParser(registry).parse(text);
}

}  // namespace tagid
