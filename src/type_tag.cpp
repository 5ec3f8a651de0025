#include "tagid/type_tag.hpp"
#include "tagid/errors.hpp"

#include <cctype>

namespace tagid {

namespace {

bool isAsciiAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

[[noreturn]] void throwInvalid(TypeTagIssue issue, std::string_view tag) {
    throw InvalidTypeTagError(issue, "Invalid type tag '" + std::string(tag) + "': " + describe(issue));
}

}  // namespace

const char* describe(TypeTagIssue issue) {
    switch (issue) {
        case TypeTagIssue::Missing:          return "type tag is missing";
        case TypeTagIssue::Empty:            return "type tag is empty";
        case TypeTagIssue::TooLong:          return "type tag must be at most 8 characters";
        case TypeTagIssue::InvalidCharacter: return "type tag must contain only letters and digits";
    }
    return "unknown issue";
}

std::optional<TypeTagIssue> checkTypeTag(std::string_view tag) {
    if (trim(tag).empty()) {
        return TypeTagIssue::Empty;
    }
    if (tag.size() > MAX_TYPE_TAG_LENGTH) {
        return TypeTagIssue::TooLong;
    }
    for (char c : tag) {
        if (!isAsciiAlnum(c)) {
            return TypeTagIssue::InvalidCharacter;
        }
    }
    return std::nullopt;
}

std::optional<TypeTagIssue> checkTypeTag(const char* tag) {
    if (tag == nullptr) {
        return TypeTagIssue::Missing;
    }
    return checkTypeTag(std::string_view(tag));
}

std::string normalizeTypeTag(std::string_view tag) {
    if (auto issue = checkTypeTag(tag)) {
        throwInvalid(*issue, tag);
    }
    return foldTypeTag(tag);
}

std::string normalizeTypeTag(const char* tag) {
    if (tag == nullptr) {
        throwInvalid(TypeTagIssue::Missing, "<null>");
    }
    return normalizeTypeTag(std::string_view(tag));
}

std::string foldTypeTag(std::string_view tag) {
    std::string folded(tag);
    for (auto& c : folded) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return folded;
}

}  // namespace tagid
