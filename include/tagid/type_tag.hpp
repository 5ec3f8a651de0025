#pragma once

/**
 * @file type_tag.hpp
 * @brief Type tag grammar: validation and normalization
 *
 * A type tag is 1-8 ASCII letters or digits. Tags compare case-insensitively
 * and are stored lowercase.
 *
 * Rules are checked in order, each with its own TypeTagIssue:
 *   Missing           null tag
 *   Empty             nothing left after trimming whitespace
 *   TooLong           more than MAX_TYPE_TAG_LENGTH characters
 *   InvalidCharacter  anything other than [A-Za-z0-9] (hyphen, '@', spaces)
 */

#include <optional>
#include <string>
#include <string_view>

namespace tagid {

constexpr size_t MAX_TYPE_TAG_LENGTH = 8;

enum class TypeTagIssue {
    Missing,
    Empty,
    TooLong,
    InvalidCharacter
};

[[nodiscard]] const char* describe(TypeTagIssue issue);

/// Check a tag against the grammar. Returns nullopt if the tag is valid.
[[nodiscard]] std::optional<TypeTagIssue> checkTypeTag(std::string_view tag);

/// Same as above; a null pointer is reported as Missing.
[[nodiscard]] std::optional<TypeTagIssue> checkTypeTag(const char* tag);

[[nodiscard]] inline bool isValidTypeTag(std::string_view tag) {
    return !checkTypeTag(tag).has_value();
}

/// Validate and lowercase a tag.
/// Throws InvalidTypeTagError if the tag violates the grammar.
[[nodiscard]] std::string normalizeTypeTag(std::string_view tag);
[[nodiscard]] std::string normalizeTypeTag(const char* tag);

/// Lowercase without validating (used for lookups, which never throw)
[[nodiscard]] std::string foldTypeTag(std::string_view tag);

}  // namespace tagid
