#pragma once

/**
 * @file errors.hpp
 * @brief Exception hierarchy for typed identifier failures
 *
 * Every failure raised by the library derives from TypedIdError so callers
 * can catch broadly or narrowly:
 *
 *   TypedIdError
 *   ├── InvalidTypeTagError        malformed tag (registration/construction)
 *   ├── UnknownTypeTagError        tag not registered (tag-agnostic parsing)
 *   ├── TypeTagMismatchError       tag differs from the expected kind
 *   └── InvalidUuidError           malformed UUID text
 *       └── MalformedShortEncodingError   bad base62 body
 */

#include <stdexcept>
#include <string>

namespace tagid {

enum class TypeTagIssue;

class TypedIdError : public std::runtime_error {
public:
    explicit TypedIdError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidTypeTagError : public TypedIdError {
public:
    InvalidTypeTagError(TypeTagIssue reason, const std::string& message)
        : TypedIdError(message), reason_(reason) {}

    /// Which grammar rule the tag violated
    [[nodiscard]] TypeTagIssue reason() const { return reason_; }

private:
    TypeTagIssue reason_;
};

class UnknownTypeTagError : public TypedIdError {
public:
    explicit UnknownTypeTagError(const std::string& tag)
        : TypedIdError("Unknown type tag '" + tag + "'"), tag_(tag) {}

    [[nodiscard]] const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

class TypeTagMismatchError : public TypedIdError {
public:
    TypeTagMismatchError(const std::string& expected, const std::string& actual)
        : TypedIdError("Type tag mismatch: expected '" + expected + "', got '" + actual + "'"),
          expected_(expected), actual_(actual) {}

    [[nodiscard]] const std::string& expected() const { return expected_; }
    [[nodiscard]] const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class InvalidUuidError : public TypedIdError {
public:
    explicit InvalidUuidError(const std::string& message)
        : TypedIdError(message) {}
};

// A short-form body that cannot be base62-decoded is also a malformed UUID
class MalformedShortEncodingError : public InvalidUuidError {
public:
    explicit MalformedShortEncodingError(const std::string& message)
        : InvalidUuidError(message) {}
};

}  // namespace tagid
