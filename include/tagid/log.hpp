#pragma once

/**
 * @file log.hpp
 * @brief Component-prefixed diagnostic output
 *
 * Output format:
 *   [Component] message              (debug/info, stdout)
 *   [Component] WARNING: message     (stderr)
 *   [Component] ERROR: message       (stderr)
 *
 * A process-wide level filters messages; the default is Warning.
 * Thread-safe: lines from concurrent callers never interleave.
 */

#include <iosfwd>
#include <optional>
#include <string_view>

namespace tagid {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();

/// Parse "debug", "info", "warning"/"warn", "error", "off" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Redirect output (for tests). Null restores std::cout / std::cerr.
void setLogStreams(std::ostream* out, std::ostream* err);

void logDebug(std::string_view component, std::string_view message);
void logInfo(std::string_view component, std::string_view message);
void logWarning(std::string_view component, std::string_view message);
void logError(std::string_view component, std::string_view message);

}  // namespace tagid
