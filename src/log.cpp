#include "tagid/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

namespace tagid {

namespace {

std::atomic<LogLevel> gLevel{LogLevel::Warning};

std::mutex gStreamMutex;
std::ostream* gOut = nullptr;
std::ostream* gErr = nullptr;

void emit(LogLevel level, std::string_view component, std::string_view prefix,
          std::string_view message) {
    if (level < gLevel.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard lock(gStreamMutex);
    bool toErr = level >= LogLevel::Warning;
    std::ostream& os = toErr ? (gErr ? *gErr : std::cerr) : (gOut ? *gOut : std::cout);
    os << "[" << component << "] " << prefix << message << "\n";
}

}  // namespace

void setLogLevel(LogLevel level) {
    gLevel.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return gLevel.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

void setLogStreams(std::ostream* out, std::ostream* err) {
    std::lock_guard lock(gStreamMutex);
    gOut = out;
    gErr = err;
}

void logDebug(std::string_view component, std::string_view message) {
    emit(LogLevel::Debug, component, "", message);
}

void logInfo(std::string_view component, std::string_view message) {
    emit(LogLevel::Info, component, "", message);
}

void logWarning(std::string_view component, std::string_view message) {
    emit(LogLevel::Warning, component, "WARNING: ", message);
}

void logError(std::string_view component, std::string_view message) {
    emit(LogLevel::Error, component, "ERROR: ", message);
}

}  // namespace tagid
