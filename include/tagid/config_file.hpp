#pragma once

/**
 * @file config_file.hpp
 * @brief Config file parsing with comment preservation
 *
 * Format: one "key: value" pair per line. Lines starting with '#' are
 * comments; blank lines and lines starting with whitespace are kept
 * verbatim but carry no value.
 */

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tagid {

// ============================================================================
// ConfigFile - A configuration file that preserves structure when modified
// ============================================================================
//
// Comments, blank lines and ordering survive a load/modify/save cycle.
// When a value is modified, only that line changes. New keys are appended
// at the end.
//
// Usage:
//   ConfigFile config;
//   if (config.load("tagid.conf")) {
//       auto level = config.getString("log.level", "warning");
//       config.set("kind.user", "User");
//       config.save();
//   }
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse from in-memory text (for testing and embedded defaults)
    void loadFromString(std::string_view content);

    // Save to file (creates directories if needed)
    [[nodiscard]] bool save();

    // Save to a different path
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;

    /// Keys in file order
    [[nodiscard]] std::vector<std::string> keys() const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);

    // Remove a key (comments out the line rather than deleting)
    void remove(std::string_view key);

    // Add header comment lines; ignored if the file already has content
    void setHeader(std::string_view header);

private:
    // A line in the config file
    struct Line {
        std::string content;      // Original line content
        std::string key;          // Key if this is a key-value line, empty otherwise
        size_t valueStart = 0;    // Position where value starts (after ": ")
        bool isKeyValue = false;
    };

    void parseLines(std::string_view content);

    // Find the line index for a key (-1 if not found)
    [[nodiscard]] int findLine(std::string_view key) const;

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;   // Key -> line index
    std::unordered_map<std::string, std::string> values_; // Key -> trimmed value
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace tagid
