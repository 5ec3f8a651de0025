#include "tagid/config_file.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace tagid {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    loaded_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        lines_.clear();
        keyToLine_.clear();
        values_.clear();
        dirty_ = false;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
    return true;
}

void ConfigFile::loadFromString(std::string_view content) {
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    dirty_ = false;

    parseLines(content);
    loaded_ = true;
}

void ConfigFile::parseLines(std::string_view content) {
    size_t pos = 0;

    while (pos < content.size()) {
        // Find end of line
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        // Remove trailing \r
        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        Line line;
        line.content = std::string(lineView);

        // Skip if empty, comment, or starts with whitespace
        if (!lineView.empty() && lineView[0] != '#' &&
            !std::isspace(static_cast<unsigned char>(lineView[0]))) {

            auto colonPos = lineView.find(':');
            if (colonPos != std::string_view::npos) {
                std::string key(trim(lineView.substr(0, colonPos)));

                // Value starts after ':' and any whitespace
                size_t valueStart = colonPos + 1;
                while (valueStart < lineView.size() &&
                       std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
                    valueStart++;
                }

                line.key = key;
                line.valueStart = valueStart;
                line.isKeyValue = true;

                // Later lines override earlier for same key
                keyToLine_[key] = lines_.size();
                values_[key] = std::string(trim(lineView.substr(valueStart)));
            }
        }

        lines_.push_back(std::move(line));
    }
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    if (!file.good()) {
        return false;
    }

    path_ = path;
    dirty_ = false;
    return true;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.find(std::string(key)) != keyToLine_.end();
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::string(defaultVal);
    }
    return it->second;
}

std::vector<std::string> ConfigFile::keys() const {
    std::vector<std::string> result;
    for (size_t i = 0; i < lines_.size(); ++i) {
        const auto& line = lines_[i];
        if (!line.isKeyValue) {
            continue;
        }
        // Only the line that currently owns the key (duplicates: last wins)
        auto it = keyToLine_.find(line.key);
        if (it != keyToLine_.end() && it->second == i) {
            result.push_back(line.key);
        }
    }
    return result;
}

int ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it != keyToLine_.end()) {
        return static_cast<int>(it->second);
    }
    return -1;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    int lineIdx = findLine(key);

    if (lineIdx >= 0) {
        // Update existing line - replace just the value portion
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = line.content.substr(0, line.valueStart) + std::string(value);
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + std::string(value);
        newLine.valueStart = key.size() + 2;  // "key: " length
        newLine.isKeyValue = true;

        keyToLine_[std::string(key)] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[std::string(key)] = std::string(value);
    dirty_ = true;
}

void ConfigFile::setHeader(std::string_view header) {
    if (lines_.empty() && !header.empty()) {
        parseLines(header);
        dirty_ = true;
    }
}

void ConfigFile::remove(std::string_view key) {
    int lineIdx = findLine(key);
    if (lineIdx >= 0) {
        // Comment out the line instead of removing it
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = "# " + line.content;
        line.isKeyValue = false;

        keyToLine_.erase(std::string(key));
        values_.erase(std::string(key));
        dirty_ = true;
    }
}

}  // namespace tagid
