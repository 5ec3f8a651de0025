#include "tagid/kind_manifest.hpp"
#include "tagid/log.hpp"
#include "tagid/type_tag.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tagid {

int applyKindManifest(const ConfigFile& config, TypeRegistry& registry) {
    if (config.has(MANIFEST_LOG_LEVEL_KEY)) {
        auto levelName = config.getString(MANIFEST_LOG_LEVEL_KEY);
        if (auto level = parseLogLevel(levelName)) {
            setLogLevel(*level);
        } else {
            logWarning("KindManifest", "Unknown log level '" + levelName + "', keeping current level");
        }
    }

    std::vector<std::pair<std::string, std::string>> declarations;
    for (const auto& key : config.keys()) {
        if (!key.starts_with(MANIFEST_KIND_PREFIX)) {
            continue;
        }

        std::string tag = key.substr(MANIFEST_KIND_PREFIX.size());
        if (auto issue = checkTypeTag(tag)) {
            logError("KindManifest", "Rejected '" + key + "': " + describe(*issue));
            return -1;
        }

        std::string displayName = config.getString(key);
        if (displayName.empty()) {
            logError("KindManifest", "Rejected '" + key + "': missing display name");
            return -1;
        }
        declarations.emplace_back(std::move(displayName), std::move(tag));
    }

    registry.registerAll(declarations);
    logInfo("KindManifest", "Declared " + std::to_string(declarations.size()) + " kinds");
    return static_cast<int>(declarations.size());
}

int loadKindManifest(const std::filesystem::path& path, TypeRegistry& registry) {
    ConfigFile config;
    if (!config.load(path)) {
        logError("KindManifest", "Failed to read manifest: " + path.string());
        return -1;
    }
    return applyKindManifest(config, registry);
}

bool declareKind(const std::filesystem::path& path, std::string_view displayName,
                 std::string_view typeTag) {
    if (auto issue = checkTypeTag(typeTag)) {
        logError("KindManifest", "Cannot declare '" + std::string(typeTag) + "': " + describe(*issue));
        return false;
    }
    if (displayName.empty()) {
        logError("KindManifest", "Cannot declare '" + std::string(typeTag) + "': missing display name");
        return false;
    }

    ConfigFile config;
    if (!config.load(path)) {
        config.setHeader("# tagid kind manifest");
    }

    std::string key = std::string(MANIFEST_KIND_PREFIX) + foldTypeTag(typeTag);
    if (config.has(key) && config.getString(key) == displayName) {
        return true;
    }
    config.set(key, displayName);

    if (!config.save()) {
        logError("KindManifest", "Failed to write manifest: " + path.string());
        return false;
    }
    logInfo("KindManifest", "Declared " + key + " in " + path.string());
    return true;
}

bool undeclareKind(const std::filesystem::path& path, std::string_view typeTag) {
    ConfigFile config;
    if (!config.load(path)) {
        logError("KindManifest", "Failed to read manifest: " + path.string());
        return false;
    }

    std::string key = std::string(MANIFEST_KIND_PREFIX) + foldTypeTag(typeTag);
    config.remove(key);
    if (!config.isDirty()) {
        logWarning("KindManifest", "No declaration for '" + key + "' in " + path.string());
        return false;
    }

    if (!config.save()) {
        logError("KindManifest", "Failed to write manifest: " + path.string());
        return false;
    }
    return true;
}

}  // namespace tagid
