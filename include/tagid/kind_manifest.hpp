#pragma once

/**
 * @file kind_manifest.hpp
 * @brief Declare identifier kinds and library settings in a config file
 *
 * Example manifest:
 *   # Identifier kinds for the order service
 *   log.level: info
 *   kind.user: User
 *   kind.order: Order
 *
 * Every "kind.<tag>" key declares a kind whose display name is the value.
 * All declarations are validated before anything is registered, so a bad
 * manifest leaves the registry untouched.
 *
 * declareKind/undeclareKind edit a manifest in place; comments and the
 * order of other lines are preserved.
 */

#include "tagid/config_file.hpp"
#include "tagid/type_registry.hpp"

#include <filesystem>

namespace tagid {

constexpr std::string_view MANIFEST_KIND_PREFIX = "kind.";
constexpr std::string_view MANIFEST_LOG_LEVEL_KEY = "log.level";

/// Apply a loaded manifest.
/// @return Number of kinds declared, or -1 if any declaration is invalid
int applyKindManifest(const ConfigFile& config, TypeRegistry& registry);

/// Load and apply a manifest file.
/// @return Number of kinds declared, or -1 on a missing/invalid file
int loadKindManifest(const std::filesystem::path& path, TypeRegistry& registry);

/// Add or update "kind.<tag>: displayName", creating the file if needed.
/// @return false on an invalid tag, empty display name or write failure
bool declareKind(const std::filesystem::path& path, std::string_view displayName,
                 std::string_view typeTag);

/// Comment out the declaration for a tag.
/// @return false if the file or the declaration is missing, or on write failure
bool undeclareKind(const std::filesystem::path& path, std::string_view typeTag);

}  // namespace tagid
