#pragma once

/**
 * @file type_registry.hpp
 * @brief Thread-safe mapping from type tag to identifier kind
 *
 * - registerOrGet() is idempotent: the first caller for a tag creates the
 *   kind, every later (or concurrent) caller gets that same object back
 * - Lookups are case-insensitive and never throw
 * - Kind objects are never freed while the registry lives; reset() only
 *   makes them undiscoverable (for test isolation)
 * - Thread-safe (shared_mutex); a tag is visible to find() on every
 *   thread once registerOrGet() has returned
 *
 * Usage:
 *   auto& registry = TypeRegistry::global();
 *   const IdKind& user = registry.registerOrGet("User", "user");
 *   const IdKind* same = registry.find("USER");   // &user
 */

#include "tagid/id_kind.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tagid {

class TypeRegistry {
public:
    /// Process-wide default registry
    static TypeRegistry& global();

    TypeRegistry() = default;
    ~TypeRegistry() = default;

    // Non-copyable, non-movable (kinds point back into it by address)
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Get the kind for a tag, creating it if needed.
    /// Throws InvalidTypeTagError if the tag violates the grammar.
    /// An existing kind is returned unchanged, even if displayName differs.
    const IdKind& registerOrGet(std::string_view displayName, std::string_view typeTag);

    /// Null tag overload (always throws InvalidTypeTagError for nullptr)
    const IdKind& registerOrGet(std::string_view displayName, const char* typeTag);

    /// Register several kinds. All tags are validated before any is added.
    std::vector<const IdKind*> registerAll(
        const std::vector<std::pair<std::string, std::string>>& declarations);

    /// Look up a kind by tag. Returns nullptr if not registered.
    [[nodiscard]] const IdKind* find(std::string_view typeTag) const;

    [[nodiscard]] bool isRegistered(std::string_view typeTag) const;

    /// Snapshot of registered tags, sorted
    [[nodiscard]] std::vector<std::string> listTags() const;

    [[nodiscard]] size_t size() const;

    /// Forget all registrations (for testing).
    /// Previously returned kinds stay valid but are no longer found.
    void reset();

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::unique_ptr<IdKind>> kinds_;            // Every kind ever created
    std::unordered_map<std::string, const IdKind*> byTag_;  // Normalized tag -> kind
};

}  // namespace tagid
