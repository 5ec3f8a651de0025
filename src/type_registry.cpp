#include "tagid/type_registry.hpp"
#include "tagid/errors.hpp"
#include "tagid/log.hpp"
#include "tagid/type_tag.hpp"

#include <algorithm>
#include <mutex>

namespace tagid {

TypeRegistry& TypeRegistry::global() {
    static TypeRegistry instance;
    return instance;
}

const IdKind& TypeRegistry::registerOrGet(std::string_view displayName, std::string_view typeTag) {
    std::string key = normalizeTypeTag(typeTag);

    // Fast path: read lock
    {
        std::shared_lock readLock(mutex_);
        auto it = byTag_.find(key);
        if (it != byTag_.end()) {
            return *it->second;
        }
    }

    // Slow path: write lock
    std::unique_lock writeLock(mutex_);

    // Double-check after acquiring write lock
    auto it = byTag_.find(key);
    if (it != byTag_.end()) {
        return *it->second;
    }

    auto kind = std::unique_ptr<IdKind>(new IdKind(std::string(displayName), key));
    const IdKind* created = kind.get();
    kinds_.push_back(std::move(kind));
    byTag_.emplace(std::move(key), created);
    writeLock.unlock();

    logDebug("TypeRegistry", "Registered kind '" + created->typeName() +
                             "' for tag '" + created->typeTag() + "'");
    return *created;
}

const IdKind& TypeRegistry::registerOrGet(std::string_view displayName, const char* typeTag) {
    if (typeTag == nullptr) {
        throw InvalidTypeTagError(TypeTagIssue::Missing,
                                  std::string("Invalid type tag: ") + describe(TypeTagIssue::Missing));
    }
    return registerOrGet(displayName, std::string_view(typeTag));
}

std::vector<const IdKind*> TypeRegistry::registerAll(
    const std::vector<std::pair<std::string, std::string>>& declarations) {
    for (const auto& [name, tag] : declarations) {
        if (auto issue = checkTypeTag(tag)) {
            throw InvalidTypeTagError(*issue, "Invalid type tag '" + tag + "': " + describe(*issue));
        }
    }

    std::vector<const IdKind*> result;
    result.reserve(declarations.size());
    for (const auto& [name, tag] : declarations) {
        result.push_back(&registerOrGet(name, std::string_view(tag)));
    }
    return result;
}

const IdKind* TypeRegistry::find(std::string_view typeTag) const {
    std::string key = foldTypeTag(typeTag);
    std::shared_lock lock(mutex_);
    auto it = byTag_.find(key);
    if (it != byTag_.end()) {
        return it->second;
    }
    return nullptr;
}

bool TypeRegistry::isRegistered(std::string_view typeTag) const {
    return find(typeTag) != nullptr;
}

std::vector<std::string> TypeRegistry::listTags() const {
    std::vector<std::string> tags;
    {
        std::shared_lock lock(mutex_);
        tags.reserve(byTag_.size());
        for (const auto& [tag, _] : byTag_) {
            tags.push_back(tag);
        }
    }
    std::sort(tags.begin(), tags.end());
    return tags;
}

size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return byTag_.size();
}

void TypeRegistry::reset() {
    size_t cleared;
    {
        std::unique_lock lock(mutex_);
        cleared = byTag_.size();
        byTag_.clear();
    }
    logDebug("TypeRegistry", "Reset (" + std::to_string(cleared) + " kinds orphaned)");
}

}  // namespace tagid
