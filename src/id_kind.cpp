#include "tagid/id_kind.hpp"

#include <cctype>
#include <utility>

namespace tagid {

IdKind::IdKind(std::string displayName, std::string typeTag)
    : displayName_(std::move(displayName))
    , typeTag_(std::move(typeTag))
    , typeName_(displayName_ + "Id")
{
}

std::string IdKind::formatPattern() const {
    return "^" + typeTag_ +
           "-[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$";
}

bool IdKind::matchesTag(std::string_view tag) const {
    if (tag.size() != typeTag_.size()) {
        return false;
    }
    for (size_t i = 0; i < tag.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tag[i])) != typeTag_[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace tagid
