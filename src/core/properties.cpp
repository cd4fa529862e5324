#include "onion/core/properties.h"

namespace onion::core {

PropertyBag::PropertyBag(const PropertyBag* parent)
    : parent_(parent) {}

const PropertyBag* PropertyBag::parent() const noexcept {
    return parent_;
}

bool PropertyBag::contains(const std::string& key) const {
    return find(key) != nullptr;
}

bool PropertyBag::contains_own(const std::string& key) const {
    return data_.find(key) != data_.end();
}

bool PropertyBag::erase(const std::string& key) {
    return data_.erase(key) != 0;
}

// Own entries only.
std::size_t PropertyBag::size() const noexcept {
    return data_.size();
}

bool PropertyBag::empty() const noexcept {
    return data_.empty();
}

const std::any* PropertyBag::find(const std::string& key) const {
    auto it = data_.find(key);
    if (it != data_.end()) {
        return &it->second;
    }
    return parent_ ? parent_->find(key) : nullptr;
}

} // namespace onion::core
