#pragma once

#include <any>
#include <string>
#include <unordered_map>

namespace onion::core {

// String-keyed bag of arbitrary values.
//
// A bag may delegate to a read-only parent: lookups fall through to the
// parent when the key is not stored locally, writes always stay local. The
// application's template bags are parents of every per-request bag.
class PropertyBag {
public:
    PropertyBag() = default;
    explicit PropertyBag(const PropertyBag* parent);

    const PropertyBag* parent() const noexcept;

    template<typename T>
    void set(std::string key, T value) {
        data_[std::move(key)] = std::any(std::move(value));
    }

    // Mutable access. A value only found in the parent is copied into this
    // bag first, so the parent is never modified through a child.
    template<typename T>
    T* get(const std::string& key) {
        auto it = data_.find(key);
        if (it != data_.end()) {
            return std::any_cast<T>(&it->second);
        }
        const std::any* inherited = parent_ ? parent_->find(key) : nullptr;
        if (inherited == nullptr || std::any_cast<T>(inherited) == nullptr) {
            return nullptr;
        }
        auto& local = data_[key] = *inherited;
        return std::any_cast<T>(&local);
    }

    template<typename T>
    const T* get(const std::string& key) const {
        const std::any* value = find(key);
        if (value == nullptr) {
            return nullptr;
        }
        return std::any_cast<T>(value);
    }

    bool contains(const std::string& key) const;
    bool contains_own(const std::string& key) const;
    bool erase(const std::string& key);

    std::size_t size() const noexcept;
    bool empty() const noexcept;

private:
    const std::any* find(const std::string& key) const;

    const PropertyBag* parent_ = nullptr;
    std::unordered_map<std::string, std::any> data_;
};

} // namespace onion::core
