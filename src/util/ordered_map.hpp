//
//  Map wrapper where we can iterate through
//  items in insertion-order.
//

#pragma once

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <map>
#include <vector>

namespace patchwork {

template <typename T, typename V>
struct OrderedMap {
    using Map = std::map<T, V>;
    Map m_;

    // Array of all map keys in `insert-order`
    std::vector<T> keys_;

    OrderedMap() = default;
    OrderedMap(const OrderedMap& other) = default;
    OrderedMap(OrderedMap&& other) = default;
    OrderedMap& operator=(const OrderedMap& other) = default;
    OrderedMap& operator=(OrderedMap&& other) = default;

    OrderedMap(const std::initializer_list<std::pair<T, V>> kw_args) {
        for (auto& [key, value] : kw_args) {
            insert(key, value);
        }
    }

    // Insert or overwrite. An overwritten key keeps its position.
    void
    insert(const T& key, V value) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        m_[key] = std::move(value);
    }

    bool
    remove(const T& key) {
        if (contains(key)) {
            keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
            m_.erase(key);
            return true;
        }
        return false;
    }

    V&
    operator[](const T& key) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    V&
    at(const T& key) {
        return m_.at(key);
    }

    const V&
    at(const T& key) const {
        return m_.at(key);
    }

    const V*
    find(const T& key) const {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    V*
    find(const T& key) {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    std::size_t
    size() const {
        return m_.size();
    }

    bool
    empty() const {
        return m_.empty();
    }

    bool
    contains(const T& key) const {
        return m_.find(key) != m_.end();
    }

    const std::vector<T>&
    keys() const {
        return keys_;
    }

    void
    for_each(const std::function<void(const T&, V&)>& cb) {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }

    void
    for_each(const std::function<void(const T&, const V&)>& cb) const {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }

    // Same entries; insertion order is not significant.
    bool
    operator==(const OrderedMap& other) const {
        return m_ == other.m_;
    }
};

}  // namespace patchwork
