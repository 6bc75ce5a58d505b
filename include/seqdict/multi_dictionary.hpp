#pragma once

/// @file multi_dictionary.hpp
/// @brief MultiDictionary — each key maps to an ordered list of values.
///
/// A key exists exactly while its bucket is non-empty when buckets are
/// managed through add()/remove(key, value). operator[] creates empty buckets
/// on demand, as std::unordered_map does.
///
/// Persisted form: [{"key": K, "value": [V, ...]}, ...]

#include "config.hpp"
#include "conversion.hpp"
#include "detail/describe.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "log.hpp"
#include "node.hpp"
#include "options.hpp"
#include "pair_list.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seqdict {

template <typename K, typename V, typename Hash, typename KeyEqual>
class MultiDictionary {
public:
    using key_type       = K;
    using bucket_type    = std::vector<V>;
    using map_type       = std::unordered_map<K, bucket_type, Hash, KeyEqual>;
    using size_type      = size_t;
    using iterator       = typename map_type::iterator;
    using const_iterator = typename map_type::const_iterator;

    MultiDictionary() = default;

    /// Append @p value to the bucket of @p key (creating it).
    void add(const K& key, V value) {
        map_[key].push_back(std::move(value));
    }

    /// Remove the first value equal to @p value from the bucket of @p key.
    /// The key is dropped when its bucket becomes empty.
    bool remove(const K& key, const V& value) {
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        auto& bucket = it->second;
        auto pos = std::find(bucket.begin(), bucket.end(), value);
        if (pos == bucket.end()) return false;
        bucket.erase(pos);
        if (bucket.empty()) map_.erase(it);
        return true;
    }

    /// Remove @p key with all of its values.
    bool remove(const K& key) { return map_.erase(key) != 0; }

    bucket_type& operator[](const K& key) { return map_[key]; }

    /// Throws KeyNotFoundError if @p key is absent.
    [[nodiscard]] const bucket_type& at(const K& key) const {
        auto it = map_.find(key);
        if (SEQDICT_UNLIKELY(it == map_.end())) {
            throw KeyNotFoundError("key not found: " + detail::describe(key));
        }
        return it->second;
    }
    bucket_type& at(const K& key) {
        return const_cast<bucket_type&>(static_cast<const MultiDictionary&>(*this).at(key));
    }

    [[nodiscard]] bool contains(const K& key) const { return map_.count(key) != 0; }

    bool try_get(const K& key, bucket_type& out) const {
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        out = it->second;
        return true;
    }

    void clear() noexcept { map_.clear(); }

    /// Number of keys.
    [[nodiscard]] size_type size() const noexcept { return map_.size(); }
    [[nodiscard]] bool empty() const noexcept { return map_.empty(); }

    /// Number of values over all buckets.
    [[nodiscard]] size_type value_count() const noexcept {
        size_type n = 0;
        for (const auto& kv : map_) n += kv.second.size();
        return n;
    }

    iterator begin() noexcept { return map_.begin(); }
    iterator end() noexcept { return map_.end(); }
    const_iterator begin() const noexcept { return map_.begin(); }
    const_iterator end() const noexcept { return map_.end(); }

    bool operator==(const MultiDictionary& other) const { return map_ == other.map_; }
    bool operator!=(const MultiDictionary& other) const { return !(*this == other); }

private:
    map_type map_;
};

template <typename K, typename V, typename H, typename E>
void to_node(Node& n, const MultiDictionary<K, V, H, E>& d) {
    Array arr;
    arr.reserve(d.size());
    for (const auto& [key, bucket] : d) {
        Object rec;
        rec.reserve(2);
        rec.insert("key", to_document(key));
        rec.insert("value", to_document(bucket));
        arr.push_back(Node(std::move(rec)));
    }
    n = Node(std::move(arr));
}

/// Repeated keys merge their buckets in document order. Malformed records
/// follow LoadOptions::skip_malformed like PairList does.
template <typename K, typename V, typename H, typename E>
void from_node(const Node& n, MultiDictionary<K, V, H, E>& d) {
    const LoadOptions& opts = detail::load_options();
    MultiDictionary<K, V, H, E> out;
    if (n.is_null()) {
        d = std::move(out);
        return;
    }
    const auto& arr = n.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
        std::string reason;
        if (const char* shape = detail::record_shape_error(arr[i])) {
            reason = shape;
        } else {
            K key{};
            std::vector<V> values;
            try {
                from_node(arr[i]["key"], key);
                from_node(arr[i]["value"], values);
                auto& bucket = out[key];
                for (auto& v : values) bucket.push_back(std::move(v));
                if (bucket.empty()) out.remove(key);
                continue;
            } catch (const TypeError& e) {
                reason = e.what();
            } catch (const KeyNotFoundError& e) {
                reason = e.what();
            }
        }
        if (!opts.skip_malformed) detail::malformed_record(i, reason);
        logger()->warn("skipping malformed record at index {}: {}", i, reason);
    }
    d = std::move(out);
}

} // namespace seqdict
