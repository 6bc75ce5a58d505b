#pragma once

/// @file pair.hpp
/// @brief SerializablePair — one persisted key-value record.

#include "conversion.hpp"
#include "node.hpp"

#include <utility>

namespace seqdict {

/// @brief A (key, value) record; persisted as {"key": K, "value": V}.
template <typename K, typename V>
struct SerializablePair {
    using key_type    = K;
    using mapped_type = V;

    K first{};
    V second{};

    SerializablePair() = default;
    SerializablePair(K k, V v) : first(std::move(k)), second(std::move(v)) {}

    [[nodiscard]] const K& key() const noexcept { return first; }
    [[nodiscard]] const V& value() const noexcept { return second; }
    V& value() noexcept { return second; }

    void set_key(K k) { first = std::move(k); }
    void set_value(V v) { second = std::move(v); }

    bool operator==(const SerializablePair& other) const {
        return first == other.first && second == other.second;
    }
    bool operator!=(const SerializablePair& other) const { return !(*this == other); }
};

template <typename K, typename V>
void to_node(Node& n, const SerializablePair<K, V>& p) {
    Object obj;
    obj.reserve(2);
    obj.insert("key", to_document(p.first));
    obj.insert("value", to_document(p.second));
    n = Node(std::move(obj));
}

/// Strict form: throws TypeError / KeyNotFoundError on a malformed record.
/// PairList decides whether such a record is skipped instead.
template <typename K, typename V>
void from_node(const Node& n, SerializablePair<K, V>& p) {
    const auto& obj = n.as_object();
    from_node(obj.at("key"), p.first);
    from_node(obj.at("value"), p.second);
}

} // namespace seqdict
