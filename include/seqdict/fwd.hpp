#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for seqdict.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace seqdict {

// ─── Forward declarations ───────────────────────────────────────────────
class Node;
class Bitmask;
class Guid;
class GuidRegistry;

template <typename K, typename V>
struct SerializablePair;

template <typename K, typename V>
class PairList;

template <typename K, typename V,
          typename Sequence = PairList<K, V>,
          typename Hash     = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class SerializableDictionary;

template <typename K, typename V,
          typename Hash     = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class MultiDictionary;

/// Persisted document node types
enum class Type : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    Float    = 3,
    String   = 4,
    Array    = 5,
    Object   = 6,
    UInteger = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Array:    return "array";
        case Type::Object:   return "object";
        case Type::UInteger: return "uinteger";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// Document array: ordered collection of nodes.
using Array = std::vector<Node>;

/// @brief Document object: key-value members in insertion order.
///
/// Persisted records are small ({"key":..,"value":..}), so lookup and
/// insert() are a linear scan over the members. Bulk builders (the reader)
/// append to `entries` directly and call merge_repeated_keys() once, which
/// is linear in the member count.
struct Object {
    using storage_type = std::vector<std::pair<std::string, Node>>;
    using size_type = size_t;

    storage_type entries;

    Object() = default;

    /// Initializer-list constructor: {{"key", node}, ...}
    Object(std::initializer_list<std::pair<std::string, Node>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin() const noexcept { return entries.begin(); }
    auto end()   const noexcept { return entries.end(); }

    // ─── Methods (defined after Node in node.hpp) ───────────────────────

    Node* find(std::string_view key) noexcept;
    const Node* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Access or create a member by key.
    Node& operator[](std::string_view key);

    /// Const access by key. Throws KeyNotFoundError if not found.
    const Node& at(std::string_view key) const;

    /// Insert or overwrite a member (position kept on overwrite).
    void insert(std::string key, Node value);

    /// Erase by key.
    bool erase(std::string_view key);

    /// Fold repeated member names into their first position, keeping the
    /// last value (the result insert() would have produced).
    void merge_repeated_keys();

    void clear() noexcept { entries.clear(); }

    /// Member order is not significant for comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }
};

} // namespace seqdict
