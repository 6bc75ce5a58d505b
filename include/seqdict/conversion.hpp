#pragma once

/// @file conversion.hpp
/// @brief ADL-based conversion system for C++ types <-> persisted Node.
///
/// Provides:
///   - to_node() / from_node() for basic types and STL containers
///   - to_document<T>() / from_document<T>() helper wrappers
///
/// User types take part by declaring to_node/from_node in their own
/// namespace:
/// @code
///   namespace game {
///   struct Stats { int hp; int mp; };
///   inline void to_node(seqdict::Node& n, const Stats& s) {
///       n = seqdict::Node::object();
///       n["hp"] = s.hp;
///       n["mp"] = s.mp;
///   }
///   inline void from_node(const seqdict::Node& n, Stats& s) {
///       s.hp = static_cast<int>(n["hp"].as_integer());
///       s.mp = static_cast<int>(n["mp"].as_integer());
///   }
///   }
///   seqdict::SerializableDictionary<std::string, game::Stats> party;
/// @endcode

#include "config.hpp"
#include "error.hpp"
#include "node.hpp"

#include <cfloat>
#include <climits>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seqdict {

// =====================================================================
// to_node: C++ type -> Node
// =====================================================================

inline void to_node(Node& n, std::nullptr_t)          { n = Node(nullptr); }
inline void to_node(Node& n, bool v)                  { n = Node(v); }
inline void to_node(Node& n, int v)                   { n = Node(v); }
inline void to_node(Node& n, unsigned v)              { n = Node(v); }
inline void to_node(Node& n, int64_t v)               { n = Node(v); }
inline void to_node(Node& n, uint64_t v)              { n = Node(v); }
inline void to_node(Node& n, float v)                 { n = Node(static_cast<double>(v)); }
inline void to_node(Node& n, double v)                { n = Node(v); }
inline void to_node(Node& n, const std::string& v)    { n = Node(v); }
inline void to_node(Node& n, std::string_view v)      { n = Node(v); }
inline void to_node(Node& n, const char* v)           { n = Node(v); }
inline void to_node(Node& n, const Node& v)           { n = v; }

template <typename T>
void to_node(Node& n, const std::vector<T>& vec) {
    Array arr;
    arr.reserve(vec.size());
    for (const auto& elem : vec) {
        Node tmp;
        to_node(tmp, elem);
        arr.push_back(std::move(tmp));
    }
    n = Node(std::move(arr));
}

template <typename T>
void to_node(Node& n, const std::optional<T>& opt) {
    if (opt.has_value()) {
        to_node(n, *opt);
    } else {
        n = Node(nullptr);
    }
}

// =====================================================================
// from_node: Node -> C++ type
// =====================================================================

// Narrower targets are range-checked: a value that does not fit is a
// TypeError, never a silently truncated key.

inline void from_node(const Node& n, bool& v)        { v = n.as_bool(); }

inline void from_node(const Node& n, int& v) {
    const int64_t raw = n.as_integer();
    if (SEQDICT_UNLIKELY(raw < INT_MIN || raw > INT_MAX)) {
        throw TypeError("integer " + std::to_string(raw) + " does not fit in int");
    }
    v = static_cast<int>(raw);
}

inline void from_node(const Node& n, unsigned& v) {
    const uint64_t raw = n.as_uinteger();
    if (SEQDICT_UNLIKELY(raw > UINT_MAX)) {
        throw TypeError("integer " + std::to_string(raw) + " does not fit in unsigned");
    }
    v = static_cast<unsigned>(raw);
}

inline void from_node(const Node& n, int64_t& v)     { v = n.as_integer(); }
inline void from_node(const Node& n, uint64_t& v)    { v = n.as_uinteger(); }

inline void from_node(const Node& n, float& v) {
    const double raw = n.as_float();
    if (SEQDICT_UNLIKELY(std::isfinite(raw) && std::fabs(raw) > FLT_MAX)) {
        throw TypeError("number " + std::to_string(raw) + " does not fit in float");
    }
    v = static_cast<float>(raw);
}

inline void from_node(const Node& n, double& v)      { v = n.as_float(); }
inline void from_node(const Node& n, std::string& v) { v = n.as_string(); }
inline void from_node(const Node& n, Node& v)        { v = n; }

template <typename T>
void from_node(const Node& n, std::vector<T>& vec) {
    const auto& arr = n.as_array();
    vec.clear();
    vec.reserve(arr.size());
    for (const auto& elem : arr) {
        T val{};
        from_node(elem, val);
        vec.push_back(std::move(val));
    }
}

template <typename T>
void from_node(const Node& n, std::optional<T>& opt) {
    if (n.is_null()) {
        opt = std::nullopt;
    } else {
        T val{};
        from_node(n, val);
        opt = std::move(val);
    }
}

// =====================================================================
// Helper wrappers
// =====================================================================

/// C++ value -> Node (ADL finds to_node).
template <typename T>
[[nodiscard]] Node to_document(const T& val) {
    Node n;
    to_node(n, val);
    return n;
}

/// Node -> C++ value (T must be default-constructible).
template <typename T>
[[nodiscard]] T from_document(const Node& n) {
    T val{};
    from_node(n, val);
    return val;
}

} // namespace seqdict
