#pragma once

/// @file node.hpp
/// @brief Persisted document tree: Node — a tagged value the containers
///        save into and load from.
///
/// A Node is one of: null, bool, int64_t, uint64_t, double, string,
/// array or object. Object members keep insertion order, so a saved record
/// sequence reads back in the same order it was written.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace seqdict {

class Node {
public:
    Node() noexcept : v_(nullptr) {}
    Node(std::nullptr_t) noexcept : v_(nullptr) {}
    Node(bool v) noexcept : v_(v) {}
    Node(int v) noexcept : v_(static_cast<int64_t>(v)) {}
    Node(int64_t v) noexcept : v_(v) {}
    Node(unsigned v) noexcept : v_(static_cast<int64_t>(v)) {}
    Node(uint64_t v) noexcept : v_(v) {}
    Node(double v) noexcept : v_(v) {}
    Node(const char* v) : v_(nullptr) {
        if (SEQDICT_UNLIKELY(!v)) return;
        v_ = std::string(v);
    }
    Node(std::string_view v) : v_(std::string(v)) {}
    Node(const std::string& v) : v_(v) {}
    Node(std::string&& v) noexcept : v_(std::move(v)) {}
    Node(const Array& v) : v_(v) {}
    Node(Array&& v) noexcept : v_(std::move(v)) {}
    Node(const Object& v) : v_(v) {}
    Node(Object&& v) noexcept : v_(std::move(v)) {}

    [[nodiscard]] static Node array() { return Node(Array{}); }
    [[nodiscard]] static Node object() { return Node(Object{}); }

    /// Variant alternatives are declared in Type order.
    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(v_.index()); }
    [[nodiscard]] bool is_null()     const noexcept { return type() == Type::Null; }
    [[nodiscard]] bool is_bool()     const noexcept { return type() == Type::Bool; }
    [[nodiscard]] bool is_integer()  const noexcept { return type() == Type::Integer; }
    [[nodiscard]] bool is_uinteger() const noexcept { return type() == Type::UInteger; }
    [[nodiscard]] bool is_float()    const noexcept { return type() == Type::Float; }
    [[nodiscard]] bool is_string()   const noexcept { return type() == Type::String; }
    [[nodiscard]] bool is_array()    const noexcept { return type() == Type::Array; }
    [[nodiscard]] bool is_object()   const noexcept { return type() == Type::Object; }
    [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_uinteger() || is_float(); }

    bool as_bool() const {
        if (SEQDICT_UNLIKELY(!is_bool())) type_error("bool");
        return std::get<bool>(v_);
    }
    int64_t as_integer() const {
        if (is_integer()) return std::get<int64_t>(v_);
        if (is_uinteger() && std::get<uint64_t>(v_) <= static_cast<uint64_t>(INT64_MAX))
            return static_cast<int64_t>(std::get<uint64_t>(v_));
        type_error("integer");
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return std::get<uint64_t>(v_);
        if (is_integer() && std::get<int64_t>(v_) >= 0)
            return static_cast<uint64_t>(std::get<int64_t>(v_));
        type_error("uinteger");
    }
    double as_float() const {
        if (is_float()) return std::get<double>(v_);
        if (is_integer()) return static_cast<double>(std::get<int64_t>(v_));
        if (is_uinteger()) return static_cast<double>(std::get<uint64_t>(v_));
        type_error("number");
    }

    [[nodiscard]] const std::string& as_string() const {
        if (SEQDICT_UNLIKELY(!is_string())) type_error("string");
        return std::get<std::string>(v_);
    }
    [[nodiscard]] const Array& as_array() const {
        if (SEQDICT_UNLIKELY(!is_array())) type_error("array");
        return std::get<Array>(v_);
    }
    Array& as_array() {
        if (SEQDICT_UNLIKELY(!is_array())) type_error("array");
        return std::get<Array>(v_);
    }
    [[nodiscard]] const Object& as_object() const {
        if (SEQDICT_UNLIKELY(!is_object())) type_error("object");
        return std::get<Object>(v_);
    }
    Object& as_object() {
        if (SEQDICT_UNLIKELY(!is_object())) type_error("object");
        return std::get<Object>(v_);
    }

    Node& operator[](size_t index) {
        auto& a = as_array();
        if (SEQDICT_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    const Node& operator[](size_t index) const {
        const auto& a = as_array();
        if (SEQDICT_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    Node& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const Node& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    Node& operator[](std::string_view key) { return as_object()[key]; }
    const Node& operator[](std::string_view key) const { return as_object().at(key); }
    Node& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Node& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && std::get<Object>(v_).contains(key);
    }
    [[nodiscard]] const Node* find(std::string_view key) const {
        return is_object() ? std::get<Object>(v_).find(key) : nullptr;
    }
    [[nodiscard]] Node* find(std::string_view key) {
        return is_object() ? std::get<Object>(v_).find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return std::get<Array>(v_).size();
        if (is_object()) return std::get<Object>(v_).size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        return (is_array() || is_object()) && size() == 0;
    }

    void push_back(const Node& v) { as_array().push_back(v); }
    void push_back(Node&& v)      { as_array().push_back(std::move(v)); }

    void insert(std::string key, Node v) { as_object().insert(std::move(key), std::move(v)); }
    bool erase(std::string_view key) { return as_object().erase(key); }

    [[nodiscard]] bool operator==(const Node& other) const {
        if (type() != other.type()) {
            if (is_number() && other.is_number()) {
                // Exact int/uint comparison without double-precision loss
                if ((is_integer() && other.is_uinteger()) || (is_uinteger() && other.is_integer())) {
                    int64_t  sv = is_integer()  ? std::get<int64_t>(v_)  : std::get<int64_t>(other.v_);
                    uint64_t uv = is_uinteger() ? std::get<uint64_t>(v_) : std::get<uint64_t>(other.v_);
                    return sv >= 0 && static_cast<uint64_t>(sv) == uv;
                }
                return as_float() == other.as_float();
            }
            return false;
        }
        return v_ == other.v_;
    }
    [[nodiscard]] bool operator!=(const Node& other) const { return !(*this == other); }

private:
    using storage_type = std::variant<std::nullptr_t, bool, int64_t, double,
                                      std::string, Array, Object, uint64_t>;
    storage_type v_;

    [[noreturn]] SEQDICT_NOINLINE void type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(type()));
    }
    [[noreturn]] SEQDICT_NOINLINE static void index_error(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(size) + ")");
    }
};

// ─── Object member functions ─────────────────────────────────────────────

inline Object::Object(std::initializer_list<std::pair<std::string, Node>> init)
    : entries(init.begin(), init.end()) {}

inline Node* Object::find(std::string_view key) noexcept {
    for (auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline const Node* Object::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline Node& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    entries.emplace_back(std::string(key), Node{});
    return entries.back().second;
}
inline const Node& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (SEQDICT_UNLIKELY(!p)) throw KeyNotFoundError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline void Object::insert(std::string key, Node value) {
    for (auto& [k, v] : entries) { if (k == key) { v = std::move(value); return; } }
    entries.emplace_back(std::move(key), std::move(value));
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) { entries.erase(it); return true; }
    }
    return false;
}
inline void Object::merge_repeated_keys() {
    if (entries.size() < 2) return;
    // Views stay valid: no entry is moved until the map is done.
    std::unordered_map<std::string_view, size_t> first_pos;
    first_pos.reserve(entries.size());
    std::vector<bool> keep(entries.size(), true);
    bool repeated = false;
    for (size_t i = 0; i < entries.size(); ++i) {
        auto [it, inserted] = first_pos.try_emplace(entries[i].first, i);
        if (inserted) continue;
        entries[it->second].second = std::move(entries[i].second);
        keep[i] = false;
        repeated = true;
    }
    if (!repeated) return;
    first_pos.clear();
    size_t out = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!keep[i]) continue;
        if (out != i) entries[out] = std::move(entries[i]);
        ++out;
    }
    entries.resize(out);
}

inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace seqdict
