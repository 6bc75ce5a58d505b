#pragma once

/// @file pair_list.hpp
/// @brief PairList — ordered, persistable list of SerializablePair records.
///
/// PairList is the stock Record Sequence behind SerializableDictionary. Besides
/// the list API it provides the record-sequence capability set the dictionary
/// drives it through (see is_record_sequence_v):
///
///   size, append, upsert, key_at, value_at, remove_key, clear,
///   begin/end, collapse_duplicates
///
/// Persisted form: [{"key": K, "value": V}, ...]

#include "config.hpp"
#include "conversion.hpp"
#include "error.hpp"
#include "log.hpp"
#include "node.hpp"
#include "options.hpp"
#include "pair.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seqdict {

template <typename K, typename V>
class PairList {
public:
    using key_type        = K;
    using mapped_type     = V;
    using value_type      = SerializablePair<K, V>;
    using storage_type    = std::vector<value_type>;
    using size_type       = size_t;
    using iterator        = typename storage_type::iterator;
    using const_iterator  = typename storage_type::const_iterator;

    static constexpr size_type npos = static_cast<size_type>(-1);

    PairList() = default;
    PairList(std::initializer_list<value_type> init) : list_(init) {}

    // ─── List API ───────────────────────────────────────────────────────

    void add(K key, V value) { list_.emplace_back(std::move(key), std::move(value)); }
    void push_back(const value_type& p) { list_.push_back(p); }
    void push_back(value_type&& p) { list_.push_back(std::move(p)); }

    /// Insert before @p index (index == size() appends).
    void insert(size_type index, value_type p) {
        if (SEQDICT_UNLIKELY(index > list_.size())) index_error(index);
        list_.insert(list_.begin() + static_cast<std::ptrdiff_t>(index), std::move(p));
    }

    void erase_at(size_type index) {
        if (SEQDICT_UNLIKELY(index >= list_.size())) index_error(index);
        list_.erase(list_.begin() + static_cast<std::ptrdiff_t>(index));
    }

    /// Remove the first record equal to @p p.
    bool remove(const value_type& p) {
        auto it = std::find(list_.begin(), list_.end(), p);
        if (it == list_.end()) return false;
        list_.erase(it);
        return true;
    }

    [[nodiscard]] size_type index_of(const value_type& p) const {
        auto it = std::find(list_.begin(), list_.end(), p);
        return it == list_.end() ? npos : static_cast<size_type>(it - list_.begin());
    }
    [[nodiscard]] bool contains(const value_type& p) const { return index_of(p) != npos; }

    value_type& operator[](size_type i) noexcept { return list_[i]; }
    const value_type& operator[](size_type i) const noexcept { return list_[i]; }

    value_type& at(size_type i) {
        if (SEQDICT_UNLIKELY(i >= list_.size())) index_error(i);
        return list_[i];
    }
    const value_type& at(size_type i) const {
        if (SEQDICT_UNLIKELY(i >= list_.size())) index_error(i);
        return list_[i];
    }

    /// Copy every record into @p dest starting at @p offset.
    /// @p dest must already hold at least offset + size() elements.
    template <typename Container>
    void copy_to(Container& dest, size_type offset = 0) const {
        const size_type capacity = static_cast<size_type>(dest.size());
        if (SEQDICT_UNLIKELY(offset > capacity || capacity - offset < list_.size())) {
            throw OutOfRangeError("copy_to: destination holds " + std::to_string(capacity) +
                                  " elements, need " + std::to_string(list_.size()) +
                                  " from offset " + std::to_string(offset));
        }
        std::copy(list_.begin(), list_.end(),
                  std::begin(dest) + static_cast<std::ptrdiff_t>(offset));
    }

    void clear() noexcept { list_.clear(); }
    void reserve(size_type n) { list_.reserve(n); }
    [[nodiscard]] size_type size() const noexcept { return list_.size(); }
    [[nodiscard]] bool empty() const noexcept { return list_.empty(); }

    iterator begin() noexcept { return list_.begin(); }
    iterator end() noexcept { return list_.end(); }
    const_iterator begin() const noexcept { return list_.begin(); }
    const_iterator end() const noexcept { return list_.end(); }

    bool operator==(const PairList& other) const { return list_ == other.list_; }
    bool operator!=(const PairList& other) const { return !(*this == other); }

    // ─── Record-sequence capabilities ───────────────────────────────────

    [[nodiscard]] const K& key_at(size_type i) const noexcept { return list_[i].first; }
    [[nodiscard]] const V& value_at(size_type i) const noexcept { return list_[i].second; }

    void append(const K& key, const V& value) { list_.emplace_back(key, value); }

    /// Overwrite the value of the first record whose key matches @p key
    /// under @p eq, or append. Returns the record's position.
    template <typename KeyEqual = std::equal_to<K>>
    size_type upsert(const K& key, const V& value, const KeyEqual& eq = KeyEqual{}) {
        for (size_type i = 0; i < list_.size(); ++i) {
            if (eq(list_[i].first, key)) {
                list_[i].second = value;
                return i;
            }
        }
        list_.emplace_back(key, value);
        return list_.size() - 1;
    }

    /// Remove the first record whose key matches @p key under @p eq
    /// (order of the rest is kept).
    template <typename KeyEqual = std::equal_to<K>>
    bool remove_key(const K& key, const KeyEqual& eq = KeyEqual{}) {
        for (auto it = list_.begin(); it != list_.end(); ++it) {
            if (eq(it->first, key)) {
                list_.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Merge repeated keys: the first occurrence keeps its position and takes
    /// the value of the last one. Returns the number of records dropped.
    template <typename Hash, typename KeyEqual>
    size_type collapse_duplicates(const Hash& hash, const KeyEqual& eq) {
        std::unordered_map<K, size_type, Hash, KeyEqual> first_pos(list_.size(), hash, eq);
        storage_type out;
        out.reserve(list_.size());
        for (auto& rec : list_) {
            auto [it, inserted] = first_pos.try_emplace(rec.first, out.size());
            if (inserted) out.push_back(std::move(rec));
            else out[it->second].second = std::move(rec.second);
        }
        const size_type dropped = list_.size() - out.size();
        list_ = std::move(out);
        return dropped;
    }

private:
    storage_type list_;

    [[noreturn]] SEQDICT_NOINLINE void index_error(size_type index) const {
        throw OutOfRangeError("pair list index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(list_.size()) + ")");
    }
};

// =====================================================================
// Record-sequence detection
// =====================================================================

/// True when S provides the record-sequence capability set for K and V.
/// Hash and KeyEqual are the ones the dictionary passes to upsert(),
/// remove_key() and collapse_duplicates().
template <typename S, typename K, typename V,
          typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>,
          typename = void>
struct is_record_sequence : std::false_type {};

template <typename S, typename K, typename V, typename Hash, typename KeyEqual>
struct is_record_sequence<S, K, V, Hash, KeyEqual, std::void_t<
    decltype(std::declval<const S&>().size()),
    decltype(std::declval<S&>().append(std::declval<const K&>(), std::declval<const V&>())),
    decltype(std::declval<S&>().upsert(std::declval<const K&>(), std::declval<const V&>(),
                                       std::declval<const KeyEqual&>())),
    decltype(std::declval<const S&>().key_at(size_t{})),
    decltype(std::declval<const S&>().value_at(size_t{})),
    decltype(std::declval<S&>().remove_key(std::declval<const K&>(),
                                           std::declval<const KeyEqual&>())),
    decltype(std::declval<S&>().clear()),
    decltype(std::declval<const S&>().begin()),
    decltype(std::declval<const S&>().end()),
    decltype(std::declval<S&>().collapse_duplicates(std::declval<const Hash&>(),
                                                     std::declval<const KeyEqual&>()))>>
    : std::true_type {};

template <typename S, typename K, typename V,
          typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
inline constexpr bool is_record_sequence_v = is_record_sequence<S, K, V, Hash, KeyEqual>::value;

// =====================================================================
// Persisted form
// =====================================================================

template <typename K, typename V>
void to_node(Node& n, const PairList<K, V>& list) {
    Array arr;
    arr.reserve(list.size());
    for (const auto& rec : list) arr.push_back(to_document(rec));
    n = Node(std::move(arr));
}

namespace detail {

/// Why @p rec cannot be a record, or nullptr if it has the right shape.
inline const char* record_shape_error(const Node& rec) noexcept {
    if (rec.is_null()) return "null record";
    if (!rec.is_object()) return "record is not an object";
    if (!rec.contains("key")) return "record has no \"key\"";
    if (!rec.contains("value")) return "record has no \"value\"";
    return nullptr;
}

[[noreturn]] inline void malformed_record(size_t index, const std::string& reason) {
    throw FormatError("malformed record at index " + std::to_string(index) + ": " + reason);
}

} // namespace detail

/// Honors the active LoadOptions (LoadScope): malformed records are either
/// skipped with a warning or reported as FormatError.
template <typename K, typename V>
void from_node(const Node& n, PairList<K, V>& list) {
    const LoadOptions& opts = detail::load_options();
    PairList<K, V> out;
    if (n.is_null()) {
        list = std::move(out);
        return;
    }
    const auto& arr = n.as_array();
    out.reserve(arr.size());
    size_t skipped = 0;
    for (size_t i = 0; i < arr.size(); ++i) {
        std::string reason;
        if (const char* shape = detail::record_shape_error(arr[i])) {
            reason = shape;
        } else {
            SerializablePair<K, V> rec;
            try {
                from_node(arr[i], rec);
                out.push_back(std::move(rec));
                continue;
            } catch (const TypeError& e) {
                reason = e.what();
            } catch (const KeyNotFoundError& e) {
                reason = e.what();
            }
        }
        if (!opts.skip_malformed) detail::malformed_record(i, reason);
        logger()->warn("skipping malformed record at index {}: {}", i, reason);
        ++skipped;
    }
    if (skipped > 0) {
        logger()->warn("loaded {} of {} records ({} skipped)", out.size(), arr.size(), skipped);
    }
    list = std::move(out);
}

} // namespace seqdict
