#pragma once

/// @file dictionary.hpp
/// @brief SerializableDictionary — hash lookup written through to an ordered
///        record sequence that a host serializer can persist.
///
/// Two representations of the same associations:
///   - Record Sequence (Sequence, default PairList<K, V>): ordered, persisted,
///     owned by the dictionary and mutated only through its API.
///   - Lookup Index (std::unordered_map): derived, never persisted.
///
/// Mutations update both. Reads first check whether the index is stale
/// (never built, or its size differs from the sequence length) and rebuild it
/// in one pass when it is. A repeated key in the sequence overwrites the
/// earlier value during the rebuild (last write wins).
///
/// Persistence:
/// @code
///   seqdict::SerializableDictionary<int, int> d;
///   d.add(1, 10);
///   d.add(2, 20);
///   std::string text = seqdict::save_string(d);    // [{"key":1,"value":10},...]
///   auto e = seqdict::load_string<seqdict::SerializableDictionary<int, int>>(text);
/// @endcode

#include "config.hpp"
#include "conversion.hpp"
#include "detail/describe.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "log.hpp"
#include "node.hpp"
#include "options.hpp"
#include "pair_list.hpp"

#include <cstddef>
#include <initializer_list>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace seqdict {

template <typename K, typename V, typename Sequence, typename Hash, typename KeyEqual>
class SerializableDictionary {
    static_assert(is_record_sequence_v<Sequence, K, V, Hash, KeyEqual>,
                  "Sequence must provide size, append, upsert, key_at, value_at, "
                  "remove_key, clear, begin/end and collapse_duplicates");

public:
    using key_type       = K;
    using mapped_type    = V;
    using value_type     = SerializablePair<K, V>;
    using sequence_type  = Sequence;
    using index_type     = std::unordered_map<K, V, Hash, KeyEqual>;
    using size_type      = size_t;
    using const_iterator = decltype(std::declval<const Sequence&>().begin());

    SerializableDictionary() = default;

    /// Pairs are applied with set(): a repeated key keeps its first position.
    SerializableDictionary(std::initializer_list<std::pair<K, V>> init) {
        for (const auto& [k, v] : init) set(k, v);
    }

    // ─── Lookup ─────────────────────────────────────────────────────────

    /// Throws KeyNotFoundError if @p key is absent.
    [[nodiscard]] const V& get(const K& key) const {
        const auto& idx = index();
        auto it = idx.find(key);
        if (SEQDICT_UNLIKELY(it == idx.end())) key_not_found(key);
        return it->second;
    }
    [[nodiscard]] const V& at(const K& key) const { return get(key); }

    /// Copies the value into @p out when present; @p out is untouched otherwise.
    bool try_get(const K& key, V& out) const {
        const auto& idx = index();
        auto it = idx.find(key);
        if (it == idx.end()) return false;
        out = it->second;
        return true;
    }

    [[nodiscard]] V get_or(const K& key, V fallback) const {
        const auto& idx = index();
        auto it = idx.find(key);
        if (it == idx.end()) return fallback;
        return it->second;
    }

    /// Pointer into the index, valid until the next mutation.
    [[nodiscard]] const V* find(const K& key) const {
        const auto& idx = index();
        auto it = idx.find(key);
        return it == idx.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const K& key) const {
        return index().count(key) != 0;
    }

    // ─── Mutation ───────────────────────────────────────────────────────

    /// Update in place (same sequence position) or append.
    void set(const K& key, const V& value) {
        auto& idx = index();
        auto it = idx.find(key);
        if (it != idx.end()) {
            seq_.upsert(key, value, idx.key_eq());
            it->second = value;
        } else {
            seq_.append(key, value);
            idx.emplace(key, value);
        }
    }

    /// Throws DuplicateKeyError if @p key is present.
    void add(const K& key, const V& value) {
        auto& idx = index();
        if (SEQDICT_UNLIKELY(idx.count(key) != 0)) {
            throw DuplicateKeyError("key already present: " + detail::describe(key));
        }
        seq_.append(key, value);
        idx.emplace(key, value);
    }

    /// Remove @p key. Returns false (and changes nothing) if it is absent.
    bool remove(const K& key) {
        auto& idx = index();
        auto it = idx.find(key);
        if (it == idx.end()) return false;
        seq_.remove_key(key, idx.key_eq());
        idx.erase(it);
        return true;
    }

    void clear() noexcept {
        seq_.clear();
        index_.clear();
        built_ = true;
    }

    // ─── Capacity ───────────────────────────────────────────────────────

    /// Number of distinct keys.
    [[nodiscard]] size_type size() const { return index().size(); }
    [[nodiscard]] size_type count() const { return size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

    // ─── Sequence-ordered views ─────────────────────────────────────────

    [[nodiscard]] std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(seq_.size());
        for (size_type i = 0; i < seq_.size(); ++i) out.push_back(seq_.key_at(i));
        return out;
    }

    [[nodiscard]] std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(seq_.size());
        for (size_type i = 0; i < seq_.size(); ++i) out.push_back(seq_.value_at(i));
        return out;
    }

    const_iterator begin() const noexcept { return seq_.begin(); }
    const_iterator end() const noexcept { return seq_.end(); }

    /// The persisted form.
    [[nodiscard]] const Sequence& records() const noexcept { return seq_; }

    // ─── Persistence hooks ──────────────────────────────────────────────

    /// Called before the record sequence goes to the serializer. Mutations
    /// write through, so the sequence is already current.
    void before_save() const {
        logger()->trace("before_save: {} records", seq_.size());
    }

    /// Called after the record sequence was replaced from persisted form.
    /// Applies the duplicate-key policy and rebuilds the index.
    ///
    /// Under DuplicatePolicy::reject this throws DuplicateKeyError and leaves
    /// the repeated records in place; load() and from_node() instead keep
    /// the previous contents.
    void after_load(const LoadOptions& opts = {}) {
        logger()->trace("after_load: {} records", seq_.size());
        built_ = false;
        rebuild();
        if (SEQDICT_LIKELY(index_.size() == seq_.size())) return;

        if (opts.duplicates == DuplicatePolicy::reject) {
            throw DuplicateKeyError("loaded records repeat key " +
                                    detail::describe(first_duplicate()));
        }
        const size_type dropped =
            seq_.collapse_duplicates(index_.hash_function(), index_.key_eq());
        logger()->warn("collapsed {} duplicate records on load (last value wins)", dropped);
    }

    /// Replace the contents with externally loaded @p records.
    /// Strong guarantee: on DuplicateKeyError the dictionary is unchanged.
    void load(Sequence records, const LoadOptions& opts = {}) {
        SerializableDictionary tmp;
        tmp.seq_ = std::move(records);
        tmp.after_load(opts);
        swap(tmp);
    }

    void swap(SerializableDictionary& other) noexcept {
        using std::swap;
        swap(seq_, other.seq_);
        swap(index_, other.index_);
        swap(built_, other.built_);
    }

    friend void swap(SerializableDictionary& a, SerializableDictionary& b) noexcept { a.swap(b); }

    /// Same associations, in any order.
    bool operator==(const SerializableDictionary& other) const {
        const auto& mine = index();
        const auto& theirs = other.index();
        if (mine.size() != theirs.size()) return false;
        for (const auto& [k, v] : mine) {
            auto it = theirs.find(k);
            if (it == theirs.end() || !(it->second == v)) return false;
        }
        return true;
    }
    bool operator!=(const SerializableDictionary& other) const { return !(*this == other); }

private:
    Sequence seq_;
    mutable index_type index_;
    mutable bool built_ = false;

    [[nodiscard]] bool stale() const noexcept {
        return !built_ || index_.size() != seq_.size();
    }

    index_type& index() const {
        if (SEQDICT_UNLIKELY(stale())) rebuild();
        return index_;
    }

    void rebuild() const {
        logger()->trace("rebuilding lookup index from {} records", seq_.size());
        index_type fresh(seq_.size(), index_.hash_function(), index_.key_eq());
        for (size_type i = 0; i < seq_.size(); ++i) {
            fresh.insert_or_assign(seq_.key_at(i), seq_.value_at(i));
        }
        index_ = std::move(fresh);
        built_ = true;
    }

    const K& first_duplicate() const {
        std::unordered_set<K, Hash, KeyEqual> seen(seq_.size(), index_.hash_function(),
                                                   index_.key_eq());
        for (size_type i = 0; i < seq_.size(); ++i) {
            if (!seen.insert(seq_.key_at(i)).second) return seq_.key_at(i);
        }
        return seq_.key_at(0);
    }

    [[noreturn]] SEQDICT_NOINLINE static void key_not_found(const K& key) {
        throw KeyNotFoundError("key not found: " + detail::describe(key));
    }
};

// =====================================================================
// Persisted form: exactly the record sequence
// =====================================================================

template <typename K, typename V, typename S, typename H, typename E>
void to_node(Node& n, const SerializableDictionary<K, V, S, H, E>& d) {
    d.before_save();
    to_node(n, d.records());
}

/// Applies the LoadOptions of the active LoadScope (lenient by default).
template <typename K, typename V, typename S, typename H, typename E>
void from_node(const Node& n, SerializableDictionary<K, V, S, H, E>& d) {
    S records;
    from_node(n, records);
    d.load(std::move(records), detail::load_options());
}

} // namespace seqdict
