#pragma once

/// @file guid.hpp
/// @brief Guid — persisted 32-bit unique id; GuidRegistry — ids in use.
///
/// Guid is a plain value. Uniqueness is tracked by a GuidRegistry:
/// generate() reserves a fresh id, release() returns it, and loading a Guid
/// from a document registers the loaded id with GuidRegistry::global().
/// Id 0 is never handed out and marks an invalid Guid.

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "node.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>

namespace seqdict {

class Guid {
public:
    constexpr Guid() noexcept = default;
    constexpr explicit Guid(int32_t id) noexcept : id_(id) {}

    [[nodiscard]] static constexpr Guid invalid() noexcept { return Guid{}; }

    [[nodiscard]] constexpr int32_t id() const noexcept { return id_; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return id_ != 0; }

    constexpr bool operator==(const Guid& other) const noexcept { return id_ == other.id_; }
    constexpr bool operator!=(const Guid& other) const noexcept { return id_ != other.id_; }

private:
    int32_t id_ = 0;
};

/// @brief Set of ids in use plus the generator that draws new ones.
///
/// All members lock an internal mutex, so one registry (typically global())
/// may be shared between threads.
class GuidRegistry {
public:
    static constexpr int32_t kMaxId = INT32_MAX;

    /// Nondeterministic seed.
    GuidRegistry() : GuidRegistry(std::random_device{}()) {}

    /// Fixed seed; @p max_id bounds the drawn ids to [1, max_id].
    explicit GuidRegistry(uint32_t seed, int32_t max_id = kMaxId)
        : rng_(seed), dist_(0, max_id < 1 ? 1 : max_id) {}

    GuidRegistry(const GuidRegistry&) = delete;
    GuidRegistry& operator=(const GuidRegistry&) = delete;

    /// Process-wide registry.
    static GuidRegistry& global() {
        static GuidRegistry instance;
        return instance;
    }

    /// Draw an unused non-zero id and mark it used.
    /// Throws IdExhaustedError after SEQDICT_GUID_MAX_ATTEMPTS draws.
    [[nodiscard]] Guid generate() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int attempt = 0; attempt < SEQDICT_GUID_MAX_ATTEMPTS; ++attempt) {
            const int32_t id = dist_(rng_);
            if (id == 0 || used_.count(id) != 0) continue;
            used_.insert(id);
            return Guid(id);
        }
        logger()->error("no unused id after {} attempts ({} ids in use)",
                        SEQDICT_GUID_MAX_ATTEMPTS, used_.size());
        throw IdExhaustedError("failed to generate a unique id in " +
                               std::to_string(SEQDICT_GUID_MAX_ATTEMPTS) +
                               " attempts; increase the size of the id space");
    }

    [[nodiscard]] bool is_used(int32_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_.count(id) != 0;
    }
    [[nodiscard]] bool is_used(Guid g) const { return is_used(g.id()); }

    /// Return @p g to the pool. Returns false if it was not in use.
    bool release(Guid g) {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_.erase(g.id()) != 0;
    }

    /// Mark a loaded id as used. Invalid ids are ignored.
    void register_loaded(Guid g) {
        if (!g.is_valid()) return;
        std::lock_guard<std::mutex> lock(mutex_);
        used_.insert(g.id());
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        used_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::mt19937 rng_;
    std::uniform_int_distribution<int32_t> dist_;
    std::unordered_set<int32_t> used_;
};

inline void to_node(Node& n, const Guid& g) { n = Node(static_cast<int64_t>(g.id())); }

/// Registers the loaded id with GuidRegistry::global().
inline void from_node(const Node& n, Guid& g) {
    const int64_t raw = n.as_integer();
    if (SEQDICT_UNLIKELY(raw < INT32_MIN || raw > INT32_MAX)) {
        throw TypeError("guid id " + std::to_string(raw) + " does not fit in 32 bits");
    }
    g = Guid(static_cast<int32_t>(raw));
    GuidRegistry::global().register_loaded(g);
}

} // namespace seqdict

namespace std {
template <>
struct hash<seqdict::Guid> {
    size_t operator()(const seqdict::Guid& g) const noexcept {
        return hash<int32_t>{}(g.id());
    }
};
} // namespace std
