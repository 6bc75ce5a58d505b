#pragma once

/// @file options.hpp
/// @brief Runtime options for loading, reading and writing persisted state.
///
///   - LoadOptions  — how a container treats a freshly loaded record sequence
///   - ReadOptions  — document reader extensions and limits
///   - WriteOptions — document writer layout

#include <cstddef>
#include <cstdint>

namespace seqdict {

/// @brief What to do when a loaded record sequence repeats a key.
enum class DuplicatePolicy : uint8_t {
    /// Collapse: the first occurrence keeps its position, the last value wins.
    last_wins = 0,
    /// Refuse the load with DuplicateKeyError.
    reject    = 1,
};

/// @brief Container load behaviour (applied by after_load()).
struct LoadOptions {
    /// Duplicate key handling in the loaded sequence.
    DuplicatePolicy duplicates = DuplicatePolicy::last_wins;

    /// Skip null / malformed records instead of raising FormatError.
    bool skip_malformed = true;

    /// Permissive defaults: keep partially corrupt data loadable.
    static constexpr LoadOptions lenient() noexcept {
        return {};
    }

    /// Every record must be well-formed and every key unique.
    static constexpr LoadOptions strict() noexcept {
        LoadOptions opts;
        opts.duplicates     = DuplicatePolicy::reject;
        opts.skip_malformed = false;
        return opts;
    }
};

/// @brief Document reader configuration.
struct ReadOptions {
    /// Allow C/C++ comments: // line, /* block */
    bool allow_comments        = false;

    /// Allow trailing commas: [1,2,3,] and {"a":1,}
    bool allow_trailing_commas = false;

    /// Maximum nesting depth (0 = use SEQDICT_MAX_DEPTH)
    size_t max_depth = 0;

    /// Plain JSON (RFC 8259).
    static constexpr ReadOptions strict() noexcept {
        return {};
    }

    /// Hand-edited save files: comments and trailing commas accepted.
    static constexpr ReadOptions lenient() noexcept {
        ReadOptions opts;
        opts.allow_comments        = true;
        opts.allow_trailing_commas = true;
        return opts;
    }
};

/// @brief Document writer configuration.
struct WriteOptions {
    int indent = -1;  ///< Indentation (-1 = compact, >= 0 = pretty-printed)
};

// ─── Thread-local load context ──────────────────────────────────────────────

namespace detail {

/// Thread-local pointer to the active LoadOptions (nullptr when inactive).
/// Read by the from_node() hooks of the containers, whose ADL signature
/// has no room for an options argument.
inline thread_local const LoadOptions* current_load_options = nullptr;

/// @brief Options for the load in progress, or the lenient defaults.
inline const LoadOptions& load_options() noexcept {
    static constexpr LoadOptions kDefaults{};
    if (const auto* opts = current_load_options) return *opts;
    return kDefaults;
}

} // namespace detail

/// @brief RAII guard that activates LoadOptions for the current thread.
///
/// While the guard is alive, every container loaded through from_node() on
/// this thread applies these options. Nesting is supported: the previous
/// options are restored when the guard is destroyed.
class LoadScope {
public:
    explicit LoadScope(const LoadOptions& opts) noexcept
        : prev_(detail::current_load_options)
    {
        detail::current_load_options = &opts;
    }

    /// The guard only points at the options; a temporary would dangle.
    explicit LoadScope(LoadOptions&&) = delete;

    ~LoadScope() noexcept {
        detail::current_load_options = prev_;
    }

    LoadScope(const LoadScope&) = delete;
    LoadScope& operator=(const LoadScope&) = delete;

private:
    const LoadOptions* prev_;
};

} // namespace seqdict
