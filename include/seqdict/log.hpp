#pragma once

/// @file log.hpp
/// @brief Library logger: a single named spdlog logger.
///
/// All seqdict diagnostics (skipped records, collapsed duplicates, index
/// rebuilds, save/load hooks) go through seqdict::logger(). The host either
/// registers its own logger under SEQDICT_LOGGER_NAME before first use, or
/// installs one explicitly:
///
/// @code
///   auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(my_stream);
///   seqdict::set_logger(std::make_shared<spdlog::logger>("seqdict", sink));
///   seqdict::set_log_level(spdlog::level::debug);
/// @endcode
///
/// Without either, a stderr color logger is created lazily at warn level.

#include "config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace seqdict {

namespace detail {

inline std::shared_ptr<spdlog::logger>& logger_slot() noexcept {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

} // namespace detail

/// @brief The logger seqdict writes to (created on first use).
inline const std::shared_ptr<spdlog::logger>& logger() {
    auto& slot = detail::logger_slot();
    if (SEQDICT_UNLIKELY(!slot)) {
        slot = spdlog::get(SEQDICT_LOGGER_NAME);
        if (!slot) {
            slot = spdlog::stderr_color_mt(SEQDICT_LOGGER_NAME);
            slot->set_level(spdlog::level::warn);
        }
    }
    return slot;
}

/// @brief Replace the library logger. Passing nullptr restores lazy lookup.
inline void set_logger(std::shared_ptr<spdlog::logger> l) noexcept {
    detail::logger_slot() = std::move(l);
}

/// @brief Convenience: change the level of the current library logger.
inline void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace seqdict
