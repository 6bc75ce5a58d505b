#pragma once

/// @file bitmask.hpp
/// @brief Bitmask — a persisted 32-bit flag set.

#include "error.hpp"
#include "node.hpp"

#include <cstdint>
#include <string>

namespace seqdict {

class Bitmask {
public:
    constexpr Bitmask() noexcept = default;
    constexpr explicit Bitmask(uint32_t raw) noexcept : bits_(raw) {}

    [[nodiscard]] constexpr uint32_t raw() const noexcept { return bits_; }
    constexpr void set_raw(uint32_t raw) noexcept { bits_ = raw; }

    /// Set (or clear) every bit of @p flag.
    constexpr void set(uint32_t flag, bool value) noexcept {
        if (value) bits_ |= flag;
        else       bits_ &= ~flag;
    }

    /// True if any bit of @p flag is set.
    [[nodiscard]] constexpr bool get(uint32_t flag) const noexcept { return (bits_ & flag) != 0; }

    constexpr bool operator==(const Bitmask& other) const noexcept { return bits_ == other.bits_; }
    constexpr bool operator!=(const Bitmask& other) const noexcept { return bits_ != other.bits_; }

private:
    uint32_t bits_ = 0;
};

inline void to_node(Node& n, const Bitmask& b) { n = Node(static_cast<uint64_t>(b.raw())); }

inline void from_node(const Node& n, Bitmask& b) {
    const uint64_t raw = n.as_uinteger();
    if (raw > UINT32_MAX) {
        throw TypeError("bitmask value " + std::to_string(raw) + " does not fit in 32 bits");
    }
    b.set_raw(static_cast<uint32_t>(raw));
}

} // namespace seqdict
