#pragma once

/// @file detail/describe.hpp
/// @brief Key-to-text helper for error and log messages.
///
/// Keys of arbitrary type end up in exception messages ("key not found: 7").
/// Types with an ostream inserter are printed; everything else is shown as
/// a placeholder so that a missing operator<< never breaks compilation.

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace seqdict::detail {

template <typename T, typename = void>
struct is_ostreamable : std::false_type {};

template <typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                              << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
[[nodiscard]] std::string describe(const T& v) {
    if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        std::string out;
        out.reserve(std::string_view(v).size() + 2);
        out.push_back('"');
        out.append(std::string_view(v));
        out.push_back('"');
        return out;
    } else if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        // Promote char types so they print as numbers.
        std::ostringstream os;
        os << +v;
        return os.str();
    } else if constexpr (is_ostreamable<T>::value) {
        std::ostringstream os;
        os << v;
        return os.str();
    } else {
        return "<unprintable key>";
    }
}

} // namespace seqdict::detail
