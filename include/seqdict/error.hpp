#pragma once

/// @file error.hpp
/// @brief Error types for seqdict: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: KeyNotFoundError, DuplicateKeyError, ParseError, ...
///   - Via error_code: seqdict::errc enum + seqdict_category() (exception-free)
///
/// Use try_read(input) for exception-free document reading.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace seqdict {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source document text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief seqdict error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Document parse errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,

    // Container access errors (50-79)
    key_not_found           = 50,
    duplicate_key           = 51,
    out_of_range            = 52,
    type_mismatch           = 53,

    // Persisted form errors (80-89)
    malformed_record        = 80,

    // Unique id errors (90-99)
    id_space_exhausted      = 90,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class seqdict_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "seqdict";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_array:      return "unterminated array";
            case errc::unterminated_object:     return "unterminated object";
            case errc::trailing_content:        return "trailing content after document";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::key_not_found:           return "key not found";
            case errc::duplicate_key:           return "duplicate key";
            case errc::out_of_range:            return "index out of range";
            case errc::type_mismatch:           return "type mismatch";
            case errc::malformed_record:        return "malformed record";
            case errc::id_space_exhausted:      return "unique id space exhausted";
            default:                            return "unknown seqdict error";
        }
    }
};

} // namespace detail

/// @brief Get the seqdict error category singleton.
inline const std::error_category& seqdict_category() noexcept {
    static const detail::seqdict_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from seqdict::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), seqdict_category()};
}

/// @brief Create an error_condition from seqdict::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), seqdict_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Document parse error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Indexed access to a key that is not present.
class KeyNotFoundError : public std::system_error {
public:
    explicit KeyNotFoundError(const std::string& msg)
        : std::system_error(make_error_code(errc::key_not_found), msg) {}
};

/// @brief Strict insertion of a key that is already present.
class DuplicateKeyError : public std::system_error {
public:
    explicit DuplicateKeyError(const std::string& msg)
        : std::system_error(make_error_code(errc::duplicate_key), msg) {}
};

/// @brief Positional access past the end of a sequence.
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

/// @brief Type mismatch when reading a document node.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Persisted record that does not have the expected shape.
class FormatError : public std::system_error {
public:
    explicit FormatError(const std::string& msg)
        : std::system_error(make_error_code(errc::malformed_record), msg) {}
};

/// @brief No unused id could be drawn within the attempt limit.
class IdExhaustedError : public std::system_error {
public:
    explicit IdExhaustedError(const std::string& msg)
        : std::system_error(make_error_code(errc::id_space_exhausted), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [doc, ec] = seqdict::try_read(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace seqdict

// Register seqdict::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<seqdict::errc> : true_type {};
} // namespace std
