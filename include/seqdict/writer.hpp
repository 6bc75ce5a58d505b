#pragma once

/// @file writer.hpp
/// @brief Document writer: Node -> JSON text, to a string or an ostream.
///
/// Features:
///   - Compact or indented output (WriteOptions::indent)
///   - Control characters escaped as \uXXXX (short forms where JSON has them)
///   - Shortest round-trip formatting for floats (std::to_chars)
///   - NaN/Infinity written as null

#include "config.hpp"
#include "node.hpp"
#include "options.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace seqdict {

namespace detail {

inline constexpr char kHexDigits[] = "0123456789abcdef";

/// @brief Appends the text of a Node to a string; Pretty selects the
///        indented layout at compile time.
template <bool Pretty>
class Writer {
public:
    Writer(std::string& out, const WriteOptions& opts) noexcept
        : out_(out), indent_step_(opts.indent) {}

    void write(const Node& value) { write_value(value); }

private:
    std::string& out_;
    int indent_step_;
    int depth_ = 0;

    void put(char c) { out_.push_back(c); }
    void put(const char* s, size_t n) { out_.append(s, n); }

    void open(char bracket) {
        put(bracket);
        if constexpr (Pretty) ++depth_;
        line_break();
    }

    void close(char bracket) {
        if constexpr (Pretty) --depth_;
        line_break();
        put(bracket);
    }

    void separator() {
        put(',');
        line_break();
    }

    void line_break() {
        if constexpr (Pretty) {
            put('\n');
            out_.append(static_cast<size_t>(depth_ * indent_step_), ' ');
        }
    }

    void write_value(const Node& v) {
        switch (v.type()) {
            case Type::Null:
                put("null", 4);
                break;
            case Type::Bool:
                if (v.as_bool()) put("true", 4);
                else put("false", 5);
                break;
            case Type::Integer:
                write_number(v.as_integer());
                break;
            case Type::UInteger:
                write_number(v.as_uinteger());
                break;
            case Type::Float:
                write_float(v.as_float());
                break;
            case Type::String:
                write_string(v.as_string());
                break;
            case Type::Array:
                write_array(v.as_array());
                break;
            case Type::Object:
                write_object(v.as_object());
                break;
        }
    }

    template <typename Int>
    void write_number(Int val) {
        char buf[24];
        auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), val);
        (void)ec;  // 24 bytes always hold a 64-bit integer
        put(buf, static_cast<size_t>(p - buf));
    }

    void write_float(double val) {
        if (SEQDICT_UNLIKELY(std::isnan(val) || std::isinf(val))) {
            put("null", 4);
            return;
        }
        char buf[40];
        auto [p, ec] = std::to_chars(buf, buf + sizeof(buf) - 2, val);
        if (SEQDICT_UNLIKELY(ec != std::errc{})) {
            put("null", 4);
            return;
        }
        // Keep floats distinguishable from integers on read-back.
        if (std::memchr(buf, '.', static_cast<size_t>(p - buf)) == nullptr &&
            std::memchr(buf, 'e', static_cast<size_t>(p - buf)) == nullptr) {
            *p++ = '.';
            *p++ = '0';
        }
        put(buf, static_cast<size_t>(p - buf));
    }

    void write_string(std::string_view s) {
        put('"');
        const char* run = s.data();
        const char* const end = s.data() + s.size();
        for (const char* ptr = run; ptr < end; ++ptr) {
            auto c = static_cast<unsigned char>(*ptr);
            if (SEQDICT_LIKELY(c >= 0x20 && c != '"' && c != '\\')) continue;
            if (ptr > run) put(run, static_cast<size_t>(ptr - run));
            write_escape(c);
            run = ptr + 1;
        }
        if (end > run) put(run, static_cast<size_t>(end - run));
        put('"');
    }

    void write_escape(unsigned char c) {
        switch (c) {
            case '"':  put("\\\"", 2); return;
            case '\\': put("\\\\", 2); return;
            case '\b': put("\\b", 2); return;
            case '\t': put("\\t", 2); return;
            case '\n': put("\\n", 2); return;
            case '\f': put("\\f", 2); return;
            case '\r': put("\\r", 2); return;
            default: {
                const char esc[6] = {'\\', 'u', '0', '0', kHexDigits[c >> 4], kHexDigits[c & 0xF]};
                put(esc, sizeof(esc));
            }
        }
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { put("[]", 2); return; }
        open('[');
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) separator();
            write_value(arr[i]);
        }
        close(']');
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { put("{}", 2); return; }
        open('{');
        bool first = true;
        for (const auto& [key, val] : obj) {
            if (!first) separator();
            first = false;
            write_string(key);
            put(':');
            if constexpr (Pretty) put(' ');
            write_value(val);
        }
        close('}');
    }
};

} // namespace detail

/// @brief Serialize a document to JSON text.
[[nodiscard]] inline std::string write(const Node& value, const WriteOptions& opts = {}) {
    std::string result;
    if (opts.indent >= 0) detail::Writer<true>(result, opts).write(value);
    else                  detail::Writer<false>(result, opts).write(value);
    return result;
}

/// @brief Serialize a document to an ostream.
inline void write(std::ostream& os, const Node& value, const WriteOptions& opts = {}) {
    const std::string text = write(value, opts);
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
}

/// @brief Stream a document in compact form.
inline std::ostream& operator<<(std::ostream& os, const Node& value) {
    write(os, value);
    return os;
}

} // namespace seqdict
