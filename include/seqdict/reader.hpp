#pragma once

/// @file reader.hpp
/// @brief Recursive-descent document reader: JSON text -> Node.
///
/// Features:
///   - Full escape handling including \uXXXX surrogate pairs
///   - Integers kept exact (int64 / uint64), floats via std::from_chars
///   - Optional comments and trailing commas (ReadOptions)
///   - Exception-free reading via try_read() with error_code
///   - Recursion depth limiting to protect against stack overflow

#include "config.hpp"
#include "error.hpp"
#include "node.hpp"
#include "options.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <system_error>

namespace seqdict {
namespace detail {

class Reader {
public:
    [[nodiscard]] static Node read(std::string_view input, const ReadOptions& opts = {}) {
        Reader r(input.data(), input.data() + input.size(), opts);
        Node result = r.read_value();
        r.skip_ws();
        if (SEQDICT_UNLIKELY(r.ptr_ < r.end_)) {
            r.error("unexpected trailing content", errc::trailing_content);
        }
        return result;
    }

    [[nodiscard]] static result<Node> try_read(std::string_view input,
                                               const ReadOptions& opts = {}) noexcept {
        try {
            return {read(input, opts), {}};
        } catch (const ParseError& e) {
            return {Node{}, e.code()};
        } catch (const std::bad_alloc&) {
            return {Node{}, std::make_error_code(std::errc::not_enough_memory)};
        }
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    ReadOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    Reader(const char* begin, const char* end, const ReadOptions& opts) noexcept
        : ptr_(begin), end_(end), begin_(begin), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : SEQDICT_MAX_DEPTH) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation current_location() const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] SEQDICT_NOINLINE void error(const std::string& msg,
                                             errc code = errc::unexpected_character) const {
        throw ParseError(msg, current_location(), code);
    }

    [[noreturn]] SEQDICT_NOINLINE void error_unexpected_char() const {
        if (ptr_ >= end_) error("unexpected end of input", errc::unexpected_end_of_input);
        error(std::string("unexpected character '") + *ptr_ + "'");
    }

    void push_depth() {
        if (SEQDICT_UNLIKELY(++depth_ > max_depth_)) {
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Whitespace and comments ───────────────────────────────────────

    void skip_ws() {
        for (;;) {
            while (ptr_ < end_ && (*ptr_ == ' ' || *ptr_ == '\n' || *ptr_ == '\r' || *ptr_ == '\t'))
                ++ptr_;
            if (!opts_.allow_comments || ptr_ + 1 >= end_ || *ptr_ != '/') return;
            if (ptr_[1] == '/') {
                ptr_ += 2;
                while (ptr_ < end_ && *ptr_ != '\n') ++ptr_;
            } else if (ptr_[1] == '*') {
                ptr_ += 2;
                for (;;) {
                    if (SEQDICT_UNLIKELY(ptr_ + 1 >= end_)) {
                        ptr_ = end_;
                        error("unterminated block comment", errc::unexpected_end_of_input);
                    }
                    if (ptr_[0] == '*' && ptr_[1] == '/') { ptr_ += 2; break; }
                    ++ptr_;
                }
            } else {
                return;
            }
        }
    }

    void expect(char c) {
        if (SEQDICT_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        if (ptr_ >= end_) error("unexpected end of input", errc::unexpected_end_of_input);
        error(std::string("expected '") + c + "', got '" + *ptr_ + "'");
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (SEQDICT_UNLIKELY(static_cast<size_t>(end_ - ptr_) < len ||
                             std::memcmp(ptr_, literal, len) != 0)) {
            error(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    // ─── Values ──────────────────────────────────────────────────────────

    Node read_value() {
        skip_ws();
        if (SEQDICT_UNLIKELY(ptr_ >= end_)) error_unexpected_char();

        switch (*ptr_) {
            case '"': return Node(read_string());
            case '{': return read_object();
            case '[': return read_array();
            case 't': expect_literal("true");  return Node(true);
            case 'f': expect_literal("false"); return Node(false);
            case 'n': expect_literal("null");  return Node(nullptr);
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return read_number();
            default:
                error_unexpected_char();
        }
    }

    // ─── Strings ─────────────────────────────────────────────────────────

    std::string read_string() {
        expect('"');
        std::string out;
        for (;;) {
            const char* run = ptr_;
            while (ptr_ < end_ && *ptr_ != '"' && *ptr_ != '\\' &&
                   static_cast<unsigned char>(*ptr_) >= 0x20)
                ++ptr_;
            out.append(run, static_cast<size_t>(ptr_ - run));

            if (SEQDICT_UNLIKELY(ptr_ >= end_))
                error("unterminated string", errc::unterminated_string);

            const char c = *ptr_++;
            if (SEQDICT_LIKELY(c == '"')) return out;
            if (c == '\\') {
                read_escape(out);
            } else {
                --ptr_;
                error("unescaped control character in string", errc::unterminated_string);
            }
        }
    }

    void read_escape(std::string& out) {
        if (SEQDICT_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        const char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  read_unicode_escape(out); return;
            default:
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    uint32_t read_hex4() {
        if (SEQDICT_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = ptr_[i];
            uint32_t nib;
            if (h >= '0' && h <= '9')      nib = static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') nib = static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') nib = static_cast<uint32_t>(h - 'A' + 10);
            else error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    void read_unicode_escape(std::string& out) {
        uint32_t cp = read_hex4();

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (SEQDICT_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u'))
                error("missing low surrogate", errc::invalid_unicode_escape);
            ptr_ += 2;
            const uint32_t low = read_hex4();
            if (SEQDICT_UNLIKELY(low < 0xDC00 || low > 0xDFFF))
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (SEQDICT_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }

        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // ─── Numbers ─────────────────────────────────────────────────────────

    static bool is_digit(char c) noexcept { return static_cast<unsigned>(c - '0') <= 9u; }

    Node read_number() {
        const char* start = ptr_;
        const bool negative = (*ptr_ == '-');
        if (negative) ++ptr_;

        if (SEQDICT_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
            error("invalid number", errc::invalid_number);
        if (*ptr_ == '0') {
            ++ptr_;
            if (SEQDICT_UNLIKELY(ptr_ < end_ && is_digit(*ptr_)))
                error("leading zeros are not allowed", errc::invalid_number);
        } else {
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        bool is_float = false;
        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (SEQDICT_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit after decimal point", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }
        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            is_float = true;
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (SEQDICT_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit in exponent", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (!is_float) {
            if (negative) {
                int64_t v = 0;
                auto [p, ec] = std::from_chars(start, ptr_, v);
                if (ec == std::errc{} && p == ptr_) return Node(v);
            } else {
                uint64_t v = 0;
                auto [p, ec] = std::from_chars(start, ptr_, v);
                if (ec == std::errc{} && p == ptr_) {
                    if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                        return Node(static_cast<int64_t>(v));
                    return Node(v);
                }
            }
            // Integer overflow: fall through to double.
        }

        double d = 0.0;
        auto [p, ec] = std::from_chars(start, ptr_, d);
        if (SEQDICT_UNLIKELY(ec != std::errc{} || p != ptr_))
            error("invalid number", errc::invalid_number);
        return Node(d);
    }

    // ─── Containers ──────────────────────────────────────────────────────

    Node read_array() {
        ++ptr_;
        push_depth();
        Array arr;
        skip_ws();
        if (ptr_ < end_ && *ptr_ == ']') {
            ++ptr_;
            pop_depth();
            return Node(std::move(arr));
        }
        for (;;) {
            arr.push_back(read_value());
            skip_ws();
            if (SEQDICT_UNLIKELY(ptr_ >= end_))
                error("unterminated array", errc::unterminated_array);
            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == ']') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (SEQDICT_LIKELY(*ptr_ == ']')) {
                ++ptr_;
                break;
            }
            error("expected ',' or ']' in array");
        }
        pop_depth();
        return Node(std::move(arr));
    }

    Node read_object() {
        ++ptr_;
        push_depth();
        Object obj;
        skip_ws();
        if (ptr_ < end_ && *ptr_ == '}') {
            ++ptr_;
            pop_depth();
            return Node(std::move(obj));
        }
        for (;;) {
            skip_ws();
            if (SEQDICT_UNLIKELY(ptr_ >= end_))
                error("unterminated object", errc::unterminated_object);
            std::string key = read_string();
            skip_ws();
            expect(':');
            Node value = read_value();
            obj.entries.emplace_back(std::move(key), std::move(value));
            skip_ws();
            if (SEQDICT_UNLIKELY(ptr_ >= end_))
                error("unterminated object", errc::unterminated_object);
            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == '}') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (SEQDICT_LIKELY(*ptr_ == '}')) {
                ++ptr_;
                break;
            }
            error("expected ',' or '}' in object");
        }
        pop_depth();
        // Repeated member names: the last one wins.
        obj.merge_repeated_keys();
        return Node(std::move(obj));
    }
};

} // namespace detail

/// @brief Read a JSON document (throws ParseError).
[[nodiscard]] inline Node read(std::string_view input, const ReadOptions& opts = {}) {
    return detail::Reader::read(input, opts);
}

/// @brief Read a JSON document (no exceptions, error_code).
[[nodiscard]] inline result<Node> try_read(std::string_view input,
                                           const ReadOptions& opts = {}) noexcept {
    return detail::Reader::try_read(input, opts);
}

} // namespace seqdict
