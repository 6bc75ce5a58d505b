#pragma once

/// @file seqdict.hpp
/// @brief Main header file for the seqdict library.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "node.hpp"
#include "writer.hpp"
#include "reader.hpp"
#include "conversion.hpp"
#include "pair.hpp"
#include "pair_list.hpp"
#include "dictionary.hpp"
#include "multi_dictionary.hpp"
#include "guid.hpp"
#include "bitmask.hpp"

// Text round trip (after every to_node/from_node overload is visible)
namespace seqdict {

/// Serialize any convertible value to JSON text.
template <typename T>
[[nodiscard]] std::string save_string(const T& value, const WriteOptions& opts = {}) {
    return write(to_document(value), opts);
}

/// Read JSON text and convert it to T under @p load_opts.
/// @throws ParseError on invalid text, plus whatever from_node() raises.
template <typename T>
[[nodiscard]] T load_string(std::string_view text,
                            const ReadOptions& read_opts = {},
                            const LoadOptions& load_opts = {}) {
    const Node doc = read(text, read_opts);
    LoadScope scope(load_opts);
    return from_document<T>(doc);
}

/// Exception-free form of load_string(): any seqdict error is returned as
/// an error_code and the value is default-constructed.
template <typename T>
[[nodiscard]] result<T> try_load_string(std::string_view text,
                                        const ReadOptions& read_opts = {},
                                        const LoadOptions& load_opts = {}) {
    auto doc = try_read(text, read_opts);
    if (!doc) return {T{}, doc.ec};
    try {
        LoadScope scope(load_opts);
        return {from_document<T>(doc.value), {}};
    } catch (const std::system_error& e) {
        if (e.code().category() != seqdict_category()) throw;
        return {T{}, e.code()};
    }
}

} // namespace seqdict
