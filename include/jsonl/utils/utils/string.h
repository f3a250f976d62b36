#ifndef JSONL_UTILS_UTILS_STRING_H
#define JSONL_UTILS_UTILS_STRING_H

#include <cstddef>
#include <string>
#include <string_view>

namespace jsonl::utils::string {

inline bool is_line_terminator(char c) { return c == '\n' || c == '\r'; }

/**
 * Byte length of the UTF-8 encoded Unicode White_Space code point starting
 * at data[pos], or 0 if there is none
 */
std::size_t whitespace_length(std::string_view data, std::size_t pos);

/**
 * Strip leading and trailing Unicode White_Space (ASCII whitespace plus
 * U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F
 * and U+3000). Invalid UTF-8 is never stripped.
 */
std::string_view trim(std::string_view data);

inline bool is_blank(std::string_view data) { return trim(data).empty(); }

/**
 * Decode bytes as UTF-8, replacing each maximal invalid subsequence with
 * U+FFFD. Valid input is copied unchanged.
 */
std::string to_utf8_lossy(std::string_view data);

/**
 * trim() followed by to_utf8_lossy(); the form in which readers hand
 * lines to callers
 */
inline std::string to_logical_line(std::string_view data) {
    return to_utf8_lossy(trim(data));
}

}  // namespace jsonl::utils::string

#endif  // JSONL_UTILS_UTILS_STRING_H
