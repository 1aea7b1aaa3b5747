#pragma once

// Character classes and small scanning helpers shared by the grammars.
// All scanning is over std::string_view; nothing here allocates.
// Internal header -- not installed.

#include <cstddef>
#include <string_view>

namespace orginline_cpp::detail {

inline constexpr auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline constexpr auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t';
}

inline constexpr auto is_eol(char c) -> bool {
    return c == '\n' || c == '\r';
}

inline constexpr auto is_letter(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline constexpr auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

inline constexpr auto is_alnum(char c) -> bool {
    return is_letter(c) || is_digit(c);
}

// Length of the longest prefix of `input`, starting at `from`, whose
// characters all satisfy `pred`.
template <typename Pred>
inline auto span_while(std::string_view input, std::size_t from, Pred pred) -> std::size_t {
    auto i = from;
    while (i < input.size() && pred(input[i])) ++i;
    return i - from;
}

// Number of leading blanks (spaces and tabs) starting at `from`.
inline auto skip_blanks(std::string_view input, std::size_t from) -> std::size_t {
    return span_while(input, from, is_blank);
}

// Byte length of the UTF-8 sequence introduced by `lead`. Invalid lead
// bytes count as a single byte.
inline constexpr auto utf8_length(char lead) -> std::size_t {
    const auto b = static_cast<unsigned char>(lead);
    if (b < 0x80) return 1;
    if ((b & 0xE0) == 0xC0) return 2;
    if ((b & 0xF0) == 0xE0) return 3;
    if ((b & 0xF8) == 0xF0) return 4;
    return 1;
}

// Strip leading and trailing whitespace.
inline auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

}  // namespace orginline_cpp::detail
