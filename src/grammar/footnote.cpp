#include "grammar.hpp"
#include "scan.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orginline_cpp::detail {

// [fn::text], [fn:name], [fn:name:text]
auto try_footnote(Context& ctx, std::string_view input) -> std::optional<Match> {
    const auto body_char = [](char c) { return c != ']' && !is_eol(c); };

    if (input.starts_with("[fn::")) {
        const auto len = span_while(input, 5, body_char);
        if (len == 0 || 5 + len >= input.size() || input[5 + len] != ']') {
            return std::nullopt;
        }
        auto ref = FootnoteReference{};
        ref.definition = parse_sequence(ctx, input.substr(5, len), footnote_body_grammars);
        ref.name = ctx.next_anonymous_name();
        return Match{std::move(ref), 5 + len + 1};
    }

    if (!input.starts_with("[fn:")) return std::nullopt;

    auto pos = std::size_t{4};
    const auto name_len = span_while(input, pos, [](char c) {
        return c != ':' && c != ']' && !is_eol(c);
    });
    if (name_len == 0) return std::nullopt;
    const auto name = input.substr(pos, name_len);
    pos += name_len;
    if (pos < input.size() && input[pos] == ':') ++pos;

    const auto body_len = span_while(input, pos, body_char);
    const auto body = input.substr(pos, body_len);
    pos += body_len;
    if (pos >= input.size() || input[pos] != ']') return std::nullopt;
    ++pos;

    auto ref = FootnoteReference{};
    ref.name = std::string{name};
    if (!body.empty()) {
        ref.definition = parse_sequence(ctx, body, footnote_body_grammars);
    }
    return Match{std::move(ref), pos};
}

}  // namespace orginline_cpp::detail
