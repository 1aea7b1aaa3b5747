#include "grammar.hpp"
#include "scan.hpp"

#include <plog/Log.h>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace orginline_cpp::detail {

namespace {

// Leading run of digits parsed as an int, with the bytes it spans.
struct Number {
    int value{0};
    std::size_t length{0};
};

auto leading_number(std::string_view s) -> std::optional<Number> {
    const auto len = span_while(s, 0, is_digit);
    if (len == 0) return std::nullopt;
    auto value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + len, value);
    if (ec != std::errc{}) return std::nullopt;  // out of range
    return Number{value, len};
}

// `current/max` as a prefix of the cookie body.
auto absolute_cookie(std::string_view body) -> std::optional<Cookie> {
    const auto current = leading_number(body);
    if (!current) return std::nullopt;
    body.remove_prefix(current->length);
    if (!body.starts_with('/')) return std::nullopt;
    body.remove_prefix(1);
    const auto max = leading_number(body);
    if (!max) return std::nullopt;
    return Cookie{Absolute{current->value, max->value}};
}

// `percent%` as a prefix of the cookie body.
auto percent_cookie(std::string_view body) -> std::optional<Cookie> {
    const auto value = leading_number(body);
    if (!value) return std::nullopt;
    body.remove_prefix(value->length);
    if (!body.starts_with('%')) return std::nullopt;
    return Cookie{Percent{value->value}};
}

auto split_arguments(std::string_view args) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    if (trim(args).empty()) return result;
    while (true) {
        const auto comma = args.find(',');
        result.emplace_back(trim(args.substr(0, comma)));
        if (comma == std::string_view::npos) break;
        args.remove_prefix(comma + 1);
    }
    return result;
}

// `<open>name<close>` with a non-empty name free of `>` and line breaks.
auto anchor(std::string_view input, std::string_view open, std::string_view close)
    -> std::optional<std::pair<std::string, std::size_t>> {
    if (!input.starts_with(open)) return std::nullopt;
    const auto len = span_while(input, open.size(), [](char c) {
        return c != '>' && !is_eol(c);
    });
    if (len == 0) return std::nullopt;
    const auto end = open.size() + len;
    if (!input.substr(end).starts_with(close)) return std::nullopt;
    return std::pair{std::string{input.substr(open.size(), len)}, end + close.size()};
}

// `<prefix>body}` for subscripts and superscripts.
auto script_body(std::string_view input, std::string_view prefix)
    -> std::optional<std::pair<std::string_view, std::size_t>> {
    if (!input.starts_with(prefix)) return std::nullopt;
    const auto len = span_while(input, prefix.size(), [](char c) {
        return !is_space(c) && c != '}';
    });
    if (len == 0) return std::nullopt;
    const auto end = prefix.size() + len;
    if (end >= input.size() || input[end] != '}') return std::nullopt;
    return std::pair{input.substr(prefix.size(), len), end + 1};
}

}  // anonymous namespace

// $inline$, $$displayed$$, \(inline\), \[displayed\]
auto try_latex_fragment(Context&, std::string_view input) -> std::optional<Match> {
    if (input.starts_with("$$")) {
        const auto len = span_while(input, 2, [](char c) { return c != '$'; });
        if (len == 0 || !input.substr(2 + len).starts_with("$$")) return std::nullopt;
        return Match{LatexFragment{LatexMode::displayed, std::string{input.substr(2, len)}},
                     2 + len + 2};
    }
    if (input.starts_with('$')) {
        const auto len = span_while(input, 1, [](char c) { return c != '$'; });
        if (len == 0 || 1 + len >= input.size()) return std::nullopt;
        return Match{LatexFragment{LatexMode::inline_math, std::string{input.substr(1, len)}},
                     1 + len + 1};
    }
    if (input.starts_with("\\[") || input.starts_with("\\(")) {
        const auto displayed = input[1] == '[';
        const auto close = displayed ? std::string_view{"\\]"} : std::string_view{"\\)"};
        const auto end = input.find(close, 2);
        if (end == std::string_view::npos || end == 2) return std::nullopt;
        return Match{LatexFragment{displayed ? LatexMode::displayed : LatexMode::inline_math,
                                   std::string{input.substr(2, end - 2)}},
                     end + close.size()};
    }
    return std::nullopt;
}

// \name
auto try_entity(Context& ctx, std::string_view input) -> std::optional<Match> {
    if (!input.starts_with('\\')) return std::nullopt;
    const auto len = span_while(input, 1, is_letter);
    if (len == 0) return std::nullopt;
    const auto name = input.substr(1, len);

    if (ctx.entities) {
        if (auto entity = ctx.entities->lookup(name)) {
            return Match{std::move(*entity), 1 + len};
        }
    }
    PLOGD << "inline: unknown entity '" << name << "'";
    return Match{Plain{std::string{name}}, 1 + len};
}

// {{{name(arg1, arg2)}}} or {{{name}}}
auto try_macro(Context&, std::string_view input) -> std::optional<Match> {
    if (!input.starts_with("{{{")) return std::nullopt;
    const auto name_len = span_while(input, 3, [](char c) {
        return c != '(' && c != '}' && !is_eol(c);
    });
    if (name_len == 0) return std::nullopt;
    auto macro = Macro{};
    macro.name = std::string{input.substr(3, name_len)};
    const auto pos = 3 + name_len;

    if (input.substr(pos).starts_with("}}}")) {
        return Match{std::move(macro), pos + 3};
    }
    if (pos >= input.size() || input[pos] != '(') return std::nullopt;
    // Arguments end at the first `)`; a `}}}` or line break before it
    // closes nothing.
    auto end = pos + 1;
    while (end < input.size() && input[end] != ')' && !is_eol(input[end]) &&
           !input.substr(end).starts_with("}}}")) {
        ++end;
    }
    if (!input.substr(end).starts_with(")}}}")) return std::nullopt;

    macro.arguments = split_arguments(input.substr(pos + 1, end - pos - 1));
    return Match{std::move(macro), end + 4};
}

// [50%] or [3/10]
auto try_cookie(Context&, std::string_view input) -> std::optional<Match> {
    if (!input.starts_with('[')) return std::nullopt;
    const auto len = span_while(input, 1, [](char c) {
        return is_digit(c) || c == '/' || c == '%';
    });
    if (len == 0 || 1 + len >= input.size() || input[1 + len] != ']') return std::nullopt;
    const auto body = input.substr(1, len);

    auto cookie = absolute_cookie(body);
    if (!cookie) cookie = percent_cookie(body);
    if (!cookie) return std::nullopt;
    return Match{std::move(*cookie), 1 + len + 1};
}

// <<<name>>>
auto try_radio_target(Context&, std::string_view input) -> std::optional<Match> {
    auto a = anchor(input, "<<<", ">>>");
    if (!a) return std::nullopt;
    return Match{RadioTarget{std::move(a->first)}, a->second};
}

// <<name>>
auto try_target(Context&, std::string_view input) -> std::optional<Match> {
    auto a = anchor(input, "<<", ">>");
    if (!a) return std::nullopt;
    return Match{Target{std::move(a->first)}, a->second};
}

// @@backend:content@@
auto try_export_snippet(Context&, std::string_view input) -> std::optional<Match> {
    if (!input.starts_with("@@")) return std::nullopt;
    const auto backend_len = span_while(input, 2, [](char c) {
        return is_alnum(c) || c == '-' || c == '_';
    });
    const auto colon = 2 + backend_len;
    if (backend_len == 0 || colon >= input.size() || input[colon] != ':') return std::nullopt;
    const auto line_len = span_while(input, colon + 1, [](char c) { return !is_eol(c); });
    const auto end = input.substr(0, colon + 1 + line_len).find("@@", colon + 1);
    if (end == std::string_view::npos) return std::nullopt;
    return Match{ExportSnippet{std::string{input.substr(2, backend_len)},
                               std::string{input.substr(colon + 1, end - colon - 1)}},
                 end + 2};
}

auto try_break_line(Context&, std::string_view input) -> std::optional<Match> {
    if (input.starts_with("\r\n")) return Match{BreakLine{}, 2};
    if (input.starts_with('\n') || input.starts_with('\r')) return Match{BreakLine{}, 1};
    return std::nullopt;
}

// _{body}
auto try_subscript(Context& ctx, std::string_view input) -> std::optional<Match> {
    const auto body = script_body(input, "_{");
    if (!body) return std::nullopt;
    return Match{Subscript{parse_sequence(ctx, body->first, script_body_grammars)}, body->second};
}

// ^{body}
auto try_superscript(Context& ctx, std::string_view input) -> std::optional<Match> {
    const auto body = script_body(input, "^{");
    if (!body) return std::nullopt;
    return Match{Superscript{parse_sequence(ctx, body->first, script_body_grammars)}, body->second};
}

}  // namespace orginline_cpp::detail
