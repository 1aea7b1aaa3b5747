#include "grammar.hpp"
#include "scan.hpp"

#include <orginline-cpp/session.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace orginline_cpp::detail {

namespace {

using TrialFn = auto (*)(Context&, std::string_view) -> std::optional<Match>;

struct DispatchEntry {
    Grammar grammar;
    TrialFn trial;
};

// Precedence order. Timestamps and LaTeX fragments lead because they
// claim `<`, `[`, `$` and `\`, which later grammars also start with.
// Cookies come before footnotes and links on `[`. Line breaks come before
// emphasis so a newline never ends up inside a span. Literal text is the
// fallback and is not in the table.
constexpr auto dispatch_table = std::array<DispatchEntry, grammar_count - 1>{{
    {Grammar::latex_fragment, &try_latex_fragment},
    {Grammar::timestamp,      &try_timestamp},
    {Grammar::entity,         &try_entity},
    {Grammar::macro,          &try_macro},
    {Grammar::cookie,         &try_cookie},
    {Grammar::footnote,       &try_footnote},
    {Grammar::link,           &try_link},
    {Grammar::bare_link,      &try_bare_link},
    {Grammar::radio_target,   &try_radio_target},
    {Grammar::target,         &try_target},
    {Grammar::export_snippet, &try_export_snippet},
    {Grammar::verbatim,       &try_verbatim},
    {Grammar::code,           &try_code},
    {Grammar::break_line,     &try_break_line},
    {Grammar::emphasis,       &try_emphasis},
    {Grammar::subscript,      &try_subscript},
    {Grammar::superscript,    &try_superscript},
}};

constexpr auto table_follows_enum_order() -> bool {
    for (std::size_t i = 0; i < dispatch_table.size(); ++i) {
        if (static_cast<std::size_t>(dispatch_table[i].grammar) != i) return false;
    }
    return true;
}

static_assert(table_follows_enum_order(),
              "dispatch table must list grammars in Grammar enum order");

// Characters that may open a construct. The literal scan stops in front
// of them so the dispatcher gets a chance at that position.
auto is_delimiter(std::string_view input, std::size_t i) -> bool {
    switch (input[i]) {
        case '*': case '/': case '_': case '+':
        case '~': case '=':
        case '[': case '<': case '{':
        case '$': case '\\': case '^':
        case '\n': case '\r':
            return true;
        case '@':
            return i + 1 < input.size() && input[i + 1] == '@';
        default:
            break;
    }
    // Word-initial constructs: bare links and timestamp keywords.
    if (is_letter(input[i]) && (i == 0 || !is_alnum(input[i - 1]))) {
        const auto rest = input.substr(i);
        return starts_bare_link(rest) || starts_timestamp_keyword(rest);
    }
    return false;
}

}  // anonymous namespace

auto scan_plain(std::string_view input) -> Match {
    // Fast scan up to the next delimiter.
    auto i = std::size_t{0};
    while (i < input.size() && !is_delimiter(input, i)) ++i;
    if (i > 0) {
        return Match{Plain{std::string{input.substr(0, i)}}, i};
    }
    // Every grammar failed on a delimiter: take it as one literal
    // character so the dispatcher always advances.
    const auto len = std::min(utf8_length(input.front()), input.size());
    return Match{Plain{std::string{input.substr(0, len)}}, len};
}

auto parse_sequence(Context& ctx, std::string_view input, GrammarSet grammars) -> Nodes {
    const auto allowed = grammars & ctx.enabled;
    auto nodes = Nodes{};
    auto pos = std::size_t{0};

    while (pos < input.size()) {
        const auto rest = input.substr(pos);
        auto match = std::optional<Match>{};
        for (const auto& entry : dispatch_table) {
            if (!allowed.contains(entry.grammar)) continue;
            match = entry.trial(ctx, rest);
            if (match) {
                PLOGV << "inline: " << to_string_view(entry.grammar)
                      << " matched " << match->consumed << " bytes at " << pos;
                break;
            }
        }
        if (!match) match = scan_plain(rest);
        pos += match->consumed;
        nodes.push_back(std::move(match->node));
    }

    return normalize(std::move(nodes));
}

}  // namespace orginline_cpp::detail

namespace orginline_cpp {

auto normalize(Nodes nodes) -> Nodes {
    auto result = Nodes{};
    result.reserve(nodes.size());
    for (auto& node : nodes) {
        if (const auto* plain = node.get_if<Plain>(); plain && !result.empty()) {
            if (auto* last = std::get_if<Plain>(&result.back().value)) {
                last->text += plain->text;
                continue;
            }
        }
        result.push_back(std::move(node));
    }
    return result;
}

}  // namespace orginline_cpp
