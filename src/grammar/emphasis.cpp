#include "grammar.hpp"
#include "scan.hpp"

#include <orginline-cpp/error.hpp>

#include <plog/Log.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orginline_cpp::detail {

namespace {

auto is_closing_boundary(char c) -> bool {
    switch (c) {
        case '.': case ',': case '!': case '?':
        case '"': case '\'': case ')': case '-':
        case ':': case ';': case '[': case '}':
            return true;
        default:
            return is_space(c);
    }
}

auto emphasis_kind(char delimiter) -> std::optional<EmphasisKind> {
    switch (delimiter) {
        case '*': return EmphasisKind::bold;
        case '/': return EmphasisKind::italic;
        case '_': return EmphasisKind::underline;
        case '+': return EmphasisKind::strike_through;
        default:  return std::nullopt;
    }
}

// Re-parse the interior of a flat emphasis with {emphasis, literal}.
// Emphasis trials below this level already resolved their own interiors,
// so a single pass yields the fully nested tree.
auto resolve_nested(Context& ctx, Emphasis flat, std::string_view interior) -> Emphasis {
    auto children = parse_sequence(ctx, interior, emphasis_interior_grammars);

    if (children.size() == 1) {
        if (const auto* p = children.front().get_if<Plain>(); p && p->text == interior) {
            return flat;
        }
    }

    for (const auto& child : children) {
        if (!child.is<Plain>() && !child.is<Emphasis>()) {
            PLOGE << "inline: nested emphasis produced a '" << child.type_name()
                  << "' node for interior '" << interior << "'";
            throw InvariantViolation{
                "nested emphasis resolution produced a " +
                std::string{child.type_name()} + " node"};
        }
    }

    flat.children = std::move(children);
    return flat;
}

}  // anonymous namespace

auto scan_delimited(std::string_view input, char delimiter) -> std::optional<DelimitedSpan> {
    if (input.size() < 3 || input[0] != delimiter) return std::nullopt;
    if (is_space(input[1])) return std::nullopt;

    auto previous = char{'\0'};
    for (std::size_t i = 1; i < input.size(); ++i) {
        const auto c = input[i];
        if (c == delimiter) {
            if (i == 1) return std::nullopt;  // empty span
            if (is_space(previous)) return std::nullopt;
            const auto after = i + 1;
            if (after < input.size() && !is_closing_boundary(input[after])) {
                return std::nullopt;
            }
            return DelimitedSpan{input.substr(1, i - 1), after, previous};
        }
        if (is_eol(c)) return std::nullopt;
        previous = c;
    }
    return std::nullopt;
}

auto try_emphasis(Context& ctx, std::string_view input) -> std::optional<Match> {
    if (input.empty()) return std::nullopt;
    const auto kind = emphasis_kind(input.front());
    if (!kind) return std::nullopt;

    const auto span = scan_delimited(input, input.front());
    if (!span) return std::nullopt;

    auto flat = Emphasis{*kind, {Node{Plain{std::string{span->text}}}}};
    return Match{resolve_nested(ctx, std::move(flat), span->text), span->consumed};
}

auto try_verbatim(Context&, std::string_view input) -> std::optional<Match> {
    const auto span = scan_delimited(input, '=');
    if (!span) return std::nullopt;
    return Match{Verbatim{std::string{span->text}}, span->consumed};
}

auto try_code(Context&, std::string_view input) -> std::optional<Match> {
    const auto span = scan_delimited(input, '~');
    if (!span) return std::nullopt;
    return Match{Code{std::string{span->text}}, span->consumed};
}

}  // namespace orginline_cpp::detail
