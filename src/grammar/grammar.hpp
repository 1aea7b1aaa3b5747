#pragma once

// Inline grammar trials and the dispatcher that sequences them.
//
// Every trial has the shape
//     auto try_x(Context& ctx, std::string_view input) -> std::optional<Match>
// and inspects a prefix of `input`. On failure it returns nullopt and has
// no effect on `ctx`; on success it reports the node and the number of
// bytes consumed. Trials never throw for any input.
//
// Internal header -- not installed.

#include <orginline-cpp/entity.hpp>
#include <orginline-cpp/node.hpp>
#include <orginline-cpp/options.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace orginline_cpp::detail {

// A successful trial: the node produced and the input bytes it covers.
struct Match {
    Node node;
    std::size_t consumed{0};
};

// Per-session state threaded through every trial.
struct Context {
    GrammarSet enabled;                    // grammars the caller allows anywhere
    const EntityTable* entities{nullptr};  // nullptr resolves nothing
    std::string_view anonymous_prefix;
    std::uint64_t* footnote_counter{nullptr};

    // Draw the next anonymous footnote name. Only called once a footnote
    // trial is certain to succeed, so a counter value is never wasted.
    auto next_anonymous_name() -> std::string {
        return std::string{anonymous_prefix} + std::to_string(++*footnote_counter);
    }
};

// Grammar subsets used for recursively parsed content.
inline constexpr auto emphasis_interior_grammars = GrammarSet{Grammar::emphasis};

inline constexpr auto script_body_grammars = GrammarSet{Grammar::emphasis, Grammar::entity};

inline constexpr auto link_label_grammars = GrammarSet{
    Grammar::emphasis, Grammar::latex_fragment, Grammar::entity,
    Grammar::code, Grammar::subscript, Grammar::superscript,
};

inline constexpr auto footnote_body_grammars = GrammarSet{
    Grammar::link, Grammar::bare_link, Grammar::target, Grammar::emphasis,
    Grammar::latex_fragment, Grammar::entity, Grammar::code,
    Grammar::subscript, Grammar::superscript,
};

// -- Dispatcher ---------------------------------------------------------------

// Parse `input` completely with the grammars in `grammars` that the
// context also enables, then normalize. Always succeeds.
auto parse_sequence(Context& ctx, std::string_view input, GrammarSet grammars) -> Nodes;

// The literal fallback. Always consumes at least one character of a
// non-empty input.
auto scan_plain(std::string_view input) -> Match;

// -- Trials -------------------------------------------------------------------

auto try_latex_fragment(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_timestamp(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_entity(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_macro(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_cookie(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_footnote(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_link(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_bare_link(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_radio_target(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_target(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_export_snippet(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_verbatim(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_code(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_break_line(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_emphasis(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_subscript(Context& ctx, std::string_view input) -> std::optional<Match>;
auto try_superscript(Context& ctx, std::string_view input) -> std::optional<Match>;

// -- Shared scanners ----------------------------------------------------------

// Result of scanning a span enclosed by one delimiter character.
// `previous` is the last interior character, threaded out of the scan
// instead of being kept in shared state.
struct DelimitedSpan {
    std::string_view text;
    std::size_t consumed{0};
    char previous{'\0'};
};

// Scan `<d>text<d>` at the start of `input` under the emphasis boundary
// rules: no whitespace right inside either delimiter, no line break in
// the span, and the closer followed by end of input, whitespace or one
// of `.,!?"')-:;[}`.
auto scan_delimited(std::string_view input, char delimiter) -> std::optional<DelimitedSpan>;

// True if `input` starts with `letters://`.
auto starts_bare_link(std::string_view input) -> bool;

// True if `input` starts with one of the timestamp keywords.
auto starts_timestamp_keyword(std::string_view input) -> bool;

// Classify a bracketed link target.
auto classify_url(std::string_view url) -> Url;

}  // namespace orginline_cpp::detail
