/// @file options.hpp
/// @brief Parse configuration: enabled grammars, entity table, naming.

#pragma once

#include <orginline-cpp/entity.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace orginline_cpp {

/// The inline grammars, in dispatch precedence order.
///
/// On any input position the dispatcher tries the enabled grammars in
/// exactly this order and keeps the first that matches. Reordering this
/// enum changes which construct wins on ambiguous prefixes such as `[`
/// (timestamp, cookie, footnote, link) or `\` (LaTeX, entity).
enum class Grammar : std::uint8_t {
    latex_fragment,   ///< `$`, `$$`, `\(`, `\[`
    timestamp,        ///< `<`, `[`, `SCHEDULED:`, `DEADLINE:`, `CLOSED:`, `CLOCK:`
    entity,           ///< `\name`
    macro,            ///< `{{{`
    cookie,           ///< `[50%]`, `[3/10]`
    footnote,         ///< `[fn:`
    link,             ///< `[[`
    bare_link,        ///< `protocol://`
    radio_target,     ///< `<<<`
    target,           ///< `<<`
    export_snippet,   ///< `@@`
    verbatim,         ///< `=`
    code,             ///< `~`
    break_line,       ///< `\n`, `\r\n`
    emphasis,         ///< `*`, `/`, `_`, `+`
    subscript,        ///< `_{`
    superscript,      ///< `^{`
    plain,            ///< always succeeds; cannot be disabled
};

/// Number of Grammar enumerators.
inline constexpr std::size_t grammar_count = static_cast<std::size_t>(Grammar::plain) + 1;

/// Convert a Grammar to its string representation.
constexpr auto to_string_view(Grammar g) noexcept -> std::string_view {
    switch (g) {
        case Grammar::latex_fragment: return "latex_fragment";
        case Grammar::timestamp:      return "timestamp";
        case Grammar::entity:         return "entity";
        case Grammar::macro:          return "macro";
        case Grammar::cookie:         return "cookie";
        case Grammar::footnote:       return "footnote";
        case Grammar::link:           return "link";
        case Grammar::bare_link:      return "bare_link";
        case Grammar::radio_target:   return "radio_target";
        case Grammar::target:         return "target";
        case Grammar::export_snippet: return "export_snippet";
        case Grammar::verbatim:       return "verbatim";
        case Grammar::code:           return "code";
        case Grammar::break_line:     return "break_line";
        case Grammar::emphasis:       return "emphasis";
        case Grammar::subscript:      return "subscript";
        case Grammar::superscript:    return "superscript";
        case Grammar::plain:          return "plain";
    }
    return "unknown";
}

/// A set of grammars. Literal text is always a member.
class GrammarSet {
public:
    /// The empty set (literal text only).
    constexpr GrammarSet() = default;

    constexpr GrammarSet(std::initializer_list<Grammar> grammars) {
        for (auto g : grammars) bits_ |= bit(g);
    }

    /// Every grammar.
    static constexpr auto all() -> GrammarSet {
        auto s = GrammarSet{};
        s.bits_ = (std::uint32_t{1} << grammar_count) - 1;
        return s;
    }

    constexpr auto contains(Grammar g) const -> bool {
        return g == Grammar::plain || (bits_ & bit(g)) != 0;
    }

    constexpr auto with(Grammar g) const -> GrammarSet {
        auto s = *this;
        s.bits_ |= bit(g);
        return s;
    }

    constexpr auto without(Grammar g) const -> GrammarSet {
        auto s = *this;
        if (g != Grammar::plain) s.bits_ &= ~bit(g);
        return s;
    }

    /// Members of both sets.
    constexpr auto operator&(GrammarSet other) const -> GrammarSet {
        auto s = GrammarSet{};
        s.bits_ = bits_ & other.bits_;
        return s;
    }

    constexpr auto operator==(const GrammarSet&) const -> bool = default;

private:
    static constexpr auto bit(Grammar g) -> std::uint32_t {
        return std::uint32_t{1} << static_cast<unsigned>(g);
    }

    std::uint32_t bits_{0};
};

/// Options for a parsing Session.
///
/// @code
/// auto opts = ParseOptions{};
/// opts.grammars = GrammarSet::all().without(Grammar::timestamp);
/// auto session = Session{opts};
/// @endcode
struct ParseOptions {
    /// Grammars tried at top level. Nested contexts (emphasis interiors,
    /// link labels, footnote bodies, script bodies) use their own fixed
    /// subsets, further restricted to this set.
    GrammarSet grammars = GrammarSet::all();

    /// Entity names resolved by `\name`. nullptr resolves nothing.
    std::shared_ptr<const EntityTable> entities = EntityTable::defaults();

    /// Prefix of generated anonymous footnote names (`_anon_1`, ...).
    std::string anonymous_footnote_prefix = "_anon_";
};

}  // namespace orginline_cpp
