/// @file node.hpp
/// @brief The inline Node tree: a closed set of variants, one per construct.

#pragma once

#include <orginline-cpp/datetime.hpp>
#include <orginline-cpp/entity.hpp>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace orginline_cpp {

struct Node;

/// An ordered sequence of inline nodes.
using Nodes = std::vector<Node>;

// -- Emphasis -----------------------------------------------------------------

/// The four styled span kinds.
enum class EmphasisKind : std::uint8_t {
    bold,            ///< `*text*`
    italic,          ///< `/text/`
    underline,       ///< `_text_`
    strike_through,  ///< `+text+`
};

/// Convert an EmphasisKind to its string representation.
constexpr auto to_string_view(EmphasisKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EmphasisKind::bold:           return "bold";
        case EmphasisKind::italic:         return "italic";
        case EmphasisKind::underline:      return "underline";
        case EmphasisKind::strike_through: return "strike_through";
    }
    return "unknown";
}

/// A delimiter-bounded styled span. Children are themselves parsed.
struct Emphasis {
    EmphasisKind kind{EmphasisKind::bold};
    Nodes children;

    auto operator==(const Emphasis& other) const -> bool;
};

// -- Literal spans ------------------------------------------------------------

/// `~code~`
struct Code {
    std::string text;
    auto operator==(const Code&) const -> bool = default;
};

/// `=verbatim=`
struct Verbatim {
    std::string text;
    auto operator==(const Verbatim&) const -> bool = default;
};

/// Literal text.
struct Plain {
    std::string text;
    auto operator==(const Plain&) const -> bool = default;
};

/// An explicit line break.
struct BreakLine {
    auto operator==(const BreakLine&) const -> bool = default;
};

// -- Links --------------------------------------------------------------------

/// A url naming a local file (`./a.png`, `/etc/hosts`).
struct File {
    std::string path;
    auto operator==(const File&) const -> bool = default;
};

/// A url that is a search term inside the document (`[[Heading]]`).
struct Search {
    std::string term;
    auto operator==(const Search&) const -> bool = default;
};

/// A url of the form `protocol:link` (`https://x.org` gives
/// protocol `https` and link `//x.org`).
struct Complex {
    std::string protocol;
    std::string link;
    auto operator==(const Complex&) const -> bool = default;
};

/// The three url classes.
using Url = std::variant<File, Search, Complex>;

/// A bracketed or bare link.
struct Link {
    Url url;
    Nodes label;  ///< Parsed description; empty when none was written.

    auto operator==(const Link& other) const -> bool;
};

// -- Anchors ------------------------------------------------------------------

/// `<<name>>`
struct Target {
    std::string name;
    auto operator==(const Target&) const -> bool = default;
};

/// `<<<name>>>`
struct RadioTarget {
    std::string name;
    auto operator==(const RadioTarget&) const -> bool = default;
};

// -- Scripts ------------------------------------------------------------------

/// `_{body}`
struct Subscript {
    Nodes children;
    auto operator==(const Subscript& other) const -> bool;
};

/// `^{body}`
struct Superscript {
    Nodes children;
    auto operator==(const Superscript& other) const -> bool;
};

// -- Footnotes ----------------------------------------------------------------

/// A footnote reference, optionally carrying an inline definition.
///
/// Anonymous references (`[fn::text]`) receive a generated name that is
/// unique within the parsing Session.
struct FootnoteReference {
    std::string name;
    std::optional<Nodes> definition;

    auto operator==(const FootnoteReference& other) const -> bool;
};

// -- Cookies ------------------------------------------------------------------

/// `[50%]`
struct Percent {
    int value{0};
    auto operator==(const Percent&) const -> bool = default;
};

/// `[3/10]`
struct Absolute {
    int current{0};
    int max{0};
    auto operator==(const Absolute&) const -> bool = default;
};

/// A statistics cookie indicating task progress.
struct Cookie {
    std::variant<Percent, Absolute> value;
    auto operator==(const Cookie&) const -> bool = default;
};

// -- LaTeX ----------------------------------------------------------------------

/// The two LaTeX fragment shapes.
enum class LatexMode : std::uint8_t {
    inline_math,  ///< `$...$` or `\(...\)`
    displayed,    ///< `$$...$$` or `\[...\]`
};

/// Convert a LatexMode to its string representation.
constexpr auto to_string_view(LatexMode mode) noexcept -> std::string_view {
    switch (mode) {
        case LatexMode::inline_math: return "inline";
        case LatexMode::displayed:   return "displayed";
    }
    return "unknown";
}

/// A LaTeX math fragment; `text` excludes the delimiters.
struct LatexFragment {
    LatexMode mode{LatexMode::inline_math};
    std::string text;
    auto operator==(const LatexFragment&) const -> bool = default;
};

// -- Macros ---------------------------------------------------------------------

/// `{{{name(arg1, arg2)}}}`. Recognized only, never expanded.
struct Macro {
    std::string name;
    std::vector<std::string> arguments;
    auto operator==(const Macro&) const -> bool = default;
};

// -- Timestamps -----------------------------------------------------------------

/// What a timestamp node denotes.
enum class TimestampKind : std::uint8_t {
    scheduled,  ///< `SCHEDULED: <...>`
    deadline,   ///< `DEADLINE: <...>`
    date,       ///< A bare `<...>` or `[...]`
    closed,     ///< `CLOSED: [...]`
    clock,      ///< `CLOCK: [...]`, stopped when `stop` is set
    range,      ///< `<...>--<...>`
};

/// Convert a TimestampKind to its string representation.
constexpr auto to_string_view(TimestampKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TimestampKind::scheduled: return "scheduled";
        case TimestampKind::deadline:  return "deadline";
        case TimestampKind::date:      return "date";
        case TimestampKind::closed:    return "closed";
        case TimestampKind::clock:     return "clock";
        case TimestampKind::range:     return "range";
    }
    return "unknown";
}

/// A timestamp, a started or stopped clock, or a date range.
///
/// `stop` is set exactly for `range` and for a stopped `clock`. Both
/// endpoints are plain stamps, never nested timestamps.
struct Timestamp {
    TimestampKind kind{TimestampKind::date};
    Stamp start;
    std::optional<Stamp> stop;

    auto operator==(const Timestamp&) const -> bool = default;

    /// True for `range` and for a stopped `clock`.
    auto is_range() const -> bool { return stop.has_value(); }
};

// -- Export snippets ----------------------------------------------------------

/// `@@backend:content@@`
struct ExportSnippet {
    std::string backend;
    std::string content;
    auto operator==(const ExportSnippet&) const -> bool = default;
};

// -- Node -----------------------------------------------------------------------

/// One inline construct.
///
/// Nodes are values: a tree is owned by its root sequence and copied or
/// moved as a whole.
///
/// @code
/// auto n = Node{Emphasis{EmphasisKind::bold, {Node{Plain{"bold"}}}}};
/// if (const auto* e = n.get_if<Emphasis>()) { ... }
/// @endcode
struct Node {
    using Variant = std::variant<
        Emphasis,
        Code,
        Verbatim,
        Plain,
        BreakLine,
        Link,
        Target,
        RadioTarget,
        Subscript,
        Superscript,
        FootnoteReference,
        Cookie,
        LatexFragment,
        Macro,
        Entity,
        Timestamp,
        ExportSnippet
    >;

    Variant value;

    /// Default-constructs to empty literal text.
    Node() : value{Plain{}} {}

    /// Construct from any alternative.
    template <typename T>
        requires (!std::same_as<std::remove_cvref_t<T>, Node>) &&
                 std::constructible_from<Variant, T&&>
    Node(T&& v) : value(std::forward<T>(v)) {}  // NOLINT(google-explicit-constructor)

    /// Check if this node holds alternative T.
    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(value); }

    /// Pointer to alternative T, or nullptr.
    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&value); }

    /// The tag naming this node's alternative (`"emphasis"`, `"plain"`, ...).
    auto type_name() const -> std::string_view;

    auto operator==(const Node&) const -> bool = default;
};

inline auto Emphasis::operator==(const Emphasis& other) const -> bool {
    return kind == other.kind && children == other.children;
}

inline auto Link::operator==(const Link& other) const -> bool {
    return url == other.url && label == other.label;
}

inline auto Subscript::operator==(const Subscript& other) const -> bool {
    return children == other.children;
}

inline auto Superscript::operator==(const Superscript& other) const -> bool {
    return children == other.children;
}

inline auto FootnoteReference::operator==(const FootnoteReference& other) const -> bool {
    return name == other.name && definition == other.definition;
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Plain& p) { std::printf("%s\n", p.text.c_str()); },
///     [](const auto&) {},
/// }, node.value);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Check that no two adjacent elements of a sequence are both Plain,
/// recursively through every child sequence.
auto is_normalized(const Nodes& nodes) -> bool;

}  // namespace orginline_cpp
