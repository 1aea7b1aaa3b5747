#include <orginline-cpp/plain_text.hpp>

#include <string>
#include <variant>

namespace orginline_cpp {

auto to_plain_text(const Node& node) -> std::string {
    return std::visit(overload{
        [](const FootnoteReference& f) -> std::string {
            return f.definition ? to_plain_text(*f.definition) : std::string{};
        },
        [](const Link& l) -> std::string { return to_plain_text(l.label); },
        [](const Emphasis& e) -> std::string { return to_plain_text(e.children); },
        [](const Subscript& s) -> std::string { return to_plain_text(s.children); },
        [](const Superscript& s) -> std::string { return to_plain_text(s.children); },
        [](const LatexFragment& l) -> std::string {
            return l.mode == LatexMode::inline_math ? l.text : std::string{};
        },
        [](const Plain& p) -> std::string { return p.text; },
        [](const Verbatim& v) -> std::string { return v.text; },
        [](const Entity& e) -> std::string { return e.unicode; },
        // Code, cookies, macros, timestamps, targets, snippets, breaks.
        [](const auto&) -> std::string { return {}; },
    }, node.value);
}

auto to_plain_text(const Nodes& nodes) -> std::string {
    auto result = std::string{};
    for (const auto& node : nodes) result += to_plain_text(node);
    return result;
}

}  // namespace orginline_cpp
