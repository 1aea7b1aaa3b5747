#include <orginline-cpp/node.hpp>

#include <cstddef>
#include <string_view>
#include <variant>

namespace orginline_cpp {

auto Node::type_name() const -> std::string_view {
    return std::visit(overload{
        [](const Emphasis&) -> std::string_view { return "emphasis"; },
        [](const Code&) -> std::string_view { return "code"; },
        [](const Verbatim&) -> std::string_view { return "verbatim"; },
        [](const Plain&) -> std::string_view { return "plain"; },
        [](const BreakLine&) -> std::string_view { return "break_line"; },
        [](const Link&) -> std::string_view { return "link"; },
        [](const Target&) -> std::string_view { return "target"; },
        [](const RadioTarget&) -> std::string_view { return "radio_target"; },
        [](const Subscript&) -> std::string_view { return "subscript"; },
        [](const Superscript&) -> std::string_view { return "superscript"; },
        [](const FootnoteReference&) -> std::string_view { return "footnote_reference"; },
        [](const Cookie&) -> std::string_view { return "cookie"; },
        [](const LatexFragment&) -> std::string_view { return "latex_fragment"; },
        [](const Macro&) -> std::string_view { return "macro"; },
        [](const Entity&) -> std::string_view { return "entity"; },
        [](const Timestamp&) -> std::string_view { return "timestamp"; },
        [](const ExportSnippet&) -> std::string_view { return "export_snippet"; },
    }, value);
}

auto is_normalized(const Nodes& nodes) -> bool {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0 && nodes[i].is<Plain>() && nodes[i - 1].is<Plain>()) return false;

        const auto children_ok = std::visit(overload{
            [](const Emphasis& e) { return is_normalized(e.children); },
            [](const Link& l) { return is_normalized(l.label); },
            [](const Subscript& s) { return is_normalized(s.children); },
            [](const Superscript& s) { return is_normalized(s.children); },
            [](const FootnoteReference& f) {
                return !f.definition || is_normalized(*f.definition);
            },
            [](const auto&) { return true; },
        }, nodes[i].value);
        if (!children_ok) return false;
    }
    return true;
}

}  // namespace orginline_cpp
