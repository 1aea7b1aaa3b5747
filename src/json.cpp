#include <orginline-cpp/error.hpp>
#include <orginline-cpp/json.hpp>

#include <plog/Log.h>

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace orginline_cpp {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

[[noreturn]] void reject(const std::string& what) {
    PLOGW << "json: rejected node data: " << what;
    throw std::runtime_error{std::string{to_string_view(ErrorKind::invalid_node)} + ": " + what};
}

auto field(const nlohmann::json& j, std::string_view key) -> const nlohmann::json& {
    if (!j.is_object()) reject("expected an object");
    const auto it = j.find(std::string{key});
    if (it == j.end()) reject("missing field '" + std::string{key} + "'");
    return *it;
}

auto string_field(const nlohmann::json& j, std::string_view key) -> std::string {
    const auto& v = field(j, key);
    if (!v.is_string()) reject("field '" + std::string{key} + "' must be a string");
    return v.get<std::string>();
}

auto int_field(const nlohmann::json& j, std::string_view key) -> int {
    const auto& v = field(j, key);
    if (!v.is_number_integer()) reject("field '" + std::string{key} + "' must be an integer");
    return v.get<int>();
}

auto bool_field(const nlohmann::json& j, std::string_view key) -> bool {
    const auto& v = field(j, key);
    if (!v.is_boolean()) reject("field '" + std::string{key} + "' must be a boolean");
    return v.get<bool>();
}

// Map a tag back onto an enumerator by comparing against to_string_view.
template <typename Enum, std::size_t N>
auto enum_field(const nlohmann::json& j, std::string_view key,
                const std::array<Enum, N>& values) -> Enum {
    const auto tag = string_field(j, key);
    for (auto v : values) {
        if (to_string_view(v) == tag) return v;
    }
    reject("unknown " + std::string{key} + " '" + tag + "'");
}

constexpr auto emphasis_kinds = std::array{
    EmphasisKind::bold, EmphasisKind::italic,
    EmphasisKind::underline, EmphasisKind::strike_through,
};

constexpr auto latex_modes = std::array{LatexMode::inline_math, LatexMode::displayed};

constexpr auto timestamp_kinds = std::array{
    TimestampKind::scheduled, TimestampKind::deadline, TimestampKind::date,
    TimestampKind::closed, TimestampKind::clock, TimestampKind::range,
};

constexpr auto repeater_kinds = std::array{
    RepeaterKind::cumulate, RepeaterKind::catch_up, RepeaterKind::restart,
};

constexpr auto duration_units = std::array{
    DurationUnit::hour, DurationUnit::day, DurationUnit::week,
    DurationUnit::month, DurationUnit::year,
};

}  // anonymous namespace

// =============================================================================
// Date / time
// =============================================================================

void to_json(nlohmann::json& j, const Date& d) {
    j = nlohmann::json{{"year", d.year}, {"month", d.month}, {"day", d.day}};
}

void from_json(const nlohmann::json& j, Date& d) {
    d = Date{int_field(j, "year"), int_field(j, "month"), int_field(j, "day")};
}

void to_json(nlohmann::json& j, const Time& t) {
    j = nlohmann::json{{"hour", t.hour}, {"minute", t.minute}};
}

void from_json(const nlohmann::json& j, Time& t) {
    t = Time{int_field(j, "hour"), int_field(j, "minute")};
}

void to_json(nlohmann::json& j, const Repeater& r) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(r.kind)}},
        {"value", r.value},
        {"unit", std::string{to_string_view(r.unit)}},
    };
}

void from_json(const nlohmann::json& j, Repeater& r) {
    r = Repeater{
        enum_field(j, "kind", repeater_kinds),
        int_field(j, "value"),
        enum_field(j, "unit", duration_units),
    };
}

void to_json(nlohmann::json& j, const Stamp& s) {
    j = nlohmann::json{{"date", s.date}, {"active", s.active}};
    j["time"] = s.time ? nlohmann::json(*s.time) : nlohmann::json(nullptr);
    j["repeater"] = s.repeater ? nlohmann::json(*s.repeater) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, Stamp& s) {
    s = Stamp{};
    from_json(field(j, "date"), s.date);
    s.active = bool_field(j, "active");
    if (const auto& t = field(j, "time"); !t.is_null()) {
        s.time.emplace();
        from_json(t, *s.time);
    }
    if (const auto& r = field(j, "repeater"); !r.is_null()) {
        s.repeater.emplace();
        from_json(r, *s.repeater);
    }
}

// =============================================================================
// Payloads
// =============================================================================

void to_json(nlohmann::json& j, const Entity& e) {
    j = nlohmann::json{
        {"name", e.name},
        {"latex", e.latex},
        {"latex_math", e.latex_math},
        {"html", e.html},
        {"ascii", e.ascii},
        {"unicode", e.unicode},
    };
}

void from_json(const nlohmann::json& j, Entity& e) {
    e = Entity{
        string_field(j, "name"),
        string_field(j, "latex"),
        bool_field(j, "latex_math"),
        string_field(j, "html"),
        string_field(j, "ascii"),
        string_field(j, "unicode"),
    };
}

void to_json(nlohmann::json& j, const Url& u) {
    std::visit(overload{
        [&](const File& f) { j = nlohmann::json{{"type", "file"}, {"path", f.path}}; },
        [&](const Search& s) { j = nlohmann::json{{"type", "search"}, {"term", s.term}}; },
        [&](const Complex& c) {
            j = nlohmann::json{{"type", "complex"}, {"protocol", c.protocol}, {"link", c.link}};
        },
    }, u);
}

void from_json(const nlohmann::json& j, Url& u) {
    const auto type = string_field(j, "type");
    if (type == "file") {
        u = File{string_field(j, "path")};
    } else if (type == "search") {
        u = Search{string_field(j, "term")};
    } else if (type == "complex") {
        u = Complex{string_field(j, "protocol"), string_field(j, "link")};
    } else {
        reject("unknown url type '" + type + "'");
    }
}

// =============================================================================
// Node
// =============================================================================

auto nodes_to_json(const Nodes& nodes) -> nlohmann::json {
    auto result = nlohmann::json::array();
    for (const auto& n : nodes) {
        auto j = nlohmann::json{};
        to_json(j, n);
        result.push_back(std::move(j));
    }
    return result;
}

auto nodes_from_json(const nlohmann::json& j) -> Nodes {
    if (!j.is_array()) reject("expected an array of nodes");
    auto result = Nodes{};
    result.reserve(j.size());
    for (const auto& item : j) {
        auto n = Node{};
        from_json(item, n);
        result.push_back(std::move(n));
    }
    return result;
}

void to_json(nlohmann::json& j, const Node& n) {
    j = nlohmann::json{{"type", std::string{n.type_name()}}};
    std::visit(overload{
        [&](const Emphasis& e) {
            j["kind"] = std::string{to_string_view(e.kind)};
            j["children"] = nodes_to_json(e.children);
        },
        [&](const Code& c) { j["text"] = c.text; },
        [&](const Verbatim& v) { j["text"] = v.text; },
        [&](const Plain& p) { j["text"] = p.text; },
        [&](const BreakLine&) {},
        [&](const Link& l) {
            j["url"] = l.url;
            j["label"] = nodes_to_json(l.label);
        },
        [&](const Target& t) { j["name"] = t.name; },
        [&](const RadioTarget& t) { j["name"] = t.name; },
        [&](const Subscript& s) { j["children"] = nodes_to_json(s.children); },
        [&](const Superscript& s) { j["children"] = nodes_to_json(s.children); },
        [&](const FootnoteReference& f) {
            j["name"] = f.name;
            j["definition"] = f.definition ? nodes_to_json(*f.definition)
                                           : nlohmann::json(nullptr);
        },
        [&](const Cookie& c) {
            std::visit(overload{
                [&](const Percent& p) {
                    j["kind"] = "percent";
                    j["value"] = p.value;
                },
                [&](const Absolute& a) {
                    j["kind"] = "absolute";
                    j["current"] = a.current;
                    j["max"] = a.max;
                },
            }, c.value);
        },
        [&](const LatexFragment& l) {
            j["mode"] = std::string{to_string_view(l.mode)};
            j["text"] = l.text;
        },
        [&](const Macro& m) {
            j["name"] = m.name;
            j["arguments"] = m.arguments;
        },
        [&](const Entity& e) {
            auto payload = nlohmann::json{};
            to_json(payload, e);
            j.update(payload);
        },
        [&](const Timestamp& t) {
            j["kind"] = std::string{to_string_view(t.kind)};
            j["start"] = t.start;
            if (t.stop) j["stop"] = *t.stop;
        },
        [&](const ExportSnippet& s) {
            j["backend"] = s.backend;
            j["content"] = s.content;
        },
    }, n.value);
}

void from_json(const nlohmann::json& j, Node& n) {
    const auto type = string_field(j, "type");

    if (type == "emphasis") {
        n = Emphasis{enum_field(j, "kind", emphasis_kinds), nodes_from_json(field(j, "children"))};
    } else if (type == "code") {
        n = Code{string_field(j, "text")};
    } else if (type == "verbatim") {
        n = Verbatim{string_field(j, "text")};
    } else if (type == "plain") {
        n = Plain{string_field(j, "text")};
    } else if (type == "break_line") {
        n = BreakLine{};
    } else if (type == "link") {
        auto link = Link{};
        from_json(field(j, "url"), link.url);
        link.label = nodes_from_json(field(j, "label"));
        n = std::move(link);
    } else if (type == "target") {
        n = Target{string_field(j, "name")};
    } else if (type == "radio_target") {
        n = RadioTarget{string_field(j, "name")};
    } else if (type == "subscript") {
        n = Subscript{nodes_from_json(field(j, "children"))};
    } else if (type == "superscript") {
        n = Superscript{nodes_from_json(field(j, "children"))};
    } else if (type == "footnote_reference") {
        auto ref = FootnoteReference{};
        ref.name = string_field(j, "name");
        if (const auto& d = field(j, "definition"); !d.is_null()) {
            ref.definition = nodes_from_json(d);
        }
        n = std::move(ref);
    } else if (type == "cookie") {
        const auto kind = string_field(j, "kind");
        if (kind == "percent") {
            n = Cookie{Percent{int_field(j, "value")}};
        } else if (kind == "absolute") {
            n = Cookie{Absolute{int_field(j, "current"), int_field(j, "max")}};
        } else {
            reject("unknown cookie kind '" + kind + "'");
        }
    } else if (type == "latex_fragment") {
        n = LatexFragment{enum_field(j, "mode", latex_modes), string_field(j, "text")};
    } else if (type == "macro") {
        auto macro = Macro{};
        macro.name = string_field(j, "name");
        const auto& args = field(j, "arguments");
        if (!args.is_array()) reject("field 'arguments' must be an array");
        for (const auto& a : args) {
            if (!a.is_string()) reject("macro arguments must be strings");
            macro.arguments.push_back(a.get<std::string>());
        }
        n = std::move(macro);
    } else if (type == "entity") {
        auto entity = Entity{};
        from_json(j, entity);
        n = std::move(entity);
    } else if (type == "timestamp") {
        auto ts = Timestamp{};
        ts.kind = enum_field(j, "kind", timestamp_kinds);
        from_json(field(j, "start"), ts.start);
        if (const auto it = j.find("stop"); it != j.end() && !it->is_null()) {
            ts.stop.emplace();
            from_json(*it, *ts.stop);
        }
        if (ts.kind == TimestampKind::range && !ts.stop) {
            reject("range timestamp without 'stop'");
        }
        if (ts.stop && ts.kind != TimestampKind::range && ts.kind != TimestampKind::clock) {
            reject("'stop' on a " + std::string{to_string_view(ts.kind)} + " timestamp");
        }
        n = std::move(ts);
    } else if (type == "export_snippet") {
        n = ExportSnippet{string_field(j, "backend"), string_field(j, "content")};
    } else {
        reject("unknown node type '" + type + "'");
    }
}

}  // namespace orginline_cpp
