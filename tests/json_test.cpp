// json_test.cpp -- Tests for nlohmann/json serialization of inline trees

#include <orginline-cpp/json.hpp>
#include <orginline-cpp/session.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace oi = orginline_cpp;
using json = nlohmann::json;
using oi::Node;
using oi::Nodes;

namespace {

auto plain(std::string text) -> Node { return Node{oi::Plain{std::move(text)}}; }

auto to_json_value(const Node& n) -> json {
    auto j = json{};
    oi::to_json(j, n);
    return j;
}

auto from_json_value(const json& j) -> Node {
    auto n = Node{};
    oi::from_json(j, n);
    return n;
}

}  // anonymous namespace

// =============================================================================
// Tag stability
// =============================================================================

TEST(JsonTags, every_node_is_tagged_with_its_type_name) {
    const auto nodes = std::vector<Node>{
        Node{oi::Emphasis{}}, Node{oi::Code{}}, Node{oi::Verbatim{}}, Node{oi::Plain{}},
        Node{oi::BreakLine{}}, Node{oi::Link{}}, Node{oi::Target{}},
        Node{oi::RadioTarget{}}, Node{oi::Subscript{}}, Node{oi::Superscript{}},
        Node{oi::FootnoteReference{}}, Node{oi::Cookie{}}, Node{oi::LatexFragment{}},
        Node{oi::Macro{}}, Node{oi::Entity{}}, Node{oi::Timestamp{}},
        Node{oi::ExportSnippet{}},
    };
    for (const auto& n : nodes) {
        EXPECT_EQ(to_json_value(n)["type"], std::string{n.type_name()});
    }
}

TEST(JsonTags, emphasis_layout) {
    const auto j = to_json_value(Node{oi::Emphasis{oi::EmphasisKind::bold, {plain("b")}}});
    EXPECT_EQ(j, json::parse(R"({
        "type": "emphasis",
        "kind": "bold",
        "children": [{"type": "plain", "text": "b"}]
    })"));
}

TEST(JsonTags, link_layout) {
    const auto j = to_json_value(Node{oi::Link{oi::Complex{"https", "//x.org"}, {plain("x")}}});
    EXPECT_EQ(j, json::parse(R"({
        "type": "link",
        "url": {"type": "complex", "protocol": "https", "link": "//x.org"},
        "label": [{"type": "plain", "text": "x"}]
    })"));
}

TEST(JsonTags, cookie_layout) {
    EXPECT_EQ(to_json_value(Node{oi::Cookie{oi::Percent{50}}}),
              json::parse(R"({"type": "cookie", "kind": "percent", "value": 50})"));
    EXPECT_EQ(to_json_value(Node{oi::Cookie{oi::Absolute{3, 10}}}),
              json::parse(R"({"type": "cookie", "kind": "absolute", "current": 3, "max": 10})"));
}

TEST(JsonTags, footnote_without_definition_is_null) {
    const auto j = to_json_value(Node{oi::FootnoteReference{"1", std::nullopt}});
    EXPECT_TRUE(j["definition"].is_null());
}

TEST(JsonTags, timestamp_layout) {
    auto ts = oi::Timestamp{};
    ts.kind = oi::TimestampKind::deadline;
    ts.start.date = oi::Date{2008, 2, 10};
    ts.start.active = true;
    ts.start.repeater = oi::Repeater{oi::RepeaterKind::cumulate, 1, oi::DurationUnit::week};

    EXPECT_EQ(to_json_value(Node{ts}), json::parse(R"({
        "type": "timestamp",
        "kind": "deadline",
        "start": {
            "date": {"year": 2008, "month": 2, "day": 10},
            "time": null,
            "repeater": {"kind": "cumulate", "value": 1, "unit": "week"},
            "active": true
        }
    })"));
}

// =============================================================================
// Round trip
// =============================================================================

TEST(JsonRoundTrip, parsed_document) {
    const auto nodes = oi::parse(
        "*bold /it/* [[./a.png]] [[https://x.org][x]] [fn::note] [50%] [1/2] "
        "$x$ \\alpha {{{m(a,b)}}} <<t>> <<<r>>> @@html:<b>@@ ~c~ =v= H_{2} e^{n}\n"
        "CLOCK: [2020-01-01 Wed 10:00]--[2020-01-01 Wed 11:30] <2020-01-01 +1w>");
    const auto j = oi::nodes_to_json(nodes);
    EXPECT_EQ(oi::nodes_from_json(j), nodes);
}

TEST(JsonRoundTrip, survives_text_serialization) {
    const auto nodes = oi::parse("DEADLINE: <2008-02-10 Sun 9:00 ++1d> [[term]]");
    const auto text = oi::nodes_to_json(nodes).dump();
    EXPECT_EQ(oi::nodes_from_json(json::parse(text)), nodes);
}

TEST(JsonRoundTrip, adl_conversion) {
    const auto n = Node{oi::Macro{"m", {"a", "b"}}};
    const json j = n;
    EXPECT_EQ(j.get<Node>(), n);
}

// =============================================================================
// Rejection
// =============================================================================

TEST(JsonReject, unknown_type) {
    EXPECT_THROW(from_json_value(json::parse(R"({"type": "bogus"})")), std::runtime_error);
}

TEST(JsonReject, missing_field) {
    EXPECT_THROW(from_json_value(json::parse(R"({"type": "plain"})")), std::runtime_error);
    EXPECT_THROW(from_json_value(json::parse(R"({"text": "x"})")), std::runtime_error);
}

TEST(JsonReject, wrong_field_type) {
    EXPECT_THROW(from_json_value(json::parse(R"({"type": "plain", "text": 3})")),
                 std::runtime_error);
    EXPECT_THROW(from_json_value(json::parse(R"({"type": "cookie", "kind": "percent", "value": "5"})")),
                 std::runtime_error);
}

TEST(JsonReject, unknown_enum_tag) {
    EXPECT_THROW(from_json_value(json::parse(
                     R"({"type": "emphasis", "kind": "shouting", "children": []})")),
                 std::runtime_error);
}

TEST(JsonReject, stop_must_match_timestamp_kind) {
    auto ts = oi::Timestamp{};
    ts.kind = oi::TimestampKind::range;
    ts.start.date = oi::Date{2020, 1, 1};
    ts.stop = ts.start;
    auto j = to_json_value(Node{ts});
    EXPECT_EQ(from_json_value(j), Node{ts});

    auto missing_stop = j;
    missing_stop["stop"] = nullptr;
    EXPECT_THROW(from_json_value(missing_stop), std::runtime_error);

    auto date_with_stop = j;
    date_with_stop["kind"] = "date";
    EXPECT_THROW(from_json_value(date_with_stop), std::runtime_error);

    auto stopped_clock = j;
    stopped_clock["kind"] = "clock";
    EXPECT_NO_THROW(from_json_value(stopped_clock));
}

TEST(JsonReject, not_an_array) {
    EXPECT_THROW(oi::nodes_from_json(json::object()), std::runtime_error);
    EXPECT_THROW(oi::nodes_from_json(json::parse("[1]")), std::runtime_error);
}

TEST(JsonReject, message_names_the_error_kind) {
    try {
        from_json_value(json::parse(R"({"type": "bogus"})"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}.rfind("invalid_node", 0), 0u);
    }
}
