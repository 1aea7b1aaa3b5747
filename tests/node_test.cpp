#include <orginline-cpp/node.hpp>
#include <orginline-cpp/session.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace orginline_cpp;

// =============================================================================
// Node construction and inspection
// =============================================================================

TEST(Node, default_is_empty_plain) {
    const auto n = Node{};
    ASSERT_TRUE(n.is<Plain>());
    EXPECT_EQ(n.get_if<Plain>()->text, "");
}

TEST(Node, holds_constructed_alternative) {
    const auto n = Node{Code{"x = 1"}};
    EXPECT_TRUE(n.is<Code>());
    EXPECT_FALSE(n.is<Verbatim>());
    ASSERT_NE(n.get_if<Code>(), nullptr);
    EXPECT_EQ(n.get_if<Code>()->text, "x = 1");
    EXPECT_EQ(n.get_if<Plain>(), nullptr);
}

TEST(Node, type_name_covers_all_alternatives) {
    EXPECT_EQ(Node{Emphasis{}}.type_name(), "emphasis");
    EXPECT_EQ(Node{Code{}}.type_name(), "code");
    EXPECT_EQ(Node{Verbatim{}}.type_name(), "verbatim");
    EXPECT_EQ(Node{Plain{}}.type_name(), "plain");
    EXPECT_EQ(Node{BreakLine{}}.type_name(), "break_line");
    EXPECT_EQ(Node{Link{}}.type_name(), "link");
    EXPECT_EQ(Node{Target{}}.type_name(), "target");
    EXPECT_EQ(Node{RadioTarget{}}.type_name(), "radio_target");
    EXPECT_EQ(Node{Subscript{}}.type_name(), "subscript");
    EXPECT_EQ(Node{Superscript{}}.type_name(), "superscript");
    EXPECT_EQ(Node{FootnoteReference{}}.type_name(), "footnote_reference");
    EXPECT_EQ(Node{Cookie{}}.type_name(), "cookie");
    EXPECT_EQ(Node{LatexFragment{}}.type_name(), "latex_fragment");
    EXPECT_EQ(Node{Macro{}}.type_name(), "macro");
    EXPECT_EQ(Node{Entity{}}.type_name(), "entity");
    EXPECT_EQ(Node{Timestamp{}}.type_name(), "timestamp");
    EXPECT_EQ(Node{ExportSnippet{}}.type_name(), "export_snippet");
}

TEST(Node, enum_to_string_view) {
    EXPECT_EQ(to_string_view(EmphasisKind::bold), "bold");
    EXPECT_EQ(to_string_view(EmphasisKind::italic), "italic");
    EXPECT_EQ(to_string_view(EmphasisKind::underline), "underline");
    EXPECT_EQ(to_string_view(EmphasisKind::strike_through), "strike_through");
    EXPECT_EQ(to_string_view(LatexMode::inline_math), "inline");
    EXPECT_EQ(to_string_view(LatexMode::displayed), "displayed");
    EXPECT_EQ(to_string_view(TimestampKind::scheduled), "scheduled");
    EXPECT_EQ(to_string_view(TimestampKind::deadline), "deadline");
    EXPECT_EQ(to_string_view(TimestampKind::date), "date");
    EXPECT_EQ(to_string_view(TimestampKind::closed), "closed");
    EXPECT_EQ(to_string_view(TimestampKind::clock), "clock");
    EXPECT_EQ(to_string_view(TimestampKind::range), "range");
}

// =============================================================================
// Equality
// =============================================================================

TEST(Node, deep_equality_through_children) {
    const auto a = Node{Emphasis{EmphasisKind::bold, {Node{Plain{"x"}}}}};
    const auto b = Node{Emphasis{EmphasisKind::bold, {Node{Plain{"x"}}}}};
    const auto c = Node{Emphasis{EmphasisKind::bold, {Node{Plain{"y"}}}}};
    const auto d = Node{Emphasis{EmphasisKind::italic, {Node{Plain{"x"}}}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST(Node, footnote_equality_distinguishes_missing_and_empty_definition) {
    const auto none = FootnoteReference{"a", std::nullopt};
    const auto empty = FootnoteReference{"a", Nodes{}};
    EXPECT_NE(none, empty);
    EXPECT_EQ(none, (FootnoteReference{"a", std::nullopt}));
}

TEST(Timestamp, is_range_follows_stop) {
    auto ts = Timestamp{};
    EXPECT_FALSE(ts.is_range());
    ts.stop = Stamp{};
    EXPECT_TRUE(ts.is_range());
}

// =============================================================================
// Normalization
// =============================================================================

TEST(Normalize, merges_adjacent_plain) {
    const auto out = normalize({Node{Plain{"a"}}, Node{Plain{"b"}}, Node{Code{"c"}},
                                Node{Plain{"d"}}, Node{Plain{"e"}}, Node{Plain{"f"}}});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], Node{Plain{"ab"}});
    EXPECT_EQ(out[1], Node{Code{"c"}});
    EXPECT_EQ(out[2], Node{Plain{"def"}});
}

TEST(Normalize, empty_sequence_stays_empty) {
    EXPECT_TRUE(normalize({}).empty());
}

TEST(IsNormalized, detects_adjacent_plain_at_top_level) {
    EXPECT_TRUE(is_normalized({Node{Plain{"a"}}, Node{BreakLine{}}, Node{Plain{"b"}}}));
    EXPECT_FALSE(is_normalized({Node{Plain{"a"}}, Node{Plain{"b"}}}));
}

TEST(IsNormalized, detects_adjacent_plain_in_children) {
    const auto nested = Nodes{Node{Emphasis{EmphasisKind::bold,
                                            {Node{Plain{"a"}}, Node{Plain{"b"}}}}}};
    EXPECT_FALSE(is_normalized(nested));

    const auto in_footnote = Nodes{Node{FootnoteReference{
        "n", Nodes{Node{Plain{"a"}}, Node{Plain{"b"}}}}}};
    EXPECT_FALSE(is_normalized(in_footnote));
}
