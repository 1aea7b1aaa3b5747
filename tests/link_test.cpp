#include <orginline-cpp/session.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>

namespace oi = orginline_cpp;
using oi::Node;
using oi::Nodes;

namespace {

auto plain(std::string text) -> Node { return Node{oi::Plain{std::move(text)}}; }

auto single_link(std::string_view input) -> oi::Link {
    const auto nodes = oi::parse(input);
    EXPECT_EQ(nodes.size(), 1u) << input;
    if (nodes.empty() || !nodes.front().is<oi::Link>()) {
        ADD_FAILURE() << "no link in '" << input << "'";
        return oi::Link{};
    }
    return *nodes.front().get_if<oi::Link>();
}

}  // anonymous namespace

// =============================================================================
// Url classification
// =============================================================================

TEST(Link, relative_file) {
    const auto link = single_link("[[./a.png]]");
    EXPECT_EQ(link.url, oi::Url{oi::File{"./a.png"}});
    EXPECT_TRUE(link.label.empty());
}

TEST(Link, absolute_file) {
    EXPECT_EQ(single_link("[[/etc/hosts]]").url, oi::Url{oi::File{"/etc/hosts"}});
}

TEST(Link, complex_with_label) {
    const auto link = single_link("[[https://x.org][label]]");
    EXPECT_EQ(link.url, (oi::Url{oi::Complex{"https", "//x.org"}}));
    EXPECT_EQ(link.label, (Nodes{plain("label")}));
}

TEST(Link, search_term) {
    EXPECT_EQ(single_link("[[term]]").url, oi::Url{oi::Search{"term"}});
}

TEST(Link, colon_without_protocol_or_target_is_search) {
    EXPECT_EQ(single_link("[[:tag]]").url, oi::Url{oi::Search{":tag"}});
    EXPECT_EQ(single_link("[[id:]]").url, oi::Url{oi::Search{"id:"}});
}

TEST(Link, non_web_protocol) {
    EXPECT_EQ(single_link("[[id:abc-123]]").url, (oi::Url{oi::Complex{"id", "abc-123"}}));
}

// =============================================================================
// Labels
// =============================================================================

TEST(Link, label_is_parsed_with_markup) {
    const auto link = single_link("[[https://x.org][a *bold* \\alpha]]");
    ASSERT_EQ(link.label.size(), 4u);
    EXPECT_EQ(link.label[0], plain("a "));
    ASSERT_TRUE(link.label[1].is<oi::Emphasis>());
    EXPECT_EQ(link.label[2], plain(" "));
    ASSERT_TRUE(link.label[3].is<oi::Entity>());
    EXPECT_EQ(link.label[3].get_if<oi::Entity>()->name, "alpha");
}

TEST(Link, label_does_not_recognize_targets) {
    const auto link = single_link("[[x][<<t>>]]");
    EXPECT_EQ(link.label, (Nodes{plain("<<t>>")}));
}

TEST(Link, empty_label_is_empty) {
    EXPECT_TRUE(single_link("[[term][]]").label.empty());
}

TEST(Link, malformed_stays_literal) {
    EXPECT_EQ(oi::parse("[[]]"), (Nodes{plain("[[]]")}));
    EXPECT_EQ(oi::parse("[[unclosed"), (Nodes{plain("[[unclosed")}));
    EXPECT_EQ(oi::parse("[[a][b]"), (Nodes{plain("[[a][b]")}));
}

// =============================================================================
// Bare links
// =============================================================================

TEST(BareLink, url_and_label) {
    const auto nodes = oi::parse("see https://x.org/a?b=c now");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0], plain("see "));
    ASSERT_TRUE(nodes[1].is<oi::Link>());
    const auto& link = *nodes[1].get_if<oi::Link>();
    EXPECT_EQ(link.url, (oi::Url{oi::Complex{"https", "//x.org/a?b=c"}}));
    EXPECT_EQ(link.label, (Nodes{plain("https://x.org/a?b=c")}));
    EXPECT_EQ(nodes[2], plain(" now"));
}

TEST(BareLink, stops_at_delimiters) {
    const auto nodes = oi::parse("(http://x.org)");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0], plain("("));
    EXPECT_EQ(nodes[1].get_if<oi::Link>()->url, (oi::Url{oi::Complex{"http", "//x.org"}}));
    EXPECT_EQ(nodes[2], plain(")"));
}

TEST(BareLink, protocol_must_start_a_word) {
    EXPECT_EQ(oi::parse("x1http://x.org"), (Nodes{plain("x1http://x.org")}));
}

TEST(BareLink, empty_rest_is_literal) {
    EXPECT_EQ(oi::parse("https:// x"), (Nodes{plain("https:// x")}));
}
