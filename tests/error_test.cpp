#include <orginline-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace orginline_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invariant_violation), "invariant_violation");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_node),        "invalid_node");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_option),      "invalid_option");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_node, "missing field"};
    const auto e2 = Error{ErrorKind::invalid_node, "missing field"};
    const auto e3 = Error{ErrorKind::invalid_option, "missing field"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_node, "foo"};
    const auto e2 = Error{ErrorKind::invalid_node, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(InvariantViolation, carries_structured_error) {
    const auto ex = InvariantViolation{"bad nesting"};

    EXPECT_STREQ(ex.what(), "bad nesting");
    EXPECT_EQ(ex.error().kind, ErrorKind::invariant_violation);
    EXPECT_EQ(ex.error().message, "bad nesting");
}

TEST(InvariantViolation, is_a_logic_error) {
    EXPECT_THROW(throw InvariantViolation{"x"}, std::logic_error);
}
