#include <orginline-cpp/datetime.hpp>

#include <gtest/gtest.h>

using namespace orginline_cpp;

// =============================================================================
// parse_date
// =============================================================================

TEST(ParseDate, well_formed) {
    const auto d = parse_date("2018-10-16");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, (Date{2018, 10, 16}));
}

TEST(ParseDate, rejects_wrong_shape) {
    EXPECT_FALSE(parse_date("2018-1-16").has_value());
    EXPECT_FALSE(parse_date("2018/10/16").has_value());
    EXPECT_FALSE(parse_date("2018-10-16x").has_value());
    EXPECT_FALSE(parse_date("20a8-10-16").has_value());
    EXPECT_FALSE(parse_date("").has_value());
}

TEST(ParseDate, rejects_out_of_range_fields) {
    EXPECT_FALSE(parse_date("2018-00-10").has_value());
    EXPECT_FALSE(parse_date("2018-13-10").has_value());
    EXPECT_FALSE(parse_date("2018-10-00").has_value());
    EXPECT_FALSE(parse_date("2018-10-32").has_value());
    EXPECT_TRUE(parse_date("2018-12-31").has_value());
}

TEST(Date, ordering) {
    EXPECT_LT((Date{2018, 10, 16}), (Date{2018, 11, 1}));
    EXPECT_LT((Date{2017, 12, 31}), (Date{2018, 1, 1}));
}

// =============================================================================
// parse_time
// =============================================================================

TEST(ParseTime, one_and_two_digit_hours) {
    EXPECT_EQ(parse_time("9:05"), (Time{9, 5}));
    EXPECT_EQ(parse_time("21:20"), (Time{21, 20}));
    EXPECT_EQ(parse_time("00:00"), (Time{0, 0}));
}

TEST(ParseTime, rejects_malformed) {
    EXPECT_FALSE(parse_time("24:00").has_value());
    EXPECT_FALSE(parse_time("12:60").has_value());
    EXPECT_FALSE(parse_time("12:5").has_value());
    EXPECT_FALSE(parse_time("123:00").has_value());
    EXPECT_FALSE(parse_time(":30").has_value());
    EXPECT_FALSE(parse_time("1230").has_value());
    EXPECT_FALSE(parse_time("ab:cd").has_value());
}

// =============================================================================
// parse_repeater
// =============================================================================

TEST(ParseRepeater, cumulate) {
    const auto date = Date{2008, 2, 10};
    const auto r = parse_repeater("+1w", date, std::nullopt, '+');
    EXPECT_EQ(r.date, date);
    EXPECT_FALSE(r.time.has_value());
    ASSERT_TRUE(r.repeater.has_value());
    EXPECT_EQ(*r.repeater, (Repeater{RepeaterKind::cumulate, 1, DurationUnit::week}));
}

TEST(ParseRepeater, catch_up_keeps_time) {
    const auto date = Date{2020, 1, 1};
    const auto time = Time{8, 30};
    const auto r = parse_repeater("++2d", date, time, '+');
    EXPECT_EQ(r.time, time);
    ASSERT_TRUE(r.repeater.has_value());
    EXPECT_EQ(*r.repeater, (Repeater{RepeaterKind::catch_up, 2, DurationUnit::day}));
}

TEST(ParseRepeater, restart) {
    const auto r = parse_repeater(".+3m", Date{2020, 1, 1}, std::nullopt, '.');
    ASSERT_TRUE(r.repeater.has_value());
    EXPECT_EQ(*r.repeater, (Repeater{RepeaterKind::restart, 3, DurationUnit::month}));
}

TEST(ParseRepeater, all_units) {
    const auto date = Date{2020, 1, 1};
    EXPECT_EQ(parse_repeater("+1h", date, std::nullopt, '+').repeater->unit, DurationUnit::hour);
    EXPECT_EQ(parse_repeater("+1d", date, std::nullopt, '+').repeater->unit, DurationUnit::day);
    EXPECT_EQ(parse_repeater("+1w", date, std::nullopt, '+').repeater->unit, DurationUnit::week);
    EXPECT_EQ(parse_repeater("+1m", date, std::nullopt, '+').repeater->unit, DurationUnit::month);
    EXPECT_EQ(parse_repeater("+12y", date, std::nullopt, '+').repeater->value, 12);
}

TEST(ParseRepeater, malformed_token_yields_no_repeater) {
    const auto date = Date{2020, 1, 1};
    const auto time = Time{10, 0};
    for (auto token : {"+w", "+1", "+1x", ".1w", "+-1w", "+", "+1.5w"}) {
        const auto r = parse_repeater(token, date, time, token[0]);
        EXPECT_EQ(r.date, date) << token;
        EXPECT_EQ(r.time, time) << token;
        EXPECT_FALSE(r.repeater.has_value()) << token;
    }
}

TEST(RepeaterKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(RepeaterKind::cumulate), "cumulate");
    EXPECT_EQ(to_string_view(RepeaterKind::catch_up), "catch_up");
    EXPECT_EQ(to_string_view(RepeaterKind::restart), "restart");
    EXPECT_EQ(to_string_view(DurationUnit::hour), "hour");
    EXPECT_EQ(to_string_view(DurationUnit::year), "year");
}
