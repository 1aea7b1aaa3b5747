#include "grammar.hpp"
#include "scan.hpp"

#include <orginline-cpp/datetime.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace orginline_cpp::detail {

namespace {

struct Keyword {
    std::string_view text;
    TimestampKind kind;
};

constexpr auto keywords = std::array<Keyword, 4>{{
    {"SCHEDULED:", TimestampKind::scheduled},
    {"DEADLINE:",  TimestampKind::deadline},
    {"CLOSED:",    TimestampKind::closed},
    {"CLOCK:",     TimestampKind::clock},
}};

struct StampMatch {
    Stamp stamp;
    std::size_t consumed{0};
};

struct TimestampMatch {
    Timestamp timestamp;
    std::size_t consumed{0};
};

// `<date [day] [time-or-repeater] [repeater]>` or the `[...]` form.
auto parse_stamp(std::string_view input) -> std::optional<StampMatch> {
    if (input.empty()) return std::nullopt;
    const auto open = input.front();
    if (open != '<' && open != '[') return std::nullopt;
    const auto active = open == '<';
    const auto close = active ? '>' : ']';

    const auto is_token_char = [close](char c) { return !is_space(c) && c != close; };

    auto pos = std::size_t{1};
    const auto date_len = span_while(input, pos, is_token_char);
    if (date_len == 0) return std::nullopt;
    const auto date = parse_date(input.substr(pos, date_len));
    if (!date) return std::nullopt;
    pos += date_len;

    auto tokens = std::vector<std::string_view>{};
    while (pos < input.size() && is_blank(input[pos])) {
        pos += skip_blanks(input, pos);
        const auto len = span_while(input, pos, is_token_char);
        if (len == 0) break;
        tokens.push_back(input.substr(pos, len));
        pos += len;
    }
    if (pos >= input.size() || input[pos] != close) return std::nullopt;
    ++pos;

    // The day name carries no meaning; the date already fixes it.
    if (!tokens.empty() && span_while(tokens.front(), 0, is_letter) == tokens.front().size()) {
        tokens.erase(tokens.begin());
    }
    if (tokens.size() > 2) return std::nullopt;

    auto stamp = Stamp{};
    stamp.date = *date;
    stamp.active = active;

    if (tokens.size() == 1) {
        const auto token = tokens.front();
        if (token.front() == '+' || token.front() == '.') {
            auto r = parse_repeater(token, *date, std::nullopt, token.front());
            stamp.date = r.date;
            stamp.time = r.time;
            stamp.repeater = r.repeater;
        } else {
            stamp.time = parse_time(token);
        }
    } else if (tokens.size() == 2) {
        const auto time = parse_time(tokens[0]);
        auto r = parse_repeater(tokens[1], *date, time, tokens[1].front());
        stamp.date = r.date;
        stamp.time = r.time;
        stamp.repeater = r.repeater;
    }

    return StampMatch{std::move(stamp), pos};
}

// A keyword-prefixed or bare timestamp, without ranges.
auto parse_single(std::string_view input) -> std::optional<TimestampMatch> {
    auto kind = TimestampKind::date;
    auto pos = std::size_t{0};

    for (const auto& kw : keywords) {
        if (input.starts_with(kw.text)) {
            kind = kw.kind;
            pos = kw.text.size();
            pos += skip_blanks(input, pos);
            break;
        }
    }

    auto stamp = parse_stamp(input.substr(pos));
    if (!stamp) return std::nullopt;

    auto ts = Timestamp{};
    ts.kind = kind;
    ts.start = std::move(stamp->stamp);
    return TimestampMatch{std::move(ts), pos + stamp->consumed};
}

// `ts--ts`, optionally prefixed by `CLOCK:`. Endpoints keep only their
// stamps; a clock endpoint cannot be part of a range.
auto parse_range(std::string_view input) -> std::optional<TimestampMatch> {
    auto clock = false;
    auto pos = std::size_t{0};
    if (input.starts_with("CLOCK:")) {
        clock = true;
        pos = 6;
        pos += skip_blanks(input, pos);
    }

    auto first = parse_single(input.substr(pos));
    if (!first || first->timestamp.kind == TimestampKind::clock) return std::nullopt;
    pos += first->consumed;

    if (!input.substr(pos).starts_with("--")) return std::nullopt;
    pos += 2;

    auto second = parse_single(input.substr(pos));
    if (!second || second->timestamp.kind == TimestampKind::clock) return std::nullopt;
    pos += second->consumed;

    auto ts = Timestamp{};
    ts.kind = clock ? TimestampKind::clock : TimestampKind::range;
    ts.start = std::move(first->timestamp.start);
    ts.stop = std::move(second->timestamp.start);
    return TimestampMatch{std::move(ts), pos};
}

}  // anonymous namespace

auto starts_timestamp_keyword(std::string_view input) -> bool {
    for (const auto& kw : keywords) {
        if (input.starts_with(kw.text)) return true;
    }
    return false;
}

auto try_timestamp(Context&, std::string_view input) -> std::optional<Match> {
    auto m = parse_range(input);
    if (!m) m = parse_single(input);
    if (!m) return std::nullopt;
    return Match{std::move(m->timestamp), m->consumed};
}

}  // namespace orginline_cpp::detail
