#include <orginline-cpp/datetime.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

namespace orginline_cpp {

namespace {

// Parse exactly `s` as a non-negative decimal integer.
auto parse_int(std::string_view s) -> std::optional<int> {
    if (s.empty()) return std::nullopt;
    auto value = 0;
    const auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

auto all_digits(std::string_view s) -> bool {
    for (auto c : s) {
        if (c < '0' || c > '9') return false;
    }
    return !s.empty();
}

auto unit_from_char(char c) -> std::optional<DurationUnit> {
    switch (c) {
        case 'h': return DurationUnit::hour;
        case 'd': return DurationUnit::day;
        case 'w': return DurationUnit::week;
        case 'm': return DurationUnit::month;
        case 'y': return DurationUnit::year;
        default:  return std::nullopt;
    }
}

}  // anonymous namespace

auto parse_date(std::string_view s) -> std::optional<Date> {
    // YYYY-MM-DD
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    const auto y = s.substr(0, 4);
    const auto m = s.substr(5, 2);
    const auto d = s.substr(8, 2);
    if (!all_digits(y) || !all_digits(m) || !all_digits(d)) return std::nullopt;

    auto date = Date{*parse_int(y), *parse_int(m), *parse_int(d)};
    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > 31) return std::nullopt;
    return date;
}

auto parse_time(std::string_view s) -> std::optional<Time> {
    const auto colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon > 2) return std::nullopt;
    const auto h = s.substr(0, colon);
    const auto m = s.substr(colon + 1);
    if (m.size() != 2 || !all_digits(h) || !all_digits(m)) return std::nullopt;

    auto time = Time{*parse_int(h), *parse_int(m)};
    if (time.hour > 23 || time.minute > 59) return std::nullopt;
    return time;
}

auto parse_repeater(std::string_view token, Date date,
                    std::optional<Time> time, char lead) -> RepeaterResult {
    auto result = RepeaterResult{date, time, std::nullopt};

    auto kind = RepeaterKind::cumulate;
    auto body = token;
    if (lead == '.') {
        if (!body.starts_with(".+")) return result;
        kind = RepeaterKind::restart;
        body.remove_prefix(2);
    } else if (lead == '+') {
        if (body.starts_with("++")) {
            kind = RepeaterKind::catch_up;
            body.remove_prefix(2);
        } else if (body.starts_with("+")) {
            body.remove_prefix(1);
        } else {
            return result;
        }
    } else {
        return result;
    }

    // N followed by a single unit letter.
    if (body.size() < 2) return result;
    const auto unit = unit_from_char(body.back());
    const auto digits = body.substr(0, body.size() - 1);
    const auto value = all_digits(digits) ? parse_int(digits) : std::optional<int>{};
    if (!unit || !value) return result;

    result.repeater = Repeater{kind, *value, *unit};
    return result;
}

}  // namespace orginline_cpp
