/// @file datetime.hpp
/// @brief Calendar date, clock time and repeater types, plus the
///        date/time sub-grammar consumed by timestamp parsing.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

namespace orginline_cpp {

/// A calendar date as written in a timestamp (`2018-10-16`).
struct Date {
    int year{0};
    int month{0};  ///< 1..12
    int day{0};    ///< 1..31

    auto operator<=>(const Date&) const = default;
    auto operator==(const Date&) const -> bool = default;
};

/// A wall-clock time as written in a timestamp (`21:20`).
struct Time {
    int hour{0};    ///< 0..23
    int minute{0};  ///< 0..59

    auto operator<=>(const Time&) const = default;
    auto operator==(const Time&) const -> bool = default;
};

/// How a repeating timestamp advances.
enum class RepeaterKind : std::uint8_t {
    cumulate,  ///< `+1w`: shift by the interval once per occurrence.
    catch_up,  ///< `++1w`: shift until the date is in the future.
    restart,   ///< `.+1w`: shift from today.
};

/// The unit of a repeater interval.
enum class DurationUnit : std::uint8_t {
    hour,
    day,
    week,
    month,
    year,
};

/// Convert a RepeaterKind to its string representation.
constexpr auto to_string_view(RepeaterKind kind) noexcept -> std::string_view {
    switch (kind) {
        case RepeaterKind::cumulate: return "cumulate";
        case RepeaterKind::catch_up: return "catch_up";
        case RepeaterKind::restart:  return "restart";
    }
    return "unknown";
}

/// Convert a DurationUnit to its string representation.
constexpr auto to_string_view(DurationUnit unit) noexcept -> std::string_view {
    switch (unit) {
        case DurationUnit::hour:  return "hour";
        case DurationUnit::day:   return "day";
        case DurationUnit::week:  return "week";
        case DurationUnit::month: return "month";
        case DurationUnit::year:  return "year";
    }
    return "unknown";
}

/// A repetition rule (`+1w`, `++2d`, `.+1m`).
struct Repeater {
    RepeaterKind kind{RepeaterKind::cumulate};
    int value{0};
    DurationUnit unit{DurationUnit::day};

    auto operator==(const Repeater&) const -> bool = default;
};

/// The date/time content of one bracketed timestamp.
struct Stamp {
    Date date;
    std::optional<Time> time;
    std::optional<Repeater> repeater;
    bool active{false};  ///< `<...>` is active, `[...]` is inactive.

    auto operator==(const Stamp&) const -> bool = default;
};

// -- Sub-grammar --------------------------------------------------------------

/// Parse `YYYY-MM-DD`. Returns nullopt on any other shape or an
/// out-of-range month or day.
auto parse_date(std::string_view s) -> std::optional<Date>;

/// Parse `H:MM` or `HH:MM`. Returns nullopt on any other shape or an
/// out-of-range hour or minute.
auto parse_time(std::string_view s) -> std::optional<Time>;

/// Date, time and repetition resolved from a repeater token.
struct RepeaterResult {
    Date date;
    std::optional<Time> time;
    std::optional<Repeater> repeater;

    auto operator==(const RepeaterResult&) const -> bool = default;
};

/// Resolve a repeater token against the date and time already parsed.
///
/// @param token The full token, including its lead characters (`+1w`).
/// @param date The date preceding the token.
/// @param time The time preceding the token, if any.
/// @param lead The first character of the token (`+` or `.`).
/// @return The date and time unchanged, with the repetition rule when the
///   token is well formed and without one otherwise.
auto parse_repeater(std::string_view token, Date date,
                    std::optional<Time> time, char lead) -> RepeaterResult;

}  // namespace orginline_cpp
