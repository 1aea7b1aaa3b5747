/// @file session.hpp
/// @brief The Session class -- the primary API for orginline-cpp.

#pragma once

#include <orginline-cpp/node.hpp>
#include <orginline-cpp/options.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orginline_cpp {

/// A parsing session over one document.
///
/// The session owns the state that outlives a single grammar call: the
/// anonymous footnote counter. Names generated by one session never
/// repeat; separate sessions count independently and may run on
/// different threads at the same time.
///
/// Parsing never fails. Malformed markup degrades to literal text and
/// every input character is accounted for by some node.
///
/// @code
/// auto session = Session{};
/// auto nodes = session.parse("*bold /italic/ bold* and [[https://x.org][a link]]");
/// @endcode
class Session {
public:
    /// A session with default options.
    Session();

    /// A session with the given options.
    /// @throws std::invalid_argument if the anonymous footnote prefix is empty.
    explicit Session(ParseOptions options);

    /// Parse one line or paragraph fragment into a normalized sequence.
    auto parse(std::string_view input) -> Nodes;

    /// The options this session was created with.
    auto options() const -> const ParseOptions& { return options_; }

    /// Number of anonymous footnote names generated so far.
    auto anonymous_footnote_count() const -> std::uint64_t { return footnote_counter_; }

private:
    ParseOptions options_;
    std::uint64_t footnote_counter_{0};
};

/// Parse an input in a fresh session.
auto parse(std::string_view input, const ParseOptions& options = {}) -> Nodes;

/// Parse independent inputs in parallel, one fresh session per input.
///
/// Results are in input order and equal to parsing each input with
/// parse(input, options).
auto parse_batch(std::span<const std::string> inputs,
                 const ParseOptions& options = {}) -> std::vector<Nodes>;

/// Merge consecutive Plain nodes, left to right. Child sequences are
/// left untouched.
auto normalize(Nodes nodes) -> Nodes;

}  // namespace orginline_cpp
