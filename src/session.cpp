#include <orginline-cpp/error.hpp>
#include <orginline-cpp/session.hpp>

#include "grammar/grammar.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace orginline_cpp {

namespace {

auto validated(ParseOptions options) -> ParseOptions {
    if (options.anonymous_footnote_prefix.empty()) {
        throw std::invalid_argument{
            std::string{to_string_view(ErrorKind::invalid_option)} +
            ": anonymous footnote prefix must not be empty"};
    }
    return options;
}

}  // anonymous namespace

Session::Session() : Session{ParseOptions{}} {}

Session::Session(ParseOptions options)
    : options_{validated(std::move(options))} {}

auto Session::parse(std::string_view input) -> Nodes {
    auto ctx = detail::Context{
        options_.grammars,
        options_.entities.get(),
        options_.anonymous_footnote_prefix,
        &footnote_counter_,
    };
    return detail::parse_sequence(ctx, input, GrammarSet::all());
}

auto parse(std::string_view input, const ParseOptions& options) -> Nodes {
    auto session = Session{options};
    return session.parse(input);
}

}  // namespace orginline_cpp
