#include "grammar.hpp"
#include "scan.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orginline_cpp::detail {

namespace {

// Characters that end a bare link besides whitespace.
auto is_bare_link_delimiter(char c) -> bool {
    switch (c) {
        case '[': case ']': case '<': case '>':
        case '{': case '}': case '(': case ')':
        case '*': case '$':
            return true;
        default:
            return false;
    }
}

}  // anonymous namespace

auto classify_url(std::string_view url) -> Url {
    if (!url.empty() && (url.front() == '/' || url.front() == '.')) {
        return File{std::string{url}};
    }
    // protocol:link, both parts non-empty; the link stops at a line break.
    const auto colon = url.find(':');
    if (colon != std::string_view::npos && colon > 0) {
        auto link = url.substr(colon + 1);
        link = link.substr(0, link.find('\n'));
        if (!link.empty()) {
            return Complex{std::string{url.substr(0, colon)}, std::string{link}};
        }
    }
    return Search{std::string{url}};
}

auto starts_bare_link(std::string_view input) -> bool {
    const auto len = span_while(input, 0, is_letter);
    return len > 0 && input.substr(len).starts_with("://");
}

// [[url]] or [[url][label]]
auto try_link(Context& ctx, std::string_view input) -> std::optional<Match> {
    if (!input.starts_with("[[")) return std::nullopt;

    auto pos = std::size_t{2};
    const auto url_len = span_while(input, pos, [](char c) { return c != ']'; });
    if (url_len == 0) return std::nullopt;
    const auto url = input.substr(pos, url_len);
    pos += url_len;

    auto label = std::string_view{};
    if (input.substr(pos).starts_with("][")) {
        pos += 2;
        const auto label_len = span_while(input, pos, [](char c) { return c != ']'; });
        label = input.substr(pos, label_len);
        pos += label_len;
    }
    if (!input.substr(pos).starts_with("]]")) return std::nullopt;
    pos += 2;

    auto link = Link{};
    link.url = classify_url(url);
    if (!label.empty()) {
        link.label = parse_sequence(ctx, label, link_label_grammars);
    }
    return Match{std::move(link), pos};
}

// protocol://rest
auto try_bare_link(Context&, std::string_view input) -> std::optional<Match> {
    const auto protocol_len = span_while(input, 0, is_letter);
    if (protocol_len == 0 || !input.substr(protocol_len).starts_with("://")) {
        return std::nullopt;
    }
    const auto rest_start = protocol_len + 3;
    const auto rest_len = span_while(input, rest_start, [](char c) {
        return !is_space(c) && !is_bare_link_delimiter(c);
    });
    if (rest_len == 0) return std::nullopt;

    const auto protocol = input.substr(0, protocol_len);
    const auto rest = input.substr(rest_start, rest_len);
    const auto consumed = rest_start + rest_len;

    auto link = Link{};
    link.url = Complex{std::string{protocol}, "//" + std::string{rest}};
    link.label.emplace_back(Plain{std::string{input.substr(0, consumed)}});
    return Match{std::move(link), consumed};
}

}  // namespace orginline_cpp::detail
