// parse_line -- parses each argument (or each line of stdin) and prints
// the inline tree as JSON, followed by its plain-text projection.
//
// Pass -v as the first argument to see per-grammar diagnostics.
//
// Build: cmake --build build
// Run:   ./build/parse_line "*bold* and [[https://x.org][a link]]"

#include <orginline-cpp/json.hpp>
#include <orginline-cpp/orginline.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace oi = orginline_cpp;

namespace {

void print_parse(oi::Session& session, std::string_view line) {
    const auto nodes = session.parse(line);
    std::printf("%s\n", oi::nodes_to_json(nodes).dump(2).c_str());
    std::printf("plain text: %s\n\n", oi::to_plain_text(nodes).c_str());
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto args = std::vector<std::string>(argv + 1, argv + argc);
    auto level = plog::warning;
    if (!args.empty() && args.front() == "-v") {
        level = plog::verbose;
        args.erase(args.begin());
    }

    static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
    plog::init(level, &console_appender);

    try {
        // One session for the whole run, so anonymous footnotes stay unique.
        auto session = oi::Session{};
        if (!args.empty()) {
            for (const auto& arg : args) print_parse(session, arg);
        } else {
            auto line = std::string{};
            while (std::getline(std::cin, line)) print_parse(session, line);
        }
        PLOGD << "generated " << session.anonymous_footnote_count()
              << " anonymous footnote names";
    } catch (const std::exception& ex) {
        PLOGE << "parse_line failed: " << ex.what();
        return 1;
    }
    return 0;
}
