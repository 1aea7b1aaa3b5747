// batch_demo -- parses a small document line by line in parallel and
// summarizes what each line contains.
//
// Build: cmake --build build
// Run:   ./build/batch_demo

#include <orginline-cpp/orginline.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oi = orginline_cpp;

namespace {

// Count node types through the whole tree.
void count_types(const oi::Nodes& nodes, std::map<std::string_view, int>& counts) {
    for (const auto& n : nodes) {
        ++counts[n.type_name()];
        std::visit(oi::overload{
            [&](const oi::Emphasis& e) { count_types(e.children, counts); },
            [&](const oi::Link& l) { count_types(l.label, counts); },
            [&](const oi::Subscript& s) { count_types(s.children, counts); },
            [&](const oi::Superscript& s) { count_types(s.children, counts); },
            [&](const oi::FootnoteReference& f) {
                if (f.definition) count_types(*f.definition, counts);
            },
            [](const auto&) {},
        }, n.value);
    }
}

auto describe(const oi::Timestamp& ts) -> std::string {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", ts.start.date.year,
                  ts.start.date.month, ts.start.date.day);
    auto out = std::string{oi::to_string_view(ts.kind)} + " " + buf;
    if (ts.start.repeater) {
        out += " every " + std::to_string(ts.start.repeater->value) + " " +
               std::string{oi::to_string_view(ts.start.repeater->unit)};
    }
    return out;
}

}  // anonymous namespace

int main() {
    static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
    plog::init(plog::info, &console_appender);

    const auto lines = std::vector<std::string>{
        "* TODO Write the report [1/3]",
        "DEADLINE: <2024-03-01 Fri +1w>",
        "See [[https://orgmode.org][the manual]] and [[./notes.org]].",
        "Energy is $E = mc^2$, roughly \\alpha times \\beta[fn::made up].",
        "Use ~make~ or =cmake= to build; see <<build>>.",
        "{{{author}}} wrote this on [2024-02-20 Tue 18:00].",
    };

    const auto results = oi::parse_batch(lines);
    PLOGI << "parsed " << results.size() << " lines";

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::printf("%zu: %s\n", i + 1, lines[i].c_str());

        auto counts = std::map<std::string_view, int>{};
        count_types(results[i], counts);
        for (const auto& [type, count] : counts) {
            std::printf("     %-20.*s %d\n", static_cast<int>(type.size()), type.data(), count);
        }
        for (const auto& n : results[i]) {
            if (const auto* ts = n.get_if<oi::Timestamp>()) {
                std::printf("     -> %s\n", describe(*ts).c_str());
            }
        }
        std::printf("     text: %s\n", oi::to_plain_text(results[i]).c_str());
    }
    return 0;
}
