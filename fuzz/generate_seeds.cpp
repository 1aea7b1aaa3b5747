// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // One seed per construct, plus a few mixtures and near misses.
    const auto seeds = std::vector<std::pair<std::string, std::string>>{
        {"emphasis", "*bold /italic/ _under_ +strike+* text"},
        {"emphasis_near_miss", "* bold*x *bold *"},
        {"verbatim_code", "=verbatim= ~code~"},
        {"timestamp", "<2018-10-16 Tue 21:20 +1w>"},
        {"timestamp_keywords", "SCHEDULED: <2020-01-01> DEADLINE: [2020-01-02 Thu .+2d]"},
        {"clock_range", "CLOCK: [2020-01-01 Wed 10:00]--[2020-01-01 Wed 11:30]"},
        {"links", "[[./a.png]] [[https://x.org][label *b*]] https://bare.org/x"},
        {"footnotes", "[fn:1] [fn:name:def] [fn::anonymous]"},
        {"cookies", "[50%] [3/10] [1/2/3] [%]"},
        {"latex", "$x$ $$y$$ \\(z\\) \\[w\\]"},
        {"entities", "\\alpha \\rarr \\nosuch"},
        {"macros", "{{{m}}} {{{m()}}} {{{m(a, b)}}}"},
        {"targets", "<<t>> <<<r>>>"},
        {"export_snippet", "@@html:<b>@@"},
        {"scripts", "H_{2}O e^{\\pi}"},
        {"line_breaks", "a\nb\r\nc\rd"},
    };

    for (const auto& [name, text] : seeds) {
        write_seed(dir + "/seed_" + name + ".txt", text);
    }

    return 0;
}
