// orginline-cpp benchmarks -- measures throughput of the inline grammar.

#include <orginline-cpp/orginline.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace orginline_cpp;

namespace {

const auto rich_line = std::string{
    "*bold /italic/ bold* and [[https://orgmode.org][the manual]] with "
    "SCHEDULED: <2020-01-01 Wed 9:00 +1w> [3/10] [fn::a note] \\alpha $x^2$ "
    "{{{macro(a, b)}}} <<target>> ~code~ =verbatim= H_{2}O e^{n}"};

const auto prose_line = std::string{
    "The quick brown fox jumps over the lazy dog, again and again, while the "
    "reader wonders whether any markup at all will ever turn up in this line."};

auto make_document(std::size_t lines) -> std::string {
    auto doc = std::string{};
    for (std::size_t i = 0; i < lines; ++i) {
        doc += (i % 2 == 0) ? rich_line : prose_line;
        doc += '\n';
    }
    return doc;
}

}  // anonymous namespace

// =============================================================================
// Single-line parsing
// =============================================================================

static void bm_parse_plain_prose(benchmark::State& state) {
    for (auto _ : state) {
        auto nodes = parse(prose_line);
        benchmark::DoNotOptimize(nodes);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * prose_line.size()));
}
BENCHMARK(bm_parse_plain_prose);

static void bm_parse_rich_line(benchmark::State& state) {
    for (auto _ : state) {
        auto nodes = parse(rich_line);
        benchmark::DoNotOptimize(nodes);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * rich_line.size()));
}
BENCHMARK(bm_parse_rich_line);

static void bm_parse_deep_emphasis(benchmark::State& state) {
    const auto depth = static_cast<std::size_t>(state.range(0));
    const auto delims = std::string{"*/_+"};
    auto input = std::string{"x"};
    for (std::size_t i = 0; i < depth; ++i) {
        const auto d = delims[i % delims.size()];
        input = std::string{d} + "a " + input + " b" + d;
    }
    for (auto _ : state) {
        auto nodes = parse(input);
        benchmark::DoNotOptimize(nodes);
    }
}
BENCHMARK(bm_parse_deep_emphasis)->Range(1, 32);

// =============================================================================
// Documents
// =============================================================================

static void bm_parse_document(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    auto session = Session{};
    for (auto _ : state) {
        auto nodes = session.parse(doc);
        benchmark::DoNotOptimize(nodes);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * doc.size()));
}
BENCHMARK(bm_parse_document)->Range(8, 512);

static void bm_parse_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto inputs = std::vector<std::string>{};
    for (std::size_t i = 0; i < n; ++i) inputs.push_back(make_document(16));
    for (auto _ : state) {
        auto results = parse_batch(inputs);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_parse_batch)->Range(8, 256)->UseRealTime();

// =============================================================================
// Projection
// =============================================================================

static void bm_to_plain_text(benchmark::State& state) {
    const auto nodes = parse(make_document(64));
    for (auto _ : state) {
        auto text = to_plain_text(nodes);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_to_plain_text);
