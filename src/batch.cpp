#include <orginline-cpp/session.hpp>

#include <plog/Log.h>
#include <taskflow/algorithm/for_each.hpp>
#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace orginline_cpp {

namespace {

// Work-stealing pool shared by every batch in the process, sized to
// std::thread::hardware_concurrency(). Created on first use.
auto batch_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // anonymous namespace

auto parse_batch(std::span<const std::string> inputs,
                 const ParseOptions& options) -> std::vector<Nodes> {
    auto results = std::vector<Nodes>(inputs.size());
    if (inputs.empty()) return results;

    // Reject bad options on the calling thread, before any task runs.
    [[maybe_unused]] const auto validated = Session{options};

    PLOGD << "inline: parsing batch of " << inputs.size() << " inputs";

    // Sessions are per input so anonymous footnote names depend only on
    // the input itself, never on scheduling.
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, inputs.size(), std::size_t{1},
        [&](std::size_t i) {
            auto session = Session{options};
            results[i] = session.parse(inputs[i]);
        });
    batch_executor().run(taskflow).get();

    return results;
}

}  // namespace orginline_cpp
