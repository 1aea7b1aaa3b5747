// Fuzz target for the inline grammar. Parsing must accept every input
// without throwing and must always return a normalized sequence.

#include <orginline-cpp/orginline.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    auto session = orginline_cpp::Session{};
    const auto nodes = session.parse(input);

    if (size > 0 && nodes.empty()) __builtin_trap();
    if (!orginline_cpp::is_normalized(nodes)) __builtin_trap();

    auto text = orginline_cpp::to_plain_text(nodes);
    (void)text;

    return 0;
}
