// Fuzz target for Path::parse(): any accepted path must print back to
// text that parses to the same path.

#include <spatch/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    auto path = spatch::Path::parse(text);
    if (!path) return 0;

    auto printed = path->to_string();
    auto reparsed = spatch::Path::parse(printed);
    if (!reparsed || *reparsed != *path) __builtin_trap();
    if (reparsed->to_string() != printed) __builtin_trap();

    return 0;
}
