// Fuzz target for apply_patch(): input is {"doc": ..., "patch": ...}.
// Exercises decoding, selector resolution and every operation kind.

#include <spatch/json.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto input = spatch::Value::parse(data, data + size, nullptr, false);
    if (input.is_discarded() || !input.is_object()) return 0;
    if (!input.contains("doc") || !input.contains("patch")) return 0;

    auto options = spatch::Options{};
    options.max_depth = 64;

    const auto& doc = input["doc"];
    auto before = doc;
    auto result = spatch::apply_patch(doc, input["patch"], options);

    // The input document is never modified, whatever the outcome.
    if (doc != before) __builtin_trap();
    if (result) {
        auto printed = result->dump();
        (void)printed;
    }
    return 0;
}
