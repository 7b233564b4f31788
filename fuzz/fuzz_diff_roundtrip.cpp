// Fuzz target for compute_diff(): input is {"old": ..., "new": ...} with an
// optional "schema". Any diff that succeeds must apply back to "new", both
// directly and after rendering to RFC 6902 and decoding again.

#include <spatch/apply.hpp>
#include <spatch/diff.hpp>
#include <spatch/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto input = spatch::Value::parse(data, data + size, nullptr, false);
    if (input.is_discarded() || !input.is_object()) return 0;
    if (!input.contains("old") || !input.contains("new")) return 0;

    auto options = spatch::Options{};
    options.max_depth = 64;

    auto schema = std::optional<spatch::SchemaIndex>{};
    if (input.contains("schema")) {
        auto built = spatch::SchemaIndex::build(input["schema"]);
        if (!built) return 0;
        schema = std::move(*built);
    }
    const auto* index = schema ? &*schema : nullptr;

    const auto& old_value = input["old"];
    const auto& new_value = input["new"];
    auto ops = spatch::compute_diff(old_value, new_value, index, options);
    if (!ops) return 0;

    auto direct = spatch::apply(old_value, *ops, options);
    if (!direct || !spatch::equal(*direct, new_value)) __builtin_trap();

    auto wire = spatch::render(*ops, index, old_value, options);
    if (!wire) __builtin_trap();
    auto decoded = spatch::apply_patch(old_value, *wire, options);
    if (!decoded || !spatch::equal(*decoded, new_value)) __builtin_trap();

    return 0;
}
