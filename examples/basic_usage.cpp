// basic_usage: demonstrates the core spatch API
//
// Parses paths, queries a document, diffs two documents into an RFC 6902
// patch, applies it, and shows how errors come back as typed values.
//
// Build: cmake --build build
// Run:   ./build/example_basic_usage

#include <spatch/spatch.hpp>

#include <cstdio>
#include <string>

int main() {
    auto before = spatch::Value::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread"],
        "config": {"theme": "dark", "lang": "en"}
    })");

    // -- Paths ----------------------------------------------------------------
    auto path = spatch::Path::parse("/items/1");
    if (path) {
        std::printf("Parsed %s (%zu segments)\n", path->to_string().c_str(), path->size());
    }

    auto bad = spatch::Path::parse("items/1");
    if (!bad) {
        std::printf("Rejected: %s\n", bad.error().describe().c_str());
    }

    // -- Queries --------------------------------------------------------------
    if (auto theme = spatch::query(before, "/config/theme")) {
        std::printf("Theme: %s\n", theme->get<std::string>().c_str());
    }

    // -- Diff -----------------------------------------------------------------
    auto after = before;
    after["items"][1] = "Butter";
    after["items"].push_back("Jam");
    after["config"].erase("lang");

    auto patch = spatch::diff_patch(before, after);
    if (!patch) {
        std::printf("diff failed: %s\n", patch.error().describe().c_str());
        return 1;
    }
    std::printf("Patch:\n%s\n", patch->dump(2).c_str());

    // -- Apply ----------------------------------------------------------------
    auto applied = spatch::apply_patch(before, *patch);
    if (!applied) {
        std::printf("apply failed: %s\n", applied.error().describe().c_str());
        return 1;
    }
    std::printf("Round trip equal: %s\n", spatch::equal(*applied, after) ? "yes" : "no");

    // -- Failed test operations leave the input untouched ---------------------
    auto guarded = spatch::Value::parse(R"([
        {"op": "test", "path": "/title", "value": "Groceries"},
        {"op": "remove", "path": "/items"}
    ])");
    auto refused = spatch::apply_patch(before, guarded);
    if (!refused) {
        std::printf("Refused (%s): %s\n",
                    std::string{spatch::to_string_view(refused.error().category())}.c_str(),
                    refused.error().message.c_str());
    }

    return 0;
}
