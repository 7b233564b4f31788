// keyed_diff: positional versus identity-keyed diffs of the same edit
//
// A task list is reordered, one task is dropped, one added and one edited.
// Without a schema every shifted element shows up as a change; with
// indexKey "id" the patch names each task by its id.
//
// Build: cmake --build build
// Run:   ./build/example_keyed_diff

#include <spatch/spatch.hpp>

#include <cstdio>

int main() {
    auto before = spatch::Value::parse(R"({"tasks": [
        {"id": "t1", "title": "write parser", "done": true},
        {"id": "t2", "title": "write diff", "done": false},
        {"id": "t3", "title": "write docs", "done": false}
    ]})");
    auto after = spatch::Value::parse(R"({"tasks": [
        {"id": "t3", "title": "write docs", "done": false},
        {"id": "t2", "title": "write diff", "done": true},
        {"id": "t4", "title": "release", "done": false}
    ]})");

    auto schema = spatch::SchemaIndex::build(spatch::Value::parse(R"({
        "properties": {"tasks": {"type": "array", "indexKey": "id"}}
    })")).value();

    auto positional = spatch::diff_patch(before, after);
    auto keyed = spatch::diff_patch(before, after, &schema);
    if (!positional || !keyed) {
        std::printf("diff failed\n");
        return 1;
    }

    std::printf("Without schema (%zu ops):\n%s\n\n", positional->size(), positional->dump(2).c_str());
    std::printf("With indexKey (%zu ops):\n%s\n\n", keyed->size(), keyed->dump(2).c_str());

    auto applied = spatch::apply_patch(before, *keyed);
    std::printf("Keyed patch reproduces the new list: %s\n",
                applied && spatch::equal(*applied, after) ? "yes" : "no");

    // -- Duplicate ids are reported, not guessed around -----------------------
    auto clash = spatch::Value::parse(R"({"tasks": [{"id": "t1"}, {"id": "t1"}]})");
    auto conflict = spatch::diff_patch(clash, before, &schema);
    if (!conflict) {
        std::printf("Conflict: %s\n", conflict.error().describe().c_str());
    }

    return 0;
}
