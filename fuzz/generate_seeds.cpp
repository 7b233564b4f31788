// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <spatch/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

static void write_json(const std::string& path, const spatch::Value& value) {
    write_seed(path, value.dump());
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    for (auto sub : {"/path", "/apply", "/diff"}) fs::create_directories(dir + sub);

    // Paths: plain, escaped, selectors of every value kind
    write_seed(dir + "/path/seed_root.txt", "");
    write_seed(dir + "/path/seed_plain.txt", "/a/0/b/-");
    write_seed(dir + "/path/seed_escaped.txt", "/a~1b/m~0n");
    write_seed(dir + "/path/seed_selector.txt", "/list/[id=item-1]/value");
    write_seed(dir + "/path/seed_typed_selector.txt", "/l/[n=42]/[b=true]/[s=\"42\"]");

    // Apply: one document per operation kind
    const auto doc = spatch::Value::parse(R"({"list": [{"id": "a", "v": 1}, {"id": "b", "v": 2}], "o": {"x": 1}})");
    const auto patches = {
        R"([{"op": "add", "path": "/list/-", "value": {"id": "c"}}])",
        R"([{"op": "remove", "path": "/list/[id=a]"}])",
        R"([{"op": "replace", "path": "/list/[id=b]/v", "value": 3}])",
        R"([{"op": "move", "from": "/list/1", "path": "/list/0"}])",
        R"([{"op": "copy", "from": "/o", "path": "/p"}])",
        R"([{"op": "test", "path": "/o/x", "value": 1}])",
    };
    auto n = 0;
    for (auto patch : patches) {
        write_json(dir + "/apply/seed_" + std::to_string(n++) + ".json",
                   spatch::Value{{"doc", doc}, {"patch", spatch::Value::parse(patch)}});
    }

    // Diff: positional, then keyed with a reorder
    write_json(dir + "/diff/seed_positional.json", spatch::Value::parse(R"({
        "old": {"a": [1, 2, 3], "b": {"c": null}},
        "new": {"a": [1, 3], "b": {"c": false, "d": "x"}}
    })"));
    write_json(dir + "/diff/seed_keyed.json", spatch::Value::parse(R"({
        "old": {"list": [{"id": 1, "v": "a"}, {"id": 2, "v": "b"}, {"id": 3}]},
        "new": {"list": [{"id": 3}, {"id": 1, "v": "A"}, {"id": 4}]},
        "schema": {"properties": {"list": {"type": "array", "indexKey": "id"}}}
    })"));

    return 0;
}
