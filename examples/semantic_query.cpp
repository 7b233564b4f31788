// semantic_query: addressing array elements by identity
//
// Resolves [field=value] selectors, prints the positional and semantic
// forms of the same location, and shows the ambiguous and not_found cases.
//
// Build: cmake --build build
// Run:   ./build/example_semantic_query

#include <spatch/spatch.hpp>

#include <cstdio>

int main() {
    auto doc = spatch::Value::parse(R"({
        "users": [
            {"name": "ann", "roles": [{"role": "admin"}, {"role": "dev"}]},
            {"name": "bob", "roles": [{"role": "dev"}]},
            {"name": "bob", "roles": []}
        ]
    })");

    auto schema = spatch::SchemaIndex::build(spatch::Value::parse(R"({
        "properties": {
            "users": {
                "type": "array",
                "indexKey": "name",
                "items": {"properties": {"roles": {"type": "array", "indexKey": "role"}}}
            }
        }
    })")).value();

    std::printf("Schema keys %zu array location(s)\n", schema.size());
    for (const auto& [location, key] : schema.entries()) {
        std::printf("  %s -> %s\n", spatch::to_string(location).c_str(), key.c_str());
    }

    // -- Selector lookups -----------------------------------------------------
    for (auto text : {"/users/[name=ann]/roles/[role=dev]", "/users/0/roles/0"}) {
        auto path = spatch::Path::parse(text).value();
        auto resolved = spatch::resolve(doc, path, &schema);
        if (!resolved) {
            std::printf("%s: %s\n", text, resolved.error().describe().c_str());
            continue;
        }
        std::printf("%s\n  value:      %s\n  positional: %s\n  semantic:   %s\n", text,
                    resolved->value->dump().c_str(),
                    resolved->positional.to_string().c_str(),
                    resolved->semantic.to_string().c_str());
    }

    // -- Failures -------------------------------------------------------------
    for (auto text : {"/users/[name=bob]", "/users/[name=eve]", "/users/-"}) {
        auto value = spatch::query(doc, text);
        if (!value) std::printf("%s: %s\n", text, value.error().describe().c_str());
    }

    return 0;
}
