// apply_test.cpp: patch application with plain and semantic paths

#include <spatch/apply.hpp>
#include <spatch/json.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace spatch;

namespace {

auto path(std::string_view text) -> Path {
    return Path::parse(text).value();
}

auto doc() -> Value {
    return Value::parse(R"({
        "list": [{"id": "a", "v": 1}, {"id": "b", "v": 2}],
        "obj": {"x": 1},
        "n": 5
    })");
}

auto apply_ok(const Value& root, const Patch& patch) -> Value {
    auto result = spatch::apply(root, patch);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().describe());
    return result ? *result : Value();
}

auto apply_error(const Value& root, const Patch& patch) -> ErrorKind {
    auto result = spatch::apply(root, patch);
    EXPECT_FALSE(result.has_value()) << (result ? result->dump() : "");
    return result ? ErrorKind::invalid_patch : result.error().kind;
}

}  // namespace

// =============================================================================
// add
// =============================================================================

TEST(ApplyAdd, object_member) {
    auto out = apply_ok(doc(), {PatchAdd{path("/obj/y"), 2}});
    EXPECT_EQ(out["obj"], Value::parse(R"({"x": 1, "y": 2})"));
}

TEST(ApplyAdd, overwrites_existing_member) {
    auto out = apply_ok(doc(), {PatchAdd{path("/obj/x"), "new"}});
    EXPECT_EQ(out["obj"]["x"], "new");
}

TEST(ApplyAdd, array_insert_and_append) {
    auto base = Value::parse("[1, 2]");
    EXPECT_EQ(apply_ok(base, {PatchAdd{path("/0"), 0}}), Value::parse("[0, 1, 2]"));
    EXPECT_EQ(apply_ok(base, {PatchAdd{path("/2"), 3}}), Value::parse("[1, 2, 3]"));
    EXPECT_EQ(apply_ok(base, {PatchAdd{path("/-"), 3}}), Value::parse("[1, 2, 3]"));
}

TEST(ApplyAdd, index_past_end) {
    EXPECT_EQ(apply_error(Value::parse("[1]"), {PatchAdd{path("/2"), 0}}),
              ErrorKind::index_out_of_range);
}

TEST(ApplyAdd, non_index_key_into_array) {
    EXPECT_EQ(apply_error(Value::parse("[1]"), {PatchAdd{path("/x"), 0}}),
              ErrorKind::type_mismatch);
    EXPECT_EQ(apply_error(Value::parse("[1]"), {PatchAdd{path("/01"), 0}}),
              ErrorKind::type_mismatch);
}

TEST(ApplyAdd, into_scalar) {
    EXPECT_EQ(apply_error(doc(), {PatchAdd{path("/n/x"), 0}}), ErrorKind::type_mismatch);
}

TEST(ApplyAdd, missing_parent) {
    EXPECT_EQ(apply_error(doc(), {PatchAdd{path("/missing/x"), 0}}), ErrorKind::not_found);
}

TEST(ApplyAdd, root_replaces_document) {
    EXPECT_EQ(apply_ok(doc(), {PatchAdd{Path{}, "whole"}}), "whole");
}

TEST(ApplyAdd, through_selector) {
    auto out = apply_ok(doc(), {PatchAdd{path("/list/[id=b]/w"), true}});
    EXPECT_EQ(out["list"][1], Value::parse(R"({"id": "b", "v": 2, "w": true})"));
}

TEST(ApplyAdd, selector_target_upserts) {
    auto replaced = apply_ok(doc(), {PatchAdd{path("/list/[id=a]"), Value::parse(R"({"id": "a", "v": 9})")}});
    EXPECT_EQ(replaced["list"][0]["v"], 9);
    EXPECT_EQ(replaced["list"].size(), 2u);

    auto appended = apply_ok(doc(), {PatchAdd{path("/list/[id=c]"), Value::parse(R"({"id": "c"})")}});
    EXPECT_EQ(appended["list"].size(), 3u);
    EXPECT_EQ(appended["list"][2]["id"], "c");
}

TEST(ApplyAdd, selector_target_value_must_carry_identity) {
    EXPECT_EQ(apply_error(doc(), {PatchAdd{path("/list/[id=c]"), Value::parse(R"({"id": "d"})")}}),
              ErrorKind::invalid_use);
}

// =============================================================================
// remove / replace
// =============================================================================

TEST(ApplyRemove, member_and_element) {
    auto out = apply_ok(doc(), {PatchRemove{path("/obj/x")}, PatchRemove{path("/list/0")}});
    EXPECT_EQ(out["obj"], Value::object());
    EXPECT_EQ(out["list"], Value::parse(R"([{"id": "b", "v": 2}])"));
}

TEST(ApplyRemove, by_selector) {
    auto out = apply_ok(doc(), {PatchRemove{path("/list/[id=a]")}});
    EXPECT_EQ(out["list"], Value::parse(R"([{"id": "b", "v": 2}])"));
}

TEST(ApplyRemove, missing_target) {
    EXPECT_EQ(apply_error(doc(), {PatchRemove{path("/nope")}}), ErrorKind::not_found);
    EXPECT_EQ(apply_error(doc(), {PatchRemove{path("/list/5")}}), ErrorKind::index_out_of_range);
}

TEST(ApplyRemove, root_is_invalid) {
    EXPECT_EQ(apply_error(doc(), {PatchRemove{Path{}}}), ErrorKind::invalid_use);
}

TEST(ApplyReplace, existing_value) {
    auto out = apply_ok(doc(), {PatchReplace{path("/list/[id=b]/v"), 200}});
    EXPECT_EQ(out["list"][1]["v"], 200);
}

TEST(ApplyReplace, target_must_exist) {
    EXPECT_EQ(apply_error(doc(), {PatchReplace{path("/obj/y"), 1}}), ErrorKind::not_found);
}

TEST(ApplyReplace, root) {
    EXPECT_EQ(apply_ok(doc(), {PatchReplace{Path{}, 1}}), 1);
}

// =============================================================================
// move / copy
// =============================================================================

TEST(ApplyMove, between_members) {
    auto out = apply_ok(doc(), {PatchMove{path("/obj/x"), path("/moved")}});
    EXPECT_FALSE(out["obj"].contains("x"));
    EXPECT_EQ(out["moved"], 1);
}

TEST(ApplyMove, within_array_uses_post_removal_index) {
    auto out = apply_ok(Value::parse("[1, 2, 3, 4]"), {PatchMove{path("/0"), path("/3")}});
    EXPECT_EQ(out, Value::parse("[2, 3, 4, 1]"));
}

TEST(ApplyMove, by_selector) {
    auto out = apply_ok(doc(), {PatchMove{path("/list/[id=b]"), path("/list/0")}});
    EXPECT_EQ(out["list"][0]["id"], "b");
    EXPECT_EQ(out["list"][1]["id"], "a");
}

TEST(ApplyMove, into_own_child) {
    auto base = Value::parse(R"({"a": {"b": {}}})");
    EXPECT_EQ(apply_error(base, {PatchMove{path("/a"), path("/a/b")}}), ErrorKind::move_into_self);
}

TEST(ApplyMove, into_own_child_through_selector) {
    EXPECT_EQ(apply_error(doc(), {PatchMove{path("/list/0"), path("/list/[id=a]/inner")}}),
              ErrorKind::move_into_self);
}

TEST(ApplyMove, onto_itself_is_noop) {
    auto d = doc();
    EXPECT_EQ(apply_ok(d, {PatchMove{path("/obj"), path("/obj")}}), d);
    EXPECT_EQ(apply_ok(d, {PatchMove{path("/list/1"), path("/list/[id=b]")}}), d);
}

TEST(ApplyCopy, deep_copy) {
    auto out = apply_ok(doc(), {PatchCopy{path("/obj"), path("/copy")},
                                PatchReplace{path("/copy/x"), 2}});
    EXPECT_EQ(out["obj"]["x"], 1);
    EXPECT_EQ(out["copy"]["x"], 2);
}

TEST(ApplyCopy, missing_source) {
    EXPECT_EQ(apply_error(doc(), {PatchCopy{path("/nope"), path("/copy")}}), ErrorKind::not_found);
}

// =============================================================================
// test
// =============================================================================

TEST(ApplyTest, semantic_equality) {
    auto base = Value::parse(R"({"o": {"a": 1, "b": 2.0}})");
    auto out = spatch::apply(base, {PatchTest{path("/o"), Value::parse(R"({"b": 2, "a": 1.0})")}});
    EXPECT_TRUE(out.has_value());
}

TEST(ApplyTest, mismatch_is_test_failed) {
    EXPECT_EQ(apply_error(doc(), {PatchTest{path("/n"), "5"}}), ErrorKind::test_failed);
}

// =============================================================================
// Atomicity and ordering
// =============================================================================

TEST(Apply, operations_see_previous_results) {
    auto out = apply_ok(Value::object(), {
        PatchAdd{path("/a"), Value::array()},
        PatchAdd{path("/a/-"), Value::parse(R"({"id": 1})")},
        PatchAdd{path("/a/[id=1]/name"), "one"},
    });
    EXPECT_EQ(out, Value::parse(R"({"a": [{"id": 1, "name": "one"}]})"));
}

TEST(Apply, failure_leaves_input_untouched) {
    auto d = doc();
    auto before = d;
    auto result = spatch::apply(d, {PatchRemove{path("/n")}, PatchRemove{path("/missing")}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(d, before);
    EXPECT_NE(result.error().message.find("operation 1"), std::string::npos);
}

TEST(Apply, ambiguous_selector) {
    auto base = Value::parse(R"({"l": [{"k": 1}, {"k": 1}]})");
    EXPECT_EQ(apply_error(base, {PatchReplace{path("/l/[k=1]"), 0}}), ErrorKind::ambiguous);
}

TEST(Apply, empty_patch_is_identity) {
    auto d = doc();
    EXPECT_EQ(apply_ok(d, {}), d);
}
