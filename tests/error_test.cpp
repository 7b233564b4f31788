#include <spatch/error.hpp>
#include <spatch/result.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace spatch;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::missing_leading_slash), "missing_leading_slash");
    EXPECT_EQ(to_string_view(ErrorKind::empty_segment),         "empty_segment");
    EXPECT_EQ(to_string_view(ErrorKind::unterminated_escape),   "unterminated_escape");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_escape),        "invalid_escape");
    EXPECT_EQ(to_string_view(ErrorKind::malformed_selector),    "malformed_selector");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),             "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::ambiguous),             "ambiguous");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),         "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_use),           "invalid_use");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_index_key),     "invalid_index_key");
    EXPECT_EQ(to_string_view(ErrorKind::identity_conflict),     "identity_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::index_out_of_range),    "index_out_of_range");
    EXPECT_EQ(to_string_view(ErrorKind::move_into_self),        "move_into_self");
    EXPECT_EQ(to_string_view(ErrorKind::test_failed),           "test_failed");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_patch),         "invalid_patch");
    EXPECT_EQ(to_string_view(ErrorKind::depth_limit_exceeded),  "depth_limit_exceeded");
}

TEST(ErrorKind, categories_group_kinds) {
    EXPECT_EQ(category_of(ErrorKind::empty_segment), ErrorCategory::parse);
    EXPECT_EQ(category_of(ErrorKind::malformed_selector), ErrorCategory::parse);
    EXPECT_EQ(category_of(ErrorKind::ambiguous), ErrorCategory::resolve);
    EXPECT_EQ(category_of(ErrorKind::invalid_use), ErrorCategory::resolve);
    EXPECT_EQ(category_of(ErrorKind::invalid_index_key), ErrorCategory::schema);
    EXPECT_EQ(category_of(ErrorKind::identity_conflict), ErrorCategory::diff);
    EXPECT_EQ(category_of(ErrorKind::move_into_self), ErrorCategory::apply);
    EXPECT_EQ(category_of(ErrorKind::test_failed), ErrorCategory::apply);
    EXPECT_EQ(category_of(ErrorKind::invalid_patch), ErrorCategory::patch_format);
    EXPECT_EQ(category_of(ErrorKind::depth_limit_exceeded), ErrorCategory::limits);
}

TEST(ErrorCategory, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorCategory::parse),        "parse");
    EXPECT_EQ(to_string_view(ErrorCategory::resolve),      "resolve");
    EXPECT_EQ(to_string_view(ErrorCategory::schema),       "schema");
    EXPECT_EQ(to_string_view(ErrorCategory::diff),         "diff");
    EXPECT_EQ(to_string_view(ErrorCategory::apply),        "apply");
    EXPECT_EQ(to_string_view(ErrorCategory::patch_format), "patch_format");
    EXPECT_EQ(to_string_view(ErrorCategory::limits),       "limits");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "no member 'a'"};
    const auto e2 = Error{ErrorKind::not_found, "no member 'a'"};
    const auto e3 = Error{ErrorKind::ambiguous, "no member 'a'"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
    EXPECT_NE(e1, (Error{ErrorKind::not_found, "no member 'b'"}));
}

TEST(Error, describe_prefixes_kind) {
    const auto e = Error{ErrorKind::test_failed, "value at '/a' is 1, expected 2"};
    EXPECT_EQ(e.describe(), "test_failed: value at '/a' is 1, expected 2");
    EXPECT_EQ(e.category(), ErrorCategory::apply);
}

// -- Result -------------------------------------------------------------------

TEST(Result, holds_value) {
    auto r = Result<int>{42};
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(*r, 42);
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, holds_error) {
    auto r = Result<std::string>{Error{ErrorKind::invalid_patch, "not an array"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_patch);
    EXPECT_EQ(r.error().message, "not an array");
}

TEST(Result, value_on_error_throws_exception_carrying_error) {
    auto r = Result<int>{Error{ErrorKind::not_found, "gone"}};
    try {
        (void)r.value();
        FAIL() << "expected spatch::Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.error().kind, ErrorKind::not_found);
        EXPECT_STREQ(e.what(), "not_found: gone");
    }
}

TEST(Result, arrow_reaches_members) {
    auto r = Result<std::string>{std::string{"abc"}};
    EXPECT_EQ(r->size(), 3u);
}
