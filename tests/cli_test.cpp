// cli_test.cpp: the spatch command line driven with in-memory streams

#include "commands.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace spatch;

namespace {

namespace fs = std::filesystem;

struct Outcome {
    int code;
    std::string out;
    std::string err;
};

auto run_cli(const std::vector<std::string>& args, const std::string& input = "") -> Outcome {
    auto in = std::istringstream{input};
    auto out = std::ostringstream{};
    auto err = std::ostringstream{};
    auto code = cli::run(args, in, out, err);
    return {code, out.str(), err.str()};
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("spatch_cli_" + std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
        fs::create_directories(dir_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        fs::remove_all(dir_, ec);
    }

    auto write(const std::string& name, const std::string& content) -> std::string {
        auto file = dir_ / name;
        std::ofstream{file} << content;
        return file.string();
    }

    fs::path dir_;
};

constexpr auto list_doc = R"({"list": [{"id": "a", "v": 1}, {"id": "b", "v": 2}]})";

}  // namespace

// =============================================================================
// Usage
// =============================================================================

TEST_F(CliTest, help_prints_usage) {
    auto r = run_cli({"--help"});
    EXPECT_EQ(r.code, cli::exit_ok);
    EXPECT_NE(r.out.find("usage: spatch"), std::string::npos);
    EXPECT_NE(r.out.find("--schema"), std::string::npos);
}

TEST_F(CliTest, missing_command) {
    auto r = run_cli({});
    EXPECT_EQ(r.code, cli::exit_usage);
    EXPECT_EQ(r.err.rfind("error: usage: missing command", 0), 0u);
}

TEST_F(CliTest, unknown_command) {
    auto r = run_cli({"merge", "a", "b"});
    EXPECT_EQ(r.code, cli::exit_usage);
    EXPECT_NE(r.err.find("unknown command 'merge'"), std::string::npos);
}

TEST_F(CliTest, unknown_option) {
    EXPECT_EQ(run_cli({"--bogus", "query", "/a"}).code, cli::exit_usage);
}

TEST_F(CliTest, wrong_argument_count) {
    EXPECT_EQ(run_cli({"diff", "only-one"}).code, cli::exit_usage);
    EXPECT_EQ(run_cli({"query"}).code, cli::exit_usage);
}

// =============================================================================
// query
// =============================================================================

TEST_F(CliTest, query_file) {
    auto doc = write("doc.json", list_doc);
    auto r = run_cli({"query", "/list/[id=b]/v", doc});
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(r.out, "2\n");
}

TEST_F(CliTest, query_stdin) {
    auto r = run_cli({"query", "/list/0"}, list_doc);
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(Value::parse(r.out), Value::parse(R"({"id": "a", "v": 1})"));
}

TEST_F(CliTest, query_not_found) {
    auto r = run_cli({"query", "/list/[id=z]"}, list_doc);
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: resolve/not_found: ", 0), 0u) << r.err;
    EXPECT_TRUE(r.out.empty());
}

TEST_F(CliTest, query_bad_path) {
    auto r = run_cli({"query", "list"}, list_doc);
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: parse/missing_leading_slash: ", 0), 0u) << r.err;
}

TEST_F(CliTest, invalid_json_input) {
    auto r = run_cli({"query", "/a"}, "{not json");
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: input: ", 0), 0u) << r.err;
}

TEST_F(CliTest, missing_file) {
    auto r = run_cli({"query", "/a", (dir_ / "absent.json").string()});
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_NE(r.err.find("cannot open"), std::string::npos);
}

// =============================================================================
// diff
// =============================================================================

TEST_F(CliTest, diff_positional) {
    auto a = write("a.json", list_doc);
    auto b = write("b.json", R"({"list": [{"id": "a", "v": 1}, {"id": "b", "v": 3}]})");
    auto r = run_cli({"diff", a, b});
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(Value::parse(r.out),
              Value::parse(R"([{"op": "replace", "path": "/list/1/v", "value": 3}])"));
}

TEST_F(CliTest, diff_with_schema) {
    auto a = write("a.json", list_doc);
    auto b = write("b.json", R"({"list": [{"id": "a", "v": 1}, {"id": "b", "v": 3}]})");
    auto schema = write("schema.json",
                        R"({"properties": {"list": {"type": "array", "indexKey": "id"}}})");
    auto r = run_cli({"diff", "--schema", schema, a, b});
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(Value::parse(r.out),
              Value::parse(R"([{"op": "replace", "path": "/list/[id=b]/v", "value": 3}])"));
}

TEST_F(CliTest, diff_with_invalid_schema) {
    auto a = write("a.json", list_doc);
    auto schema = write("schema.json",
                        R"({"properties": {"list": {"type": "array", "indexKey": 5}}})");
    auto r = run_cli({"diff", "--schema", schema, a, a});
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: schema/invalid_index_key: ", 0), 0u) << r.err;
}

TEST_F(CliTest, config_changes_options) {
    auto a = write("a.json", "[1]");
    auto b = write("b.json", "[1, 2]");
    auto config = write("config.json", R"({"append_marker": false, "log_level": "warn"})");
    auto r = run_cli({"--config", config, "diff", a, b});
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(Value::parse(r.out), Value::parse(R"([{"op": "add", "path": "/1", "value": 2}])"));
}

TEST_F(CliTest, config_with_wrong_type) {
    auto a = write("a.json", "[1]");
    auto config = write("config.json", R"({"max_depth": "deep"})");
    auto r = run_cli({"--config", config, "diff", a, a});
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: config: ", 0), 0u) << r.err;
}

TEST_F(CliTest, config_with_unknown_log_level) {
    auto a = write("a.json", "[1]");
    auto config = write("config.json", R"({"log_level": "verbose"})");
    auto r = run_cli({"--config", config, "diff", a, a});
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err, "error: config: unknown log_level 'verbose'\n");
    EXPECT_TRUE(r.out.empty());
}

// =============================================================================
// apply
// =============================================================================

TEST_F(CliTest, apply_patch_to_stdin) {
    auto patch = write("patch.json", R"([{"op": "remove", "path": "/list/[id=a]"}])");
    auto r = run_cli({"apply", patch}, list_doc);
    EXPECT_EQ(r.code, cli::exit_ok) << r.err;
    EXPECT_EQ(Value::parse(r.out), Value::parse(R"({"list": [{"id": "b", "v": 2}]})"));
}

TEST_F(CliTest, apply_failed_test_exits_two) {
    auto patch = write("patch.json", R"([{"op": "test", "path": "/list/0/v", "value": 5}])");
    auto doc = write("doc.json", list_doc);
    auto r = run_cli({"apply", patch, doc});
    EXPECT_EQ(r.code, cli::exit_test_failed);
    EXPECT_EQ(r.err.rfind("error: apply/test_failed: ", 0), 0u) << r.err;
    EXPECT_TRUE(r.out.empty());
}

TEST_F(CliTest, apply_malformed_patch) {
    auto patch = write("patch.json", R"([{"op": "add", "path": "/x"}])");
    auto r = run_cli({"apply", patch}, "{}");
    EXPECT_EQ(r.code, cli::exit_error);
    EXPECT_EQ(r.err.rfind("error: patch_format/invalid_patch: ", 0), 0u) << r.err;
}

// =============================================================================
// load_settings
// =============================================================================

TEST(CliSettings, defaults_when_empty) {
    auto settings = cli::load_settings(Value::object());
    EXPECT_EQ(settings.options, Options{});
    EXPECT_FALSE(settings.log_level.has_value());
}

TEST(CliSettings, reads_all_members) {
    auto settings = cli::load_settings(
        Value::parse(R"({"max_depth": 4, "append_marker": false, "log_level": "debug"})"));
    EXPECT_EQ(settings.options.max_depth, 4u);
    EXPECT_FALSE(settings.options.append_marker);
    EXPECT_EQ(settings.log_level, spdlog::level::debug);
}

TEST(CliSettings, log_level_must_name_a_level) {
    EXPECT_THROW(cli::load_settings(Value::parse(R"({"log_level": "loud"})")), cli::ConfigError);
    EXPECT_THROW(cli::load_settings(Value::parse(R"({"log_level": ""})")), cli::ConfigError);
    EXPECT_EQ(cli::load_settings(Value::parse(R"({"log_level": "off"})")).log_level,
              spdlog::level::off);
    EXPECT_EQ(cli::load_settings(Value::parse(R"({"log_level": "warn"})")).log_level,
              spdlog::level::warn);
}
