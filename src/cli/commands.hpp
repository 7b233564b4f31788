/// @file commands.hpp
/// @brief The spatch command line: query, diff and apply.
///
/// Internal header, not installed. Kept apart from main() so the command
/// dispatch can be driven from tests with in-memory streams.

#pragma once

#include <spatch/options.hpp>
#include <spatch/value.hpp>

#include <spdlog/common.h>

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace spatch::cli {

inline constexpr int exit_ok = 0;
inline constexpr int exit_error = 1;
inline constexpr int exit_test_failed = 2;
inline constexpr int exit_usage = 64;

/// Raised for a --config file whose members have acceptable types but
/// unusable values.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Settings read from a --config JSON file.
struct Settings {
    Options options;
    std::optional<spdlog::level::level_enum> log_level;
};

/// Read `{"max_depth": …, "append_marker": …, "log_level": "debug"}`.
/// Missing members keep their defaults.
/// @throws nlohmann::json::exception on members of the wrong type.
/// @throws ConfigError on a log_level spdlog does not name.
auto load_settings(const Value& config) -> Settings;

/// Run one command line (without the program name). Documents are read
/// from the named files, or from `in` where a command allows it; results
/// go to `out` and diagnostics to `err`. Returns the process exit code.
auto run(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
         std::ostream& err) -> int;

}  // namespace spatch::cli
