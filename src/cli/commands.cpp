#include "commands.hpp"

#include <spatch/json.hpp>
#include <spatch/logging.hpp>
#include <spatch/resolve.hpp>
#include <spatch/schema_index.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace spatch::cli {

namespace {

namespace po = boost::program_options;

// Raised for command lines that cannot be run as given.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised for unreadable or unparsable input files.
class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr auto usage_text =
    "usage: spatch [options] <command> [args]\n"
    "\n"
    "commands:\n"
    "  query <path> [document]   print the value at a plain or semantic path\n"
    "  diff <old> <new>          print the patch turning <old> into <new>\n"
    "  apply <patch> [document]  print the document with <patch> applied\n"
    "\n"
    "Documents default to standard input when omitted.\n";

auto read_text(const std::string& name, std::istream& in) -> std::string {
    if (name == "-") {
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }
    auto file = std::ifstream{name, std::ios::binary};
    if (!file) throw InputError{"cannot open '" + name + "'"};
    auto buffer = std::ostringstream{};
    buffer << file.rdbuf();
    return buffer.str();
}

auto read_json(const std::string& name, std::istream& in) -> Value {
    try {
        return Value::parse(read_text(name, in));
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError{"'" + name + "' is not valid JSON: " + e.what()};
    }
}

auto report(const Error& error, std::ostream& err) -> int {
    err << "error: " << to_string_view(error.category()) << "/" << to_string_view(error.kind)
        << ": " << error.message << "\n";
    return error.kind == ErrorKind::test_failed ? exit_test_failed : exit_error;
}

auto print(const Value& value, std::ostream& out) -> int {
    out << value.dump(2) << "\n";
    return exit_ok;
}

// -- Commands -----------------------------------------------------------------

auto run_query(const std::vector<std::string>& args, const Settings& settings, std::istream& in,
               std::ostream& out, std::ostream& err) -> int {
    if (args.empty() || args.size() > 2) throw UsageError{"query takes <path> [document]"};
    auto doc = read_json(args.size() == 2 ? args[1] : "-", in);
    auto value = query(doc, args[0], nullptr, settings.options);
    if (!value) return report(value.error(), err);
    return print(*value, out);
}

auto run_diff(const std::vector<std::string>& args, const std::optional<std::string>& schema_file,
              const Settings& settings, std::istream& in, std::ostream& out,
              std::ostream& err) -> int {
    if (args.size() != 2) throw UsageError{"diff takes <old> <new>"};
    auto old_doc = read_json(args[0], in);
    auto new_doc = read_json(args[1], in);

    auto index = std::optional<SchemaIndex>{};
    if (schema_file) {
        auto built = SchemaIndex::build(read_json(*schema_file, in));
        if (!built) return report(built.error(), err);
        index = std::move(*built);
    }

    auto patch = diff_patch(old_doc, new_doc, index ? &*index : nullptr, settings.options);
    if (!patch) return report(patch.error(), err);
    return print(*patch, out);
}

auto run_apply(const std::vector<std::string>& args, const Settings& settings, std::istream& in,
               std::ostream& out, std::ostream& err) -> int {
    if (args.empty() || args.size() > 2) throw UsageError{"apply takes <patch> [document]"};
    auto patch = read_json(args[0], in);
    auto doc = read_json(args.size() == 2 ? args[1] : "-", in);
    auto result = apply_patch(doc, patch, settings.options);
    if (!result) return report(result.error(), err);
    return print(*result, out);
}

}  // namespace

auto load_settings(const Value& config) -> Settings {
    auto settings = Settings{};
    settings.options = config.get<Options>();
    if (auto it = config.find("log_level"); it != config.end()) {
        auto name = it->get<std::string>();
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            throw ConfigError{"unknown log_level '" + name + "'"};
        }
        settings.log_level = level;
    }
    return settings;
}

auto run(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
         std::ostream& err) -> int {
    po::options_description desc("Supported options");
    desc.add_options()
        ("help,h", "show help message")
        ("verbose,v", "log debug output to stderr")
        ("config", po::value<std::string>(), "JSON file with max_depth, append_marker, log_level")
        ("schema", po::value<std::string>(), "JSON Schema declaring indexKey for diff")
    ;
    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>())
    ;
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            out << usage_text << "\n" << desc;
            return exit_ok;
        }
        if (!vm.count("command")) throw UsageError{"missing command"};

        auto settings = Settings{};
        if (vm.count("config")) settings = load_settings(read_json(vm["config"].as<std::string>(), in));
        if (settings.log_level) set_log_level(*settings.log_level);
        if (vm.count("verbose")) set_log_level(spdlog::level::debug);

        auto command = vm["command"].as<std::string>();
        auto rest = vm.count("args") ? vm["args"].as<std::vector<std::string>>()
                                     : std::vector<std::string>{};
        auto schema_file = vm.count("schema")
                               ? std::optional<std::string>{vm["schema"].as<std::string>()}
                               : std::nullopt;
        logger()->debug("running '{}' with {} argument(s)", command, rest.size());

        if (command == "query") return run_query(rest, settings, in, out, err);
        if (command == "diff") return run_diff(rest, schema_file, settings, in, out, err);
        if (command == "apply") return run_apply(rest, settings, in, out, err);
        throw UsageError{"unknown command '" + command + "'"};
    } catch (const UsageError& e) {
        err << "error: usage: " << e.what() << "\n\n" << usage_text;
        return exit_usage;
    } catch (const po::error& e) {
        err << "error: usage: " << e.what() << "\n\n" << usage_text;
        return exit_usage;
    } catch (const InputError& e) {
        err << "error: input: " << e.what() << "\n";
        return exit_error;
    } catch (const ConfigError& e) {
        err << "error: config: " << e.what() << "\n";
        return exit_error;
    } catch (const nlohmann::json::exception& e) {
        err << "error: config: " << e.what() << "\n";
        return exit_error;
    }
}

}  // namespace spatch::cli
