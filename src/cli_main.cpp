#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "keypath/Document.hpp"
#include "keypath/Enumerator.hpp"
#include "keypath/Errors.hpp"
#include "keypath/PathGrammar.hpp"
#include "keypath/Resolver.hpp"
#include "keypath/SchemaIO.hpp"

using nlohmann::json;
using namespace keypath;

namespace {

const char* kCommandsHelp =
    "Commands:\n"
    "  paths SCHEMA                  list every path pattern of the schema\n"
    "  resolve SCHEMA PATH...        print the shape at each path\n"
    "  check SCHEMA                  validate the schema and its patterns\n"
    "  get SCHEMA DATA PATH          read a value from a JSON data file\n"
    "  set SCHEMA DATA PATH VALUE    write a value into a JSON data file\n";

// VALUE is JSON if it parses, a plain string otherwise
json parse_json_or_string(const std::string& raw) {
    try {
        return json::parse(raw);
    } catch (const json::parse_error&) {
        return json(raw);
    }
}

json trace_to_json(const Resolution& resolution) {
    json steps = json::array();
    for (const auto& step : resolution.trace) {
        steps.push_back({
            {"rule", rule_name(step.rule)},
            {"remaining", step.remaining},
            {"node", to_string(step.node)},
        });
    }
    return steps;
}

void write_json_file(const std::string& path, const json& j) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw Error("Cannot write to '" + path + "'");
    }
    ofs << j.dump(2) << "\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("keypath", "Enumerate and resolve schema-directed paths");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("d,max-depth", "Object/dictionary nesting limit for enumeration", cxxopts::value<int>())
            ("e,explain", "Show which precedence rule fired at each step")
            ("j,json", "Print results as JSON")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << kCommandsHelp;
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        if (cmd != "paths" && cmd != "resolve" && cmd != "check" && cmd != "get" && cmd != "set") {
            std::cerr << "Unknown command: " << cmd << "\n";
            return 1;
        }
        if (cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }

        SchemaDocument schema = load_schema_file(cmdv[1]);

        // Depth: built-in default -> schema document -> command line
        EnumerateOptions enumerate = schema.options;
        if (result.count("max-depth")) {
            int depth = result["max-depth"].as<int>();
            if (depth < 0) {
                std::cerr << "Error: --max-depth must be non-negative\n";
                return 1;
            }
            enumerate.max_depth = depth;
        }

        // PATHS
        if (cmd == "paths") {
            auto patterns = enumerate_paths(schema.graph, enumerate);
            if (result.count("json")) {
                std::cout << json(patterns).dump(2) << "\n";
            } else {
                for (const auto& p : patterns) {
                    std::cout << p << "\n";
                }
            }
            return 0;
        }

        // RESOLVE
        if (cmd == "resolve") {
            if (cmdv.size() < 3) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return 1;
            }
            const bool want_json = result.count("json") > 0;
            const bool want_trace = result.count("explain") > 0;

            bool all_resolved = true;
            json report = json::array();
            for (size_t i = 2; i < cmdv.size(); ++i) {
                const std::string& path = cmdv[i];
                Resolution resolution = explain(schema.graph, path);
                all_resolved = all_resolved && resolution.resolved();

                if (want_json) {
                    json entry = {
                        {"path", path},
                        {"shape", resolution.resolved() ? schema_to_json(*resolution.shape) : json(nullptr)},
                    };
                    if (want_trace) entry["trace"] = trace_to_json(resolution);
                    report.push_back(entry);
                    continue;
                }

                std::cout << path << ": "
                          << (resolution.resolved() ? to_string(*resolution.shape) : "unresolvable")
                          << "\n";
                if (want_trace) {
                    for (const auto& step : resolution.trace) {
                        std::cout << "  " << rule_name(step.rule) << " '" << step.remaining
                                  << "' on " << to_string(step.node) << "\n";
                    }
                }
            }
            if (want_json) {
                std::cout << report.dump(2) << "\n";
            }
            return all_resolved ? 0 : 1;
        }

        // CHECK
        if (cmd == "check") {
            auto patterns = enumerate_paths(schema.graph, enumerate);
            size_t failures = 0;
            for (const auto& pattern : patterns) {
                const std::string concrete = instantiate_pattern(pattern, 0, "key");
                if (!is_valid_path(schema.graph, pattern) || !is_valid_path(schema.graph, concrete)) {
                    std::cerr << "Error: enumerated pattern '" << pattern << "' does not resolve\n";
                    ++failures;
                }
            }
            if (failures > 0) {
                return 1;
            }
            std::cout << "OK: " << patterns.size() << " patterns (max depth "
                      << enumerate.max_depth << ")\n";
            return 0;
        }

        // GET / SET operate on a data file
        if (cmdv.size() < (cmd == "set" ? 5u : 4u)) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }
        const std::string data_path = cmdv[2];
        const std::string key = cmdv[3];
        Document doc(schema.graph, load_json_file(data_path));

        if (cmd == "get") {
            const json* v = doc.get(key);
            if (!v) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            std::cout << v->dump(2) << "\n";
            return 0;
        }

        // SET
        json parsed = parse_json_or_string(cmdv[4]);
        doc.set(key, parsed);
        write_json_file(data_path, doc.data());
        std::cout << "Set " << key << " = " << parsed.dump() << " in " << data_path << "\n";
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
