#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "doctree/Diagnostics.hpp"
#include "doctree/DotPath.hpp"
#include "doctree/Errors.hpp"
#include "doctree/Fold.hpp"
#include "doctree/Loader.hpp"
#include "doctree/Merge.hpp"
#include "doctree/Normalize.hpp"
#include "doctree/Options.hpp"
#include "doctree/Search.hpp"
#include "doctree/Util.hpp"

using namespace doctree;

namespace {

// Try parsing text as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw);
    } catch (const Value::parse_error&) {
        return Value(raw);
    }
}

std::vector<Value> as_document_list(const Value& input) {
    if (input.is_array()) {
        return std::vector<Value>(input.begin(), input.end());
    }
    return {input};
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options cli("doctree", "Merge, expand, normalize, fold and search JSON/TOML documents");
        cli.positional_help("COMMAND [ARGS]");

        cli.add_options()
            ("c,config", "Path to JSON/TOML options file", cxxopts::value<std::string>())
            ("conflict", "Conflict policy: drop|first|second|error", cxxopts::value<std::string>())
            ("fold-mode", "Fold mode: merge|legacy", cxxopts::value<std::string>())
            ("max-depth", "Maximum nesting depth", cxxopts::value<std::size_t>())
            ("log-level", "trace|debug|info|warn|error|critical|off", cxxopts::value<std::string>())
            ("indent", "JSON output indent", cxxopts::value<int>()->default_value("2"))
            ("h,help", "Show help");

        cli.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        cli.parse_positional({"command"});

        auto result = cli.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << cli.help() << "\n";
            std::cout << "Commands: expand PATH VALUE | union FILE_A FILE_B | normalize FILE | fold FILE"
                         " | find FILE KEY VALUE | query FILE PATH | ids FILE\n";
            return 0;
        }

        OptionOverrides overrides;
        if (result.count("config")) overrides.config_file = result["config"].as<std::string>();
        if (result.count("conflict")) overrides.conflict = result["conflict"].as<std::string>();
        if (result.count("fold-mode")) overrides.fold_mode = result["fold-mode"].as<std::string>();
        if (result.count("max-depth")) overrides.max_depth = result["max-depth"].as<std::size_t>();
        if (result.count("log-level")) overrides.log_level = result["log-level"].as<std::string>();

        Options options = resolve_options(overrides);

        LoggingDiagnostics diagnostics(make_logger("doctree", parse_log_level(options.log_level)));
        options.diagnostics = &diagnostics;

        const int indent = result["indent"].as<int>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw OptionError(cmd, "insufficient arguments");
            }
        };

        auto print = [&](const Value& v) {
            std::cout << to_json_text(v, indent) << "\n";
        };

        // EXPAND
        if (cmd == "expand") {
            expect_args(3);
            auto expanded = expand_path(cmdv[1], parse_json_or_string(cmdv[2]));
            if (!expanded) {
                std::cerr << "Error: empty path\n";
                return 1;
            }
            print(*expanded);
            return 0;
        }

        // UNION
        if (cmd == "union") {
            expect_args(3);
            print(union_documents(load_document_file(cmdv[1]), load_document_file(cmdv[2]), options));
            return 0;
        }

        // NORMALIZE
        if (cmd == "normalize") {
            expect_args(2);
            print(normalize(load_document_file(cmdv[1]), options));
            return 0;
        }

        // FOLD
        if (cmd == "fold") {
            expect_args(2);
            print(fold_record(load_document_file(cmdv[1]), options));
            return 0;
        }

        // FIND
        if (cmd == "find") {
            expect_args(4);
            const Value doc = load_document_file(cmdv[1]);
            const Value* found = find_by_attribute(doc, cmdv[2], cmdv[3], options);
            if (!found) {
                std::cout << "No match\n";
                return 1;
            }
            print(*found);
            return 0;
        }

        // QUERY
        if (cmd == "query") {
            expect_args(3);
            auto found = apply_path(load_document_file(cmdv[1]), cmdv[2], &diagnostics);
            if (!found) {
                std::cout << "No match\n";
                return 1;
            }
            print(*found);
            return 0;
        }

        // IDS
        if (cmd == "ids") {
            expect_args(2);
            Value ids = Value::array();
            for (auto& id : document_ids(as_document_list(load_document_file(cmdv[1])))) {
                ids.push_back(std::move(id));
            }
            print(ids);
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const DocumentError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
