/**
 * @file Options.cpp
 * @brief Option name parsing and loading
 */

#include "doctree/Options.hpp"
#include "doctree/Diagnostics.hpp"
#include "doctree/Loader.hpp"

namespace doctree {

ConflictPolicy parse_conflict_policy(const std::string& name) {
    if (name == "drop") return ConflictPolicy::DropOnConflict;
    if (name == "first") return ConflictPolicy::FirstWins;
    if (name == "second") return ConflictPolicy::SecondWins;
    if (name == "error") return ConflictPolicy::Error;
    throw OptionError("conflict_policy", "unknown policy '" + name +
                      "' (expected drop, first, second or error)");
}

FoldMode parse_fold_mode(const std::string& name) {
    if (name == "merge") return FoldMode::MergeElements;
    if (name == "legacy") return FoldMode::Legacy;
    throw OptionError("fold_mode", "unknown mode '" + name +
                      "' (expected merge or legacy)");
}

const char* conflict_policy_name(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::DropOnConflict: return "drop";
        case ConflictPolicy::FirstWins: return "first";
        case ConflictPolicy::SecondWins: return "second";
        case ConflictPolicy::Error: return "error";
    }
    return "unknown";
}

const char* fold_mode_name(FoldMode mode) {
    switch (mode) {
        case FoldMode::MergeElements: return "merge";
        case FoldMode::Legacy: return "legacy";
    }
    return "unknown";
}

namespace {
    std::string string_option(const Value& config, const char* key) {
        const auto& v = config.at(key);
        if (!v.is_string()) {
            throw OptionError(key, "expected string, got " + type_name(v));
        }
        return v.get<std::string>();
    }
}

Options options_from_value(const Value& config, const Options& base) {
    if (!config.is_object()) {
        throw TypeError("", "object", type_name(config));
    }

    Options options = base;

    if (config.contains("conflict_policy")) {
        options.conflict = parse_conflict_policy(string_option(config, "conflict_policy"));
    }

    if (config.contains("fold_mode")) {
        options.fold_mode = parse_fold_mode(string_option(config, "fold_mode"));
    }

    if (config.contains("max_depth")) {
        const auto& v = config.at("max_depth");
        if (!v.is_number_integer() || v.get<long long>() <= 0) {
            throw OptionError("max_depth", "expected positive integer, got " + v.dump());
        }
        options.max_depth = v.get<std::size_t>();
    }

    if (config.contains("log_level")) {
        options.log_level = string_option(config, "log_level");
        parse_log_level(options.log_level);  // rejects unknown names
    }

    return options;
}

Options load_options(const std::string& path) {
    return options_from_value(load_document_file(path));
}

Options resolve_options(const OptionOverrides& overrides) {
    Options options = overrides.config_file ? load_options(*overrides.config_file) : Options{};

    if (overrides.conflict) {
        options.conflict = parse_conflict_policy(*overrides.conflict);
    }
    if (overrides.fold_mode) {
        options.fold_mode = parse_fold_mode(*overrides.fold_mode);
    }
    if (overrides.max_depth) {
        if (*overrides.max_depth == 0) {
            throw OptionError("max_depth", "expected positive integer, got 0");
        }
        options.max_depth = *overrides.max_depth;
    }
    if (overrides.log_level) {
        parse_log_level(*overrides.log_level);
        options.log_level = *overrides.log_level;
    }
    return options;
}

} // namespace doctree
