/**
 * @file Options.hpp
 * @brief Behavior switches shared by all document operations
 *
 * Options are loaded from a JSON or TOML file with keys:
 * - conflict_policy: "drop" | "first" | "second" | "error"
 * - fold_mode: "merge" | "legacy"
 * - max_depth: positive integer
 * - log_level: "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
 */

#ifndef DOCTREE_OPTIONS_HPP
#define DOCTREE_OPTIONS_HPP

#include "doctree/Value.hpp"
#include "doctree/Errors.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace doctree {

class Diagnostics;

/**
 * @brief What union does when both documents hold a key and the two values
 *        are not both documents
 */
enum class ConflictPolicy {
    DropOnConflict, ///< Write no entry for the key
    FirstWins,      ///< Keep the first document's value
    SecondWins,     ///< Keep the second document's value
    Error           ///< Throw MergeConflict
};

/**
 * @brief How fold combines the sub-records of a list-valued field
 */
enum class FoldMode {
    MergeElements, ///< Union every folded element into a per-field buffer
    Legacy         ///< Union each folded element against the outer accumulator
};

/**
 * @brief Options passed to every operation
 */
struct Options {
    ConflictPolicy conflict = ConflictPolicy::DropOnConflict;
    FoldMode fold_mode = FoldMode::MergeElements;
    std::size_t max_depth = 512;
    std::string log_level = "warn";
    Diagnostics* diagnostics = nullptr; // not owned, may be null
};

/**
 * @brief Parse a conflict policy name ("drop", "first", "second", "error")
 * @throws OptionError for unknown names
 */
ConflictPolicy parse_conflict_policy(const std::string& name);

/**
 * @brief Parse a fold mode name ("merge", "legacy")
 * @throws OptionError for unknown names
 */
FoldMode parse_fold_mode(const std::string& name);

const char* conflict_policy_name(ConflictPolicy policy);
const char* fold_mode_name(FoldMode mode);

/**
 * @brief Apply the recognized keys of a configuration object to options
 *
 * Unknown keys are ignored. Keys that are absent keep the value from
 * @p base.
 *
 * @param config Configuration object
 * @param base Options to start from
 * @return Updated options
 * @throws TypeError if config is not an object
 * @throws OptionError if a recognized key has an invalid value
 */
Options options_from_value(const Value& config, const Options& base = Options{});

/**
 * @brief Load options from a .json or .toml file
 *
 * @param path Path to the options file
 * @return Options with file values applied over the defaults
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws OptionError if a value is invalid
 */
Options load_options(const std::string& path);

/**
 * @brief Settings given on the command line; unset fields are not overridden
 */
struct OptionOverrides {
    std::optional<std::string> config_file;
    std::optional<std::string> conflict;
    std::optional<std::string> fold_mode;
    std::optional<std::size_t> max_depth;
    std::optional<std::string> log_level;
};

/**
 * @brief Build options from an optional options file plus overrides
 *
 * The file named by config_file is applied over the defaults, then every
 * set override is applied over the file.
 *
 * @throws OptionError if an override is invalid (unknown name, zero depth)
 * @throws FileNotFoundError, ParseError as load_options()
 */
Options resolve_options(const OptionOverrides& overrides);

/**
 * @brief Throw DepthLimitExceeded if @p depth is past options.max_depth
 */
inline void enforce_depth(std::size_t depth, const Options& options, const std::string& path) {
    if (depth > options.max_depth) {
        throw DepthLimitExceeded(path, options.max_depth);
    }
}

} // namespace doctree

#endif // DOCTREE_OPTIONS_HPP
