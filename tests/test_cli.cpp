/**
 * @file test_cli.cpp
 * @brief Tests for option resolution behind the doctree CLI (GoogleTest)
 *
 * These cover resolve_options(), which layers command line flags over an
 * options file. The CLI binary itself is not run here.
 */

#include <gtest/gtest.h>

#include "doctree/Errors.hpp"
#include "doctree/Options.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace doctree;

namespace {

class OptionsFile {
public:
    OptionsFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream(path_) << content;
    }

    ~OptionsFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST(ResolveOptions, NoFlagsGivesDefaults) {
    Options options = resolve_options(OptionOverrides{});
    EXPECT_EQ(options.conflict, ConflictPolicy::DropOnConflict);
    EXPECT_EQ(options.fold_mode, FoldMode::MergeElements);
    EXPECT_EQ(options.max_depth, 512u);
    EXPECT_EQ(options.log_level, "warn");
}

TEST(ResolveOptions, FileValuesApplied) {
    OptionsFile file("doctree_cli_opts.json",
                     R"({"conflict_policy": "first", "max_depth": 64})");
    OptionOverrides overrides;
    overrides.config_file = file.path();

    Options options = resolve_options(overrides);
    EXPECT_EQ(options.conflict, ConflictPolicy::FirstWins);
    EXPECT_EQ(options.max_depth, 64u);
}

TEST(ResolveOptions, FlagsOverrideFile) {
    OptionsFile file("doctree_cli_layered.json",
                     R"({"conflict_policy": "first", "fold_mode": "legacy", "max_depth": 64})");
    OptionOverrides overrides;
    overrides.config_file = file.path();
    overrides.conflict = "error";
    overrides.max_depth = 8;
    overrides.log_level = "debug";

    Options options = resolve_options(overrides);
    EXPECT_EQ(options.conflict, ConflictPolicy::Error);
    EXPECT_EQ(options.max_depth, 8u);
    EXPECT_EQ(options.log_level, "debug");
    // Not overridden, so the file value stays
    EXPECT_EQ(options.fold_mode, FoldMode::Legacy);
}

TEST(ResolveOptions, ZeroMaxDepthRejected) {
    OptionOverrides overrides;
    overrides.max_depth = 0;
    try {
        resolve_options(overrides);
        FAIL() << "Expected OptionError";
    } catch (const OptionError& e) {
        EXPECT_EQ(e.option(), "max_depth");
    }
}

TEST(ResolveOptions, UnknownNamesRejected) {
    OptionOverrides bad_policy;
    bad_policy.conflict = "newest";
    EXPECT_THROW(resolve_options(bad_policy), OptionError);

    OptionOverrides bad_mode;
    bad_mode.fold_mode = "append";
    EXPECT_THROW(resolve_options(bad_mode), OptionError);

    OptionOverrides bad_level;
    bad_level.log_level = "loud";
    EXPECT_THROW(resolve_options(bad_level), OptionError);
}

TEST(ResolveOptions, MissingOptionsFile) {
    OptionOverrides overrides;
    overrides.config_file = "/nonexistent/doctree_opts.toml";
    EXPECT_THROW(resolve_options(overrides), FileNotFoundError);
}
