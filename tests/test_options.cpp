#include <catch2/catch_all.hpp>
#include <doctree/Diagnostics.hpp>
#include <doctree/Merge.hpp>
#include <doctree/Options.hpp>
#include <cstdio>
#include <fstream>

using namespace doctree;

TEST_CASE("defaults") {
    Options opts;
    REQUIRE(opts.conflict == ConflictPolicy::DropOnConflict);
    REQUIRE(opts.fold_mode == FoldMode::MergeElements);
    REQUIRE(opts.max_depth == 512);
    REQUIRE(opts.diagnostics == nullptr);
}

TEST_CASE("load JSON options") {
    std::string path = "tmp_doctree_opts.json";
    std::ofstream(path) << R"({"conflict_policy": "second", "fold_mode": "legacy", "max_depth": 16})";
    Options opts = load_options(path);
    REQUIRE(opts.conflict == ConflictPolicy::SecondWins);
    REQUIRE(opts.fold_mode == FoldMode::Legacy);
    REQUIRE(opts.max_depth == 16);
    std::remove(path.c_str());
}

TEST_CASE("load TOML options") {
    std::string path = "tmp_doctree_opts.toml";
    std::ofstream(path) << "conflict_policy = \"error\"\nlog_level = \"debug\"\n";
    Options opts = load_options(path);
    REQUIRE(opts.conflict == ConflictPolicy::Error);
    REQUIRE(opts.log_level == "debug");
    REQUIRE(opts.fold_mode == FoldMode::MergeElements);
    std::remove(path.c_str());
}

TEST_CASE("unknown keys ignored, base kept") {
    Options base;
    base.conflict = ConflictPolicy::FirstWins;
    Value config = {{"unrelated", 1}};
    Options opts = options_from_value(config, base);
    REQUIRE(opts.conflict == ConflictPolicy::FirstWins);
}

TEST_CASE("invalid values") {
    REQUIRE_THROWS_AS(options_from_value(Value{{"conflict_policy", "newest"}}), OptionError);
    REQUIRE_THROWS_AS(options_from_value(Value{{"fold_mode", 3}}), OptionError);
    REQUIRE_THROWS_AS(options_from_value(Value{{"max_depth", 0}}), OptionError);
    REQUIRE_THROWS_AS(options_from_value(Value{{"max_depth", "deep"}}), OptionError);
    REQUIRE_THROWS_AS(options_from_value(Value{{"log_level", "loud"}}), OptionError);
    REQUIRE_THROWS_AS(options_from_value(Value::array()), TypeError);
}

TEST_CASE("policy names round trip") {
    for (auto policy : {ConflictPolicy::DropOnConflict, ConflictPolicy::FirstWins,
                        ConflictPolicy::SecondWins, ConflictPolicy::Error}) {
        REQUIRE(parse_conflict_policy(conflict_policy_name(policy)) == policy);
    }
    for (auto mode : {FoldMode::MergeElements, FoldMode::Legacy}) {
        REQUIRE(parse_fold_mode(fold_mode_name(mode)) == mode);
    }
}

TEST_CASE("log levels") {
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(parse_log_level("verbose"), OptionError);
}

TEST_CASE("missing options file") {
    REQUIRE_THROWS_AS(load_options("does_not_exist.toml"), FileNotFoundError);
}

TEST_CASE("logging diagnostics through merge") {
    auto logger = make_logger("doctree-test", spdlog::level::off);
    REQUIRE(make_logger("doctree-test", spdlog::level::off) == logger);

    LoggingDiagnostics diag(logger);
    Options opts;
    opts.diagnostics = &diag;
    Value merged = union_documents(Value{{"a", 1}}, Value{{"a", 2}, {"b", 3}}, opts);
    REQUIRE(merged == Value{{"b", 3}});
}
