/**
 * @file Diagnostics.cpp
 * @brief spdlog-backed diagnostics
 */

#include "doctree/Diagnostics.hpp"
#include "doctree/Errors.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace doctree {

void LoggingDiagnostics::on_dropped_field(const std::string& path, const std::string& reason) {
    logger_->debug("dropped field '{}': {}", path, reason);
}

void LoggingDiagnostics::on_conflict(const std::string& path, ConflictPolicy policy,
                                     const Value& first, const Value& second) {
    logger_->debug("conflict at '{}' ({}): {} vs {}", path, conflict_policy_name(policy),
                   first.dump(), second.dump());
}

void LoggingDiagnostics::on_ignored_element(const std::string& path, const Value& element) {
    logger_->debug("ignored {} element in list '{}': {}", type_name(element), path,
                   element.dump());
}

void LoggingDiagnostics::on_path_not_found(const std::string& query, const std::string& details) {
    logger_->warn("path '{}' not found: {}", query, details);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw OptionError("log_level", "unknown level '" + name + "'");
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
    }
    logger->set_level(level);
    return logger;
}

} // namespace doctree
