/**
 * @file Diagnostics.hpp
 * @brief Observer for silent data loss and lookup failures
 *
 * Core operations never log on their own. They report dropped fields,
 * merge conflicts and ignored list elements to the Diagnostics object
 * passed in Options. LoggingDiagnostics forwards the events to spdlog.
 */

#ifndef DOCTREE_DIAGNOSTICS_HPP
#define DOCTREE_DIAGNOSTICS_HPP

#include "doctree/Options.hpp"
#include "doctree/Value.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace doctree {

/**
 * @brief Receives events from document operations
 *
 * Implementations must be safe to call from every thread that runs an
 * operation with them.
 */
class Diagnostics {
public:
    virtual ~Diagnostics() = default;

    /// A field was omitted from a result (e.g., unrecognized value kind).
    virtual void on_dropped_field(const std::string& path, const std::string& reason) = 0;

    /// union met two non-mergeable values under the same key.
    virtual void on_conflict(const std::string& path, ConflictPolicy policy,
                             const Value& first, const Value& second) = 0;

    /// fold skipped a list element that is not a document.
    virtual void on_ignored_element(const std::string& path, const Value& element) = 0;

    /// A path query did not resolve.
    virtual void on_path_not_found(const std::string& query, const std::string& details) = 0;
};

/**
 * @brief Diagnostics that writes every event to a spdlog logger
 */
class LoggingDiagnostics : public Diagnostics {
public:
    explicit LoggingDiagnostics(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    void on_dropped_field(const std::string& path, const std::string& reason) override;
    void on_conflict(const std::string& path, ConflictPolicy policy,
                     const Value& first, const Value& second) override;
    void on_ignored_element(const std::string& path, const Value& element) override;
    void on_path_not_found(const std::string& query, const std::string& details) override;

    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Parse a log level name
 * @param name One of "trace", "debug", "info", "warn", "error",
 *             "critical", "off"
 * @throws OptionError for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Get or create a stderr logger
 *
 * Reuses a logger already registered under @p name.
 *
 * @param name Logger name
 * @param level Minimum level to emit
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::level::level_enum level);

} // namespace doctree

#endif // DOCTREE_DIAGNOSTICS_HPP
