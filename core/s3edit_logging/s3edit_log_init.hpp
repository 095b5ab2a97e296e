// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_LOG_INIT_HPP
#define S3EDIT_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "s3edit_console_sink.hpp"
#include "s3edit_log_severity.hpp"

namespace s3edit {
namespace logging {

/**
 * Logging configuration for s3edit programs.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   S3EDIT_LOG_LEVEL           - Console level
 *   S3EDIT_LOG_CONSOLE_ENABLED - "true"/"false"
 *   S3EDIT_LOG_COLORS          - "true"/"false"
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize logging. Calls after the first one are ignored until
 * shutdown_logging() is called.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with the default configuration plus environment overrides.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

/**
 * Add a custom sink to the logging core. The sink is removed again by
 * shutdown_logging().
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down and re-initialize with new settings (env overrides applied).
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace s3edit

#endif  // S3EDIT_LOG_INIT_HPP
