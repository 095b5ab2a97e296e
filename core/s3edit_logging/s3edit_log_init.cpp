// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3edit_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "s3edit_log_macros.hpp"

namespace s3edit {
namespace logging {

namespace {
std::mutex g_sinks_mutex;

// Every sink attached through this module, for shutdown
std::vector<boost::shared_ptr<boost::log::sinks::sink>> g_sinks;
boost::shared_ptr<async_console_sink_t> g_console_sink;

bool g_initialized = false;

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

void stop_sinks_locked() {
  auto core = boost::log::core::get();
  if (g_console_sink) {
    g_console_sink->stop();
    g_console_sink->flush();
  }
  for (auto& sink : g_sinks) {
    core->remove_sink(sink);
  }
  g_sinks.clear();
  g_console_sink.reset();
}
}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto level_str = get_env("S3EDIT_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.console_level = *level;
    }
  }
  if (auto enabled_str = get_env("S3EDIT_LOG_CONSOLE_ENABLED")) {
    if (auto enabled = parse_bool(*enabled_str)) {
      config.console_enabled = *enabled;
    }
  }
  if (auto colors_str = get_env("S3EDIT_LOG_COLORS")) {
    if (auto colors = parse_bool(*colors_str)) {
      config.console_colors = *colors;
    }
  }
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);

  if (g_initialized) {
    return;
  }

  // TimeStamp, ThreadID, ...
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    g_console_sink = create_console_sink(config.console_level, config.console_colors);
    boost::log::core::get()->add_sink(g_console_sink);
    g_sinks.push_back(g_console_sink);
  }

  g_initialized = true;
}

void init_logging_default() {
  LoggingConfig config;
  apply_env_overrides(config);
  init_logging(config);
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);

  if (!g_initialized) {
    return;
  }
  stop_sinks_locked();
  g_initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  boost::log::core::get()->add_sink(sink);
  g_sinks.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  boost::log::core::get()->remove_sink(sink);

  auto it = std::find(g_sinks.begin(), g_sinks.end(), sink);
  if (it != g_sinks.end()) {
    g_sinks.erase(it);
  }
}

void flush_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  for (auto& sink : g_sinks) {
    sink->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig final_config = config;
  apply_env_overrides(final_config);

  shutdown_logging();
  init_logging(final_config);
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return g_initialized;
}

}  // namespace logging
}  // namespace s3edit
