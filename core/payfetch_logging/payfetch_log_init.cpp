// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "payfetch_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "payfetch_log_macros.hpp"

namespace payfetch {
namespace logging {

namespace {

struct ActiveSinks {
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
};

std::mutex g_mutex;
std::optional<ActiveSinks> g_active;

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

std::optional<severity_level> env_level(const char* name) {
  const char* value = env_value(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return parse_severity_level(value);
}

std::optional<bool> env_flag(const char* name) {
  const char* value = env_value(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string flag = lowercase(value);
  if (flag == "true" || flag == "yes" || flag == "on" || flag == "1") {
    return true;
  }
  if (flag == "false" || flag == "no" || flag == "off" || flag == "0") {
    return false;
  }
  return std::nullopt;
}

// Detach first so no new records arrive, then drain the queue in this thread
template <typename Sink>
void detach(const boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
}

}  // namespace

logger_type& get_logger() {
  static logger_type logger;
  return logger;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string level = lowercase(level_str);
  if (level == "debug") {
    return severity_level::debug;
  }
  if (level == "info") {
    return severity_level::info;
  }
  if (level == "warn" || level == "warning") {
    return severity_level::warn;
  }
  if (level == "error") {
    return severity_level::error;
  }
  if (level == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto level = env_level("PAYFETCH_LOG_LEVEL")) {
    config.console_level = *level;
    config.file_level = *level;
  }
  if (auto level = env_level("PAYFETCH_LOG_CONSOLE_LEVEL")) {
    config.console_level = *level;
  }
  if (auto level = env_level("PAYFETCH_LOG_FILE_LEVEL")) {
    config.file_level = *level;
  }
  if (auto enabled = env_flag("PAYFETCH_LOG_CONSOLE_ENABLED")) {
    config.console_enabled = *enabled;
  }
  if (auto enabled = env_flag("PAYFETCH_LOG_FILE_ENABLED")) {
    config.file_enabled = *enabled;
  }
  if (const char* dir = env_value("PAYFETCH_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("PAYFETCH_LOG_FORMAT")) {
    const std::string name = lowercase(format);
    if (name == "json" || name == "text") {
      config.file_config.format_json = (name == "json");
    }
  }
}

bool init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_active) {
    return false;
  }

  // TimeStamp and ThreadID for the formatters
  boost::log::add_common_attributes();

  auto core = boost::log::core::get();
  ActiveSinks sinks;
  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }
  g_active = std::move(sinks);
  return true;
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_active) {
    return;
  }
  detach(g_active->console);
  detach(g_active->file);
  g_active.reset();
}

}  // namespace logging
}  // namespace payfetch
