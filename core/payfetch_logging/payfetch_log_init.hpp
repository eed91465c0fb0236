// Copyright (c) 2026 ArcheBase
// Payfetch is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef PAYFETCH_LOG_INIT_HPP
#define PAYFETCH_LOG_INIT_HPP

#include <optional>
#include <string>

#include "payfetch_console_sink.hpp"
#include "payfetch_file_sink.hpp"
#include "payfetch_log_severity.hpp"

namespace payfetch {
namespace logging {

/**
 * Which sinks a run gets and how verbose each one is.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  severity_level file_level = severity_level::debug;
  FileSinkConfig file_config;
};

/**
 * "debug", "info", "warn"/"warning", "error", "fatal", any case.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply PAYFETCH_LOG_* environment variables on top of config.
 *
 *   PAYFETCH_LOG_LEVEL            both sinks
 *   PAYFETCH_LOG_CONSOLE_LEVEL    console sink, wins over PAYFETCH_LOG_LEVEL
 *   PAYFETCH_LOG_FILE_LEVEL       file sink, wins over PAYFETCH_LOG_LEVEL
 *   PAYFETCH_LOG_CONSOLE_ENABLED  true/false, yes/no, on/off, 1/0
 *   PAYFETCH_LOG_FILE_ENABLED     same
 *   PAYFETCH_LOG_FILE_DIR         log directory
 *   PAYFETCH_LOG_FORMAT           "json" or "text"
 *
 * Empty or unparsable values leave the setting alone.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the configured sinks to the Boost.Log core.
 *
 * @return false if sinks are already attached (nothing changes)
 */
bool init_logging(const LoggingConfig& config);

/**
 * Detach the sinks after writing out every queued record. No-op when
 * logging is not running.
 */
void shutdown_logging();

/**
 * Logging for the lifetime of a scope, so queued records reach their sinks
 * on every exit path of main().
 */
class LoggingSession {
public:
  explicit LoggingSession(const LoggingConfig& config)
      : owns_sinks_(init_logging(config)) {}

  ~LoggingSession() {
    if (owns_sinks_) {
      shutdown_logging();
    }
  }

  LoggingSession(const LoggingSession&) = delete;
  LoggingSession& operator=(const LoggingSession&) = delete;

  bool owns_sinks() const {
    return owns_sinks_;
  }

private:
  bool owns_sinks_;
};

}  // namespace logging
}  // namespace payfetch

#endif  // PAYFETCH_LOG_INIT_HPP
