// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_FETCH_CONFIG_HPP
#define PAYFETCH_FETCH_CONFIG_HPP

#include <cstddef>
#include <string>

namespace payfetch {
namespace app {

/**
 * Payments API endpoint and credentials
 */
struct ApiConfig {
  std::string base_url = "https://api.mercadopago.com/v1/payments";
  std::string token;
};

/**
 * Transport settings, applied to every worker's client
 */
struct HttpConfig {
  double timeout_s = 15.0;
  std::string proxy;  // http://[user:pass@]host:port, empty = direct
  bool verify_ssl = true;
  size_t pool_size = 20;
};

/**
 * Retry settings for 429/5xx responses and transport errors
 */
struct RetrySettings {
  int max_retries = 3;
  double backoff_factor = 1.2;
  int max_delay_ms = 300000;
  bool jitter = false;
  double jitter_factor = 0.5;
};

/**
 * Logging configuration as read from YAML
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/payfetch";
  std::string file_pattern = "payfetch_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  size_t rotation_size_mb = 100;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete configuration of one payfetch run
 */
struct FetchConfig {
  std::string input;                    // Text file, one payment ID per line
  std::string output = "payments.csv";  // CSV destination, truncated on start
  int workers = 5;

  ApiConfig api;
  HttpConfig http;
  RetrySettings retry;
  LoggingConfig logging;
};

}  // namespace app
}  // namespace payfetch

#endif  // PAYFETCH_FETCH_CONFIG_HPP
