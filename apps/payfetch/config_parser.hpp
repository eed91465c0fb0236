// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_CONFIG_PARSER_HPP
#define PAYFETCH_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "fetch_config.hpp"

namespace payfetch {
namespace logging {
struct LoggingConfig;
}
namespace fetcher {
struct RetryConfig;
struct TransportConfig;
}  // namespace fetcher
}  // namespace payfetch

namespace payfetch {
namespace app {

/**
 * Convert LoggingConfig to payfetch::logging::LoggingConfig.
 * Unknown level names keep the logging library defaults.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::payfetch::logging::LoggingConfig& log_config
);

/**
 * Build the transport settings for the fetcher from a validated config.
 */
::payfetch::fetcher::TransportConfig to_transport_config(const FetchConfig& config);

/**
 * Build the retry settings for the fetcher from a validated config.
 */
::payfetch::fetcher::RetryConfig to_retry_config(const FetchConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file.
   * Keys absent from the file keep their current values.
   */
  bool load_from_file(const std::string& path, FetchConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, FetchConfig& config);

  /**
   * Apply environment overrides:
   *   MP_TOKEN                 - api.token
   *   HTTPS_PROXY, HTTP_PROXY  - http.proxy (first one set wins)
   */
  static void apply_env_overrides(FetchConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const FetchConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  void parse_api(const YAML::Node& node, ApiConfig& api);
  void parse_http(const YAML::Node& node, HttpConfig& http);
  void parse_retry(const YAML::Node& node, RetrySettings& retry);
  void parse_logging(const YAML::Node& node, LoggingConfig& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace app
}  // namespace payfetch

#endif  // PAYFETCH_CONFIG_PARSER_HPP
