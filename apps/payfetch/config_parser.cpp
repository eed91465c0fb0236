// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include <http_client.hpp>
#include <retry_policy.hpp>
#include <transport_pool.hpp>

#define PAYFETCH_LOG_COMPONENT "config_parser"
#include <payfetch_log_init.hpp>
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace app {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

const char* non_empty_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || trim(value).empty()) {
    return nullptr;
  }
  return value;
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, FetchConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, FetchConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["input"]) {
      config.input = node["input"].as<std::string>();
    }
    if (node["output"]) {
      config.output = node["output"].as<std::string>();
    }
    if (node["workers"]) {
      config.workers = node["workers"].as<int>();
    }

    if (node["api"]) {
      parse_api(node["api"], config.api);
    }
    if (node["http"]) {
      parse_http(node["http"], config.http);
    }
    if (node["retry"]) {
      parse_retry(node["retry"], config.retry);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

void ConfigParser::parse_api(const YAML::Node& node, ApiConfig& api) {
  if (node["base_url"]) {
    api.base_url = node["base_url"].as<std::string>();
  }
  if (node["token"]) {
    api.token = node["token"].as<std::string>();
  }
}

void ConfigParser::parse_http(const YAML::Node& node, HttpConfig& http) {
  if (node["timeout_s"]) {
    http.timeout_s = node["timeout_s"].as<double>();
  }
  if (node["proxy"]) {
    http.proxy = node["proxy"].as<std::string>();
  }
  if (node["verify_ssl"]) {
    http.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["pool_size"]) {
    http.pool_size = node["pool_size"].as<size_t>();
  }
}

void ConfigParser::parse_retry(const YAML::Node& node, RetrySettings& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["backoff_factor"]) {
    retry.backoff_factor = node["backoff_factor"].as<double>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  if (node["jitter_factor"]) {
    retry.jitter_factor = node["jitter_factor"].as<double>();
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
}

void ConfigParser::apply_env_overrides(FetchConfig& config) {
  if (const char* token = non_empty_env("MP_TOKEN")) {
    config.api.token = token;
    PAYFETCH_LOG_DEBUG("API token taken from MP_TOKEN");
  }

  if (const char* proxy = non_empty_env("HTTPS_PROXY")) {
    config.http.proxy = trim(proxy);
    PAYFETCH_LOG_DEBUG("Proxy taken from HTTPS_PROXY");
  } else if (const char* plain_proxy = non_empty_env("HTTP_PROXY")) {
    config.http.proxy = trim(plain_proxy);
    PAYFETCH_LOG_DEBUG("Proxy taken from HTTP_PROXY");
  }
}

bool ConfigParser::validate(const FetchConfig& config, std::string& error_msg) {
  if (trim(config.api.token).empty()) {
    error_msg = "Missing API token: pass --token or set MP_TOKEN";
    return false;
  }

  if (config.input.empty()) {
    error_msg = "Missing input file: pass --infile";
    return false;
  }

  if (config.output.empty()) {
    error_msg = "Output path is empty";
    return false;
  }

  if (config.api.base_url.find("http://") != 0 && config.api.base_url.find("https://") != 0) {
    error_msg = "Invalid api.base_url - must start with http:// or https://";
    return false;
  }
  if (!fetcher::Url::parse(config.api.base_url)) {
    error_msg = "Invalid api.base_url: " + config.api.base_url;
    return false;
  }

  if (!config.http.proxy.empty()) {
    auto proxy = fetcher::Url::parse(config.http.proxy);
    if (!proxy || proxy->scheme != "http") {
      error_msg = "Invalid proxy - expected http://[user:pass@]host:port";
      return false;
    }
  }

  if (config.workers < 1 || config.workers > 256) {
    error_msg = "Invalid workers - must be between 1 and 256";
    return false;
  }

  if (config.http.pool_size < 1) {
    error_msg = "Invalid http.pool_size - must be at least 1";
    return false;
  }

  if (!(config.http.timeout_s > 0.0) || !std::isfinite(config.http.timeout_s)) {
    error_msg = "Invalid http.timeout_s - must be > 0";
    return false;
  }

  // Validate retry configuration
  if (config.retry.max_retries < 1 || config.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 1 and 100";
    return false;
  }

  if (!(config.retry.backoff_factor >= 1.0) || !std::isfinite(config.retry.backoff_factor)) {
    error_msg = "Invalid retry.backoff_factor - must be >= 1.0";
    return false;
  }

  if (config.retry.max_delay_ms < 0) {
    error_msg = "Invalid retry.max_delay_ms - must be >= 0";
    return false;
  }

  if (config.retry.jitter_factor < 0.0 || config.retry.jitter_factor >= 1.0) {
    error_msg = "Invalid retry.jitter_factor - must be in [0, 1)";
    return false;
  }

  return true;
}

// ============================================================================
// Conversions to library configuration
// ============================================================================

void convert_logging_config(
  const LoggingConfig& yaml_config, ::payfetch::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = ::payfetch::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = ::payfetch::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  // File sink config
  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

::payfetch::fetcher::TransportConfig to_transport_config(const FetchConfig& config) {
  ::payfetch::fetcher::TransportConfig transport;
  transport.token = trim(config.api.token);
  transport.proxy_url = config.http.proxy;
  transport.timeout =
    std::chrono::milliseconds(static_cast<int64_t>(std::llround(config.http.timeout_s * 1000.0)));
  transport.pool_size = config.http.pool_size;
  transport.verify_ssl = config.http.verify_ssl;
  return transport;
}

::payfetch::fetcher::RetryConfig to_retry_config(const FetchConfig& config) {
  ::payfetch::fetcher::RetryConfig retry;
  retry.max_retries = config.retry.max_retries;
  retry.backoff_factor = config.retry.backoff_factor;
  retry.max_delay = std::chrono::milliseconds(config.retry.max_delay_ms);
  retry.jitter = config.retry.jitter;
  retry.jitter_factor = config.retry.jitter_factor;
  return retry;
}

}  // namespace app
}  // namespace payfetch
