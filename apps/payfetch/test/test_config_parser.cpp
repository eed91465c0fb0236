// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for ConfigParser and FetchConfig
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <payfetch_log_init.hpp>
#include <retry_policy.hpp>
#include <transport_pool.hpp>

#include "../config_parser.hpp"
#include "../fetch_config.hpp"

namespace fs = std::filesystem;

using namespace payfetch::app;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_env();
    test_dir_ = fs::temp_directory_path() /
                ("payfetch_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    clear_env();
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  static void clear_env() {
    unsetenv("MP_TOKEN");
    unsetenv("HTTPS_PROXY");
    unsetenv("HTTP_PROXY");
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  static FetchConfig valid_config() {
    FetchConfig config;
    config.input = "ids.txt";
    config.api.token = "token";
    return config;
  }

  fs::path test_dir_;
};

// ============================================================================
// Defaults and YAML parsing
// ============================================================================

TEST_F(ConfigParserTest, Defaults) {
  FetchConfig config;
  EXPECT_EQ(config.output, "payments.csv");
  EXPECT_EQ(config.workers, 5);
  EXPECT_EQ(config.api.base_url, "https://api.mercadopago.com/v1/payments");
  EXPECT_DOUBLE_EQ(config.http.timeout_s, 15.0);
  EXPECT_EQ(config.http.pool_size, 20u);
  EXPECT_TRUE(config.http.verify_ssl);
  EXPECT_EQ(config.retry.max_retries, 3);
  EXPECT_DOUBLE_EQ(config.retry.backoff_factor, 1.2);
  EXPECT_FALSE(config.retry.jitter);
}

TEST_F(ConfigParserTest, ParseFullConfig) {
  const std::string yaml = R"(
input: /data/ids.txt
output: /data/orders.csv
workers: 12
api:
  base_url: http://localhost:8080/v1/payments
  token: abc
http:
  timeout_s: 2.5
  proxy: http://proxy:3128
  verify_ssl: false
  pool_size: 4
retry:
  max_retries: 5
  backoff_factor: 2.0
  max_delay_ms: 10000
  jitter: true
  jitter_factor: 0.25
logging:
  console:
    level: debug
    colors: false
  file:
    enabled: true
    directory: /tmp/payfetch-logs
    format: text
)";

  ConfigParser parser;
  FetchConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.input, "/data/ids.txt");
  EXPECT_EQ(config.output, "/data/orders.csv");
  EXPECT_EQ(config.workers, 12);
  EXPECT_EQ(config.api.base_url, "http://localhost:8080/v1/payments");
  EXPECT_EQ(config.api.token, "abc");
  EXPECT_DOUBLE_EQ(config.http.timeout_s, 2.5);
  EXPECT_EQ(config.http.proxy, "http://proxy:3128");
  EXPECT_FALSE(config.http.verify_ssl);
  EXPECT_EQ(config.http.pool_size, 4u);
  EXPECT_EQ(config.retry.max_retries, 5);
  EXPECT_DOUBLE_EQ(config.retry.backoff_factor, 2.0);
  EXPECT_EQ(config.retry.max_delay_ms, 10000);
  EXPECT_TRUE(config.retry.jitter);
  EXPECT_DOUBLE_EQ(config.retry.jitter_factor, 0.25);
  EXPECT_EQ(config.logging.console_level, "debug");
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_directory, "/tmp/payfetch-logs");
  EXPECT_EQ(config.logging.file_format, "text");
}

TEST_F(ConfigParserTest, PartialConfigKeepsDefaults) {
  ConfigParser parser;
  FetchConfig config;
  ASSERT_TRUE(parser.load_from_string("workers: 2\n", config));

  EXPECT_EQ(config.workers, 2);
  EXPECT_EQ(config.output, "payments.csv");
  EXPECT_EQ(config.retry.max_retries, 3);
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_test_file("payfetch.yaml", "api:\n  token: from-file\n");

  ConfigParser parser;
  FetchConfig config;
  ASSERT_TRUE(parser.load_from_file(path, config)) << parser.get_last_error();
  EXPECT_EQ(config.api.token, "from-file");
}

TEST_F(ConfigParserTest, MissingFile) {
  ConfigParser parser;
  FetchConfig config;
  EXPECT_FALSE(parser.load_from_file((test_dir_ / "missing.yaml").string(), config));
  EXPECT_NE(parser.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYaml) {
  ConfigParser parser;
  FetchConfig config;
  EXPECT_FALSE(parser.load_from_string("api: [unclosed", config));
  EXPECT_NE(parser.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(ConfigParserTest, WrongTypeIsAnError) {
  ConfigParser parser;
  FetchConfig config;
  EXPECT_FALSE(parser.load_from_string("workers: many\n", config));
}

// ============================================================================
// Environment overrides
// ============================================================================

TEST_F(ConfigParserTest, TokenFromEnvironment) {
  FetchConfig config;
  config.api.token = "from-yaml";
  setenv("MP_TOKEN", "from-env", 1);

  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.api.token, "from-env");
}

TEST_F(ConfigParserTest, HttpsProxyPreferredOverHttpProxy) {
  FetchConfig config;
  setenv("HTTP_PROXY", "http://plain:8080", 1);
  setenv("HTTPS_PROXY", " http://secure:3128 ", 1);

  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.http.proxy, "http://secure:3128");
}

TEST_F(ConfigParserTest, HttpProxyUsedAlone) {
  FetchConfig config;
  setenv("HTTP_PROXY", "http://plain:8080", 1);

  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.http.proxy, "http://plain:8080");
}

TEST_F(ConfigParserTest, EmptyEnvironmentIsIgnored) {
  FetchConfig config;
  config.api.token = "kept";
  setenv("MP_TOKEN", "   ", 1);

  ConfigParser::apply_env_overrides(config);
  EXPECT_EQ(config.api.token, "kept");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigParserTest, ValidConfigPasses) {
  std::string error;
  EXPECT_TRUE(ConfigParser::validate(valid_config(), error)) << error;
}

TEST_F(ConfigParserTest, MissingTokenFails) {
  auto config = valid_config();
  config.api.token = "  ";
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("MP_TOKEN"), std::string::npos);
}

TEST_F(ConfigParserTest, MissingInputFails) {
  auto config = valid_config();
  config.input.clear();
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("--infile"), std::string::npos);
}

TEST_F(ConfigParserTest, InvalidValuesFail) {
  std::string error;

  auto bad_url = valid_config();
  bad_url.api.base_url = "ftp://example.com";
  EXPECT_FALSE(ConfigParser::validate(bad_url, error));

  auto bad_proxy = valid_config();
  bad_proxy.http.proxy = "socks5://proxy:1080";
  EXPECT_FALSE(ConfigParser::validate(bad_proxy, error));

  auto no_workers = valid_config();
  no_workers.workers = 0;
  EXPECT_FALSE(ConfigParser::validate(no_workers, error));

  auto too_many_workers = valid_config();
  too_many_workers.workers = 257;
  EXPECT_FALSE(ConfigParser::validate(too_many_workers, error));

  auto no_pool = valid_config();
  no_pool.http.pool_size = 0;
  EXPECT_FALSE(ConfigParser::validate(no_pool, error));

  auto no_timeout = valid_config();
  no_timeout.http.timeout_s = 0.0;
  EXPECT_FALSE(ConfigParser::validate(no_timeout, error));

  auto no_retries = valid_config();
  no_retries.retry.max_retries = 0;
  EXPECT_FALSE(ConfigParser::validate(no_retries, error));

  auto shrinking_backoff = valid_config();
  shrinking_backoff.retry.backoff_factor = 0.5;
  EXPECT_FALSE(ConfigParser::validate(shrinking_backoff, error));

  auto bad_jitter = valid_config();
  bad_jitter.retry.jitter_factor = 1.5;
  EXPECT_FALSE(ConfigParser::validate(bad_jitter, error));
}

// ============================================================================
// Conversions
// ============================================================================

TEST_F(ConfigParserTest, TransportConversion) {
  auto config = valid_config();
  config.api.token = " secret \n";
  config.http.timeout_s = 2.5;
  config.http.pool_size = 7;
  config.http.verify_ssl = false;
  config.http.proxy = "http://proxy:3128";

  auto transport = to_transport_config(config);
  EXPECT_EQ(transport.token, "secret");
  EXPECT_EQ(transport.timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(transport.pool_size, 7u);
  EXPECT_FALSE(transport.verify_ssl);
  EXPECT_EQ(transport.proxy_url, "http://proxy:3128");
}

TEST_F(ConfigParserTest, RetryConversion) {
  auto config = valid_config();
  config.retry.max_retries = 4;
  config.retry.backoff_factor = 1.5;
  config.retry.max_delay_ms = 9000;

  auto retry = to_retry_config(config);
  EXPECT_EQ(retry.max_retries, 4);
  EXPECT_DOUBLE_EQ(retry.backoff_factor, 1.5);
  EXPECT_EQ(retry.max_delay, std::chrono::milliseconds(9000));
  EXPECT_FALSE(retry.jitter);
}

TEST_F(ConfigParserTest, LoggingConversion) {
  LoggingConfig yaml_config;
  yaml_config.console_level = "warn";
  yaml_config.file_level = "bogus";
  yaml_config.file_format = "text";
  yaml_config.max_files = 3;

  payfetch::logging::LoggingConfig log_config;
  convert_logging_config(yaml_config, log_config);

  EXPECT_EQ(log_config.console_level, payfetch::logging::severity_level::warn);
  EXPECT_EQ(log_config.file_level, payfetch::logging::severity_level::debug);
  EXPECT_FALSE(log_config.file_config.format_json);
  EXPECT_EQ(log_config.file_config.max_files, 3);
  EXPECT_EQ(log_config.file_config.directory, "/var/log/payfetch");
}
