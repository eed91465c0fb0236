// Copyright (c) 2026 ArcheBase
// Payfetch is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for file sink creation, formatting and escaping
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include "payfetch_file_sink.hpp"
#include "payfetch_log_format.hpp"
#include "payfetch_log_init.hpp"
#include "payfetch_log_macros.hpp"

namespace fs = std::filesystem;

using namespace payfetch::logging;

namespace {

std::string read_all_logs(const fs::path& dir) {
  std::string content;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::ifstream in(entry.path());
    std::stringstream ss;
    ss << in.rdbuf();
    content += ss.str();
  }
  return content;
}

}  // namespace

TEST(EscapeJsonTest, EscapesQuotesAndControlCharacters) {
  EXPECT_EQ(escape_json("plain"), "plain");
  EXPECT_EQ(escape_json("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape_json("a\\b"), "a\\\\b");
  EXPECT_EQ(escape_json("line1\nline2\r\t"), "line1\\nline2\\r\\t");
  EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
  EXPECT_EQ(escape_json("\b\f"), "\\b\\f");
}

TEST(FileSinkConfigTest, DefaultValues) {
  FileSinkConfig config;

  EXPECT_EQ(config.directory, "/var/log/payfetch");
  EXPECT_EQ(config.file_pattern, "payfetch_%Y%m%d_%H%M%S.log");
  EXPECT_EQ(config.rotation_size_mb, 100u);
  EXPECT_TRUE(config.rotate_at_midnight);
  EXPECT_EQ(config.max_files, 10);
  EXPECT_TRUE(config.format_json);
}

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("payfetch_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
    shutdown_logging();
  }

  void TearDown() override {
    shutdown_logging();
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  LoggingConfig file_only_config(bool json, const std::string& pattern) const {
    LoggingConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_level = severity_level::debug;
    config.file_config.directory = test_dir_.string();
    config.file_config.format_json = json;
    config.file_config.file_pattern = pattern;
    config.file_config.rotate_at_midnight = false;
    return config;
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, CreatesMissingDirectory) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested" / "logs").string();

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::exists(test_dir_ / "nested" / "logs"));
  sink->stop();
}

TEST_F(FileSinkTest, JsonPipelineWritesContext) {
  ASSERT_TRUE(init_logging(file_only_config(true, "json_%N.log")));
  {
    PAYFETCH_LOG_SCOPED_CONTEXT(std::string("pay-42"), std::string("3"));
    PAYFETCH_LOG_WARN("rate limited \"429\"");
  }
  shutdown_logging();

  std::string content = read_all_logs(test_dir_);
  EXPECT_NE(content.find("\"level\":\"WARN\""), std::string::npos);
  EXPECT_NE(content.find("rate limited \\\"429\\\""), std::string::npos);
  EXPECT_NE(content.find("\"payment_id\":\"pay-42\""), std::string::npos);
  EXPECT_NE(content.find("\"worker\":\"3\""), std::string::npos);
}

TEST_F(FileSinkTest, TextPipelineWritesContext) {
  ASSERT_TRUE(init_logging(file_only_config(false, "text_%N.log")));
  {
    PAYFETCH_LOG_SCOPED_CONTEXT(std::string("pay-7"), std::string("1"));
    PAYFETCH_LOG_ERROR("terminal failure");
  }
  shutdown_logging();

  std::string content = read_all_logs(test_dir_);
  EXPECT_NE(content.find("[ERROR]"), std::string::npos);
  EXPECT_NE(content.find("terminal failure"), std::string::npos);
  EXPECT_NE(content.find("payment_id=pay-7"), std::string::npos);
  EXPECT_NE(content.find("worker=1"), std::string::npos);
}

TEST_F(FileSinkTest, FilterDropsLowerSeverity) {
  LoggingConfig config = file_only_config(false, "filter_%N.log");
  config.file_level = severity_level::error;
  ASSERT_TRUE(init_logging(config));

  PAYFETCH_LOG_INFO("should be filtered");
  PAYFETCH_LOG_ERROR("should be kept");
  shutdown_logging();

  std::string content = read_all_logs(test_dir_);
  EXPECT_EQ(content.find("should be filtered"), std::string::npos);
  EXPECT_NE(content.find("should be kept"), std::string::npos);
}
