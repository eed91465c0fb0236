// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "fetch_app.hpp"

#define PAYFETCH_LOG_COMPONENT "main"
#include <payfetch_log_init.hpp>
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace app {

namespace {
std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

}  // namespace

}  // namespace app
}  // namespace payfetch

int main(int argc, char* argv[]) {
  using namespace payfetch::app;

  // Step 1: Parse command line arguments
  CliOptions options;
  std::string error;
  if (!parse_command_line(argc, argv, options, error)) {
    std::cerr << "Error: " << error << std::endl;
    print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (options.show_help) {
    print_usage(std::cout, argv[0]);
    return 0;
  }

  // Step 2: Defaults < config file < environment < command line
  FetchConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << options.config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  ConfigParser::apply_env_overrides(config);
  apply_cli_overrides(options, config);

  if (options.log_level && !payfetch::logging::parse_severity_level(*options.log_level)) {
    std::cerr << "Error: Unknown log level '" << *options.log_level << "'" << std::endl;
    return 1;
  }

  // Step 3: Logging (PAYFETCH_LOG_* environment variables still apply)
  payfetch::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  payfetch::logging::apply_env_overrides(log_config);
  payfetch::logging::LoggingSession logging_session(log_config);
  PAYFETCH_LOG_INFO(
    "payfetch starting" << payfetch::logging::kv("version", PAYFETCH_VERSION)
                        << payfetch::logging::kv("config_file", options.config_file)
  );

  // Step 4: Run, stopping early on SIGINT/SIGTERM
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  FetchApp app(config);
  std::atomic<bool> finished(false);
  std::thread watcher([&app, &finished]() {
    while (!finished.load()) {
      if (g_should_exit.load()) {
        std::cerr << "\nReceived signal, stopping after in-flight requests..." << std::endl;
        PAYFETCH_LOG_WARN("Interrupted by signal");
        app.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  int exit_code = app.run();

  finished.store(true);
  watcher.join();
  return exit_code;
}
