// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_CLI_OPTIONS_HPP
#define PAYFETCH_CLI_OPTIONS_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "fetch_config.hpp"

namespace payfetch {
namespace app {

/**
 * Command-line arguments. Unset optionals leave the configured value alone.
 */
struct CliOptions {
  bool show_help = false;
  std::string config_file;

  std::optional<std::string> infile;
  std::optional<std::string> outfile;
  std::optional<std::string> api_base;
  std::optional<std::string> token;
  std::optional<std::string> proxy;
  std::optional<std::string> log_level;
  std::optional<double> timeout_s;
  std::optional<double> backoff_factor;
  std::optional<int> retries;
  std::optional<int> workers;
  std::optional<size_t> pool_size;
  bool insecure = false;
};

/**
 * Parse argv.
 *
 * @param error Set when false is returned
 * @return false on unknown flags, missing values or malformed numbers
 */
bool parse_command_line(int argc, const char* const argv[], CliOptions& options, std::string& error);

/**
 * Copy every option given on the command line into config.
 */
void apply_cli_overrides(const CliOptions& options, FetchConfig& config);

void print_usage(std::ostream& out, const char* program_name);

}  // namespace app
}  // namespace payfetch

#endif  // PAYFETCH_CLI_OPTIONS_HPP
