// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <cstring>
#include <stdexcept>

namespace payfetch {
namespace app {

namespace {

bool parse_double(const std::string& text, double& value) {
  try {
    size_t used = 0;
    value = std::stod(text, &used);
    return used == text.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

bool parse_int(const std::string& text, int& value) {
  try {
    size_t used = 0;
    value = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

}  // namespace

bool parse_command_line(int argc, const char* const argv[], CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];

    if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
      options.show_help = true;
      continue;
    }
    if (strcmp(arg, "--insecure") == 0) {
      options.insecure = true;
      continue;
    }

    // Every other flag takes exactly one value
    if (i + 1 >= argc) {
      if (strncmp(arg, "--", 2) == 0) {
        error = std::string(arg) + " requires a value";
      } else {
        error = "Unknown argument: " + std::string(arg);
      }
      return false;
    }
    const std::string value = argv[i + 1];

    if (strcmp(arg, "--config") == 0) {
      options.config_file = value;
    } else if (strcmp(arg, "--infile") == 0) {
      options.infile = value;
    } else if (strcmp(arg, "--outfile") == 0) {
      options.outfile = value;
    } else if (strcmp(arg, "--api-base") == 0) {
      options.api_base = value;
    } else if (strcmp(arg, "--token") == 0) {
      options.token = value;
    } else if (strcmp(arg, "--proxy") == 0) {
      options.proxy = value;
    } else if (strcmp(arg, "--log-level") == 0) {
      options.log_level = value;
    } else if (strcmp(arg, "--timeout") == 0) {
      double timeout = 0.0;
      if (!parse_double(value, timeout)) {
        error = "--timeout requires a number of seconds";
        return false;
      }
      options.timeout_s = timeout;
    } else if (strcmp(arg, "--backoff") == 0) {
      double backoff = 0.0;
      if (!parse_double(value, backoff)) {
        error = "--backoff requires a number";
        return false;
      }
      options.backoff_factor = backoff;
    } else if (strcmp(arg, "--retries") == 0) {
      int retries = 0;
      if (!parse_int(value, retries)) {
        error = "--retries requires an integer";
        return false;
      }
      options.retries = retries;
    } else if (strcmp(arg, "--workers") == 0) {
      int workers = 0;
      if (!parse_int(value, workers)) {
        error = "--workers requires an integer";
        return false;
      }
      options.workers = workers;
    } else if (strcmp(arg, "--pool-size") == 0) {
      int pool_size = 0;
      if (!parse_int(value, pool_size) || pool_size < 0) {
        error = "--pool-size requires a non-negative integer";
        return false;
      }
      options.pool_size = static_cast<size_t>(pool_size);
    } else {
      error = "Unknown argument: " + std::string(arg);
      return false;
    }
    ++i;
  }
  return true;
}

void apply_cli_overrides(const CliOptions& options, FetchConfig& config) {
  if (options.infile) {
    config.input = *options.infile;
  }
  if (options.outfile) {
    config.output = *options.outfile;
  }
  if (options.api_base) {
    config.api.base_url = *options.api_base;
  }
  if (options.token) {
    config.api.token = *options.token;
  }
  if (options.proxy) {
    config.http.proxy = *options.proxy;
  }
  if (options.timeout_s) {
    config.http.timeout_s = *options.timeout_s;
  }
  if (options.pool_size) {
    config.http.pool_size = *options.pool_size;
  }
  if (options.insecure) {
    config.http.verify_ssl = false;
  }
  if (options.retries) {
    config.retry.max_retries = *options.retries;
  }
  if (options.backoff_factor) {
    config.retry.backoff_factor = *options.backoff_factor;
  }
  if (options.workers) {
    config.workers = *options.workers;
  }
  if (options.log_level) {
    config.logging.console_level = *options.log_level;
  }
}

void print_usage(std::ostream& out, const char* program_name) {
  out << "Usage: " << program_name << " --infile FILE [OPTIONS]\n"
      << "\n"
      << "Payfetch - resolve payment IDs to order and external references\n"
      << "\n"
      << "Options:\n"
      << "  --infile FILE         Text file with one payment ID per line (# starts a comment)\n"
      << "  --outfile FILE        Output CSV (default: payments.csv)\n"
      << "  --config PATH         YAML configuration file\n"
      << "  --token TOKEN         API access token (default: $MP_TOKEN)\n"
      << "  --api-base URL        Payments endpoint (default: https://api.mercadopago.com/v1/payments)\n"
      << "  --timeout SECONDS     HTTP timeout per operation (default: 15)\n"
      << "  --retries N           Attempts per payment for 429/5xx and network errors (default: 3)\n"
      << "  --backoff FACTOR      Retry delay is FACTOR^attempt seconds (default: 1.2)\n"
      << "  --proxy URL           http://[user:pass@]host:port (default: $HTTPS_PROXY or $HTTP_PROXY)\n"
      << "  --workers N           Concurrent requests (default: 5)\n"
      << "  --pool-size N         Idle keep-alive connections per worker (default: 20)\n"
      << "  --insecure            Do not verify TLS certificates\n"
      << "  --log-level LEVEL     Console log level: debug, info, warn, error, fatal\n"
      << "  --help                Show this help message\n"
      << "\n"
      << "Precedence: defaults < config file < environment < command line.\n"
      << "\n"
      << "Output columns: payment_id, order_id, external_reference, http_status, error\n"
      << "\n"
      << "Examples:\n"
      << "  " << program_name << " --infile ids.txt --outfile orders.csv --workers 10\n"
      << "  MP_TOKEN=... " << program_name << " --config payfetch.yaml --infile ids.txt\n";
}

}  // namespace app
}  // namespace payfetch
