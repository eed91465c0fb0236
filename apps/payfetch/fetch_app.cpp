// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "fetch_app.hpp"

#include <chrono>
#include <fstream>
#include <vector>

#include <fetch_worker.hpp>
#include <result_sink.hpp>
#include <retry_policy.hpp>

#include "config_parser.hpp"
#include "identifier_source.hpp"

#define PAYFETCH_LOG_COMPONENT "fetch_app"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace app {

using logging::kv;

FetchApp::FetchApp(const FetchConfig& config, std::ostream& out, std::ostream& err)
    : config_(config)
    , out_(out)
    , err_(err) {}

int FetchApp::fail(const std::string& message) {
  last_error_ = message;
  PAYFETCH_LOG_FATAL(message);
  err_ << "Error: " << message << std::endl;
  return 1;
}

void FetchApp::request_stop() {
  stop_requested_ = true;
  std::lock_guard<std::mutex> lock(engine_mutex_);
  if (engine_) {
    engine_->request_stop();
  }
}

int FetchApp::run() {
  summary_ = fetcher::RunSummary{};

  std::string error;
  if (!ConfigParser::validate(config_, error)) {
    return fail(error);
  }

  std::vector<std::string> ids;
  if (!read_identifiers(config_.input, ids, error)) {
    return fail(error);
  }
  if (ids.empty()) {
    out_ << "No payment IDs found." << std::endl;
    return 0;
  }

  std::ofstream file(config_.output, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    return fail("Cannot open output file: " + config_.output);
  }

  fetcher::TransportPool transport(to_transport_config(config_), client_factory_);
  fetcher::RetryPolicy policy(to_retry_config(config_));
  fetcher::DispatchEngine engine(fetcher::DispatchConfig{config_.workers}, transport);
  fetcher::FetchWorker worker(
    config_.api.base_url, policy, transport.config().timeout,
    [&engine](std::chrono::milliseconds delay) {
      return engine.stop_signal().wait_for(delay);
    }
  );

  PAYFETCH_LOG_INFO(
    "Starting run" << kv("payments", ids.size()) << kv("workers", config_.workers)
                   << kv("output", config_.output) << kv("api", config_.api.base_url)
  );

  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_ = &engine;
    if (stop_requested_) {
      engine.request_stop();
    }
  }

  try {
    fetcher::ResultSink sink(file, ids.size(), config_.output, [this](const std::string& line) {
      out_ << line << std::endl;
    });
    summary_ = engine.run(ids, worker, [&sink](const fetcher::PaymentOutcome& outcome) {
      sink.write(outcome);
    });
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(engine_mutex_);
      engine_ = nullptr;
    }
    return fail(std::string("Output failed: ") + e.what());
  }

  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_ = nullptr;
  }

  PAYFETCH_LOG_INFO(
    "Run summary" << kv("submitted", summary_.submitted) << kv("succeeded", summary_.succeeded())
                  << kv("failed", summary_.failed) << kv("cancelled", summary_.cancelled)
                  << kv("clients", transport.clients_created())
  );

  if (summary_.cancelled > 0) {
    out_ << "Interrupted: " << summary_.cancelled << " payment IDs were not processed."
         << std::endl;
  }
  out_ << "Done. Processed " << summary_.completed << " payment IDs. Output: " << config_.output
       << std::endl;
  return 0;
}

}  // namespace app
}  // namespace payfetch
