// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_FETCH_APP_HPP
#define PAYFETCH_FETCH_APP_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include <dispatch_engine.hpp>
#include <transport_pool.hpp>

#include "fetch_config.hpp"

namespace payfetch {
namespace app {

/**
 * One payfetch run: read IDs, fetch them concurrently, write the CSV.
 *
 * User-facing lines (progress, final summary) go to `out`, configuration
 * problems to `err`. Everything else goes to the log.
 */
class FetchApp {
public:
  explicit FetchApp(const FetchConfig& config, std::ostream& out = std::cout, std::ostream& err = std::cerr);

  FetchApp(const FetchApp&) = delete;
  FetchApp& operator=(const FetchApp&) = delete;

  /**
   * Replace the HTTP client factory (tests inject fakes here).
   */
  void set_client_factory(fetcher::TransportPool::ClientFactory factory) {
    client_factory_ = std::move(factory);
  }

  /**
   * Execute the run.
   *
   * @return Process exit code: 0 when the run completed or was interrupted,
   *         1 on configuration or output errors
   */
  int run();

  /**
   * Interrupt a run in progress, or the next one. Thread-safe.
   */
  void request_stop();

  const fetcher::RunSummary& summary() const {
    return summary_;
  }

  /**
   * Last configuration or output error
   */
  const std::string& get_last_error() const {
    return last_error_;
  }

private:
  int fail(const std::string& message);

  FetchConfig config_;
  std::ostream& out_;
  std::ostream& err_;
  fetcher::TransportPool::ClientFactory client_factory_;

  std::mutex engine_mutex_;
  fetcher::DispatchEngine* engine_ = nullptr;
  std::atomic<bool> stop_requested_{false};

  fetcher::RunSummary summary_;
  std::string last_error_;
};

}  // namespace app
}  // namespace payfetch

#endif  // PAYFETCH_FETCH_APP_HPP
