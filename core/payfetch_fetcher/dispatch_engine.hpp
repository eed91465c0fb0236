// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_DISPATCH_ENGINE_HPP
#define PAYFETCH_DISPATCH_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "fetch_worker.hpp"
#include "payment_outcome.hpp"
#include "transport_pool.hpp"
#include "work_queue.hpp"

namespace payfetch {
namespace fetcher {

/**
 * Dispatch engine configuration
 */
struct DispatchConfig {
  int workers = 5;  // Number of dispatch threads
};

/**
 * Counters for one run
 */
struct RunSummary {
  std::size_t submitted = 0;  // Identifiers handed to run()
  std::size_t completed = 0;  // Outcomes delivered to the handler
  std::size_t failed = 0;     // Delivered outcomes carrying an error
  std::size_t cancelled = 0;  // Identifiers never delivered because of a stop

  std::size_t succeeded() const {
    return completed - failed;
  }
};

/**
 * Stop flag with an interruptible wait, shared by the engine and the
 * backoff sleeps of its workers.
 */
class StopSignal {
public:
  void request();
  bool requested() const;

  /**
   * Wait for the delay or until request() is called.
   *
   * @return true if the full delay elapsed, false if interrupted
   */
  bool wait_for(std::chrono::milliseconds delay) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> requested_{false};
};

/**
 * Runs FetchWorker over a batch of identifiers on a fixed pool of threads.
 *
 * Every dispatch thread owns a WorkerContext and so its own HTTP client.
 * Outcomes are passed to the handler as soon as they exist, from the thread
 * that produced them, in completion order. The handler must be thread-safe.
 *
 * Exceptions thrown while fetching one identifier become a failed outcome
 * for that identifier. An exception thrown by the handler stops the run and
 * is rethrown from run() after all threads have joined.
 */
class DispatchEngine {
public:
  using OutcomeHandler = std::function<void(const PaymentOutcome&)>;

  DispatchEngine(const DispatchConfig& config, TransportPool& transport);
  ~DispatchEngine();

  DispatchEngine(const DispatchEngine&) = delete;
  DispatchEngine& operator=(const DispatchEngine&) = delete;

  /**
   * Fetch every identifier and deliver exactly one outcome per identifier,
   * unless a stop is requested.
   *
   * @param payment_ids Identifiers in submission order
   * @param worker Fetch logic shared by all threads
   * @param on_outcome Called once per outcome, possibly concurrently
   * @return Counters for the run
   */
  RunSummary run(
    const std::vector<std::string>& payment_ids, const FetchWorker& worker,
    const OutcomeHandler& on_outcome
  );

  /**
   * Ask a running (or the next) run to finish early.
   *
   * Queued identifiers are not started and backoff waits are cut short.
   * Requests already on the wire finish or time out. Thread-safe.
   */
  void request_stop();

  bool stop_requested() const {
    return stop_.requested();
  }

  /**
   * Stop signal to wire into FetchWorker's sleeper.
   */
  const StopSignal& stop_signal() const {
    return stop_;
  }

  const DispatchConfig& config() const {
    return config_;
  }

private:
  void worker_loop(
    int worker_id, WorkQueue& queue, const FetchWorker& worker, const OutcomeHandler& on_outcome
  );

  DispatchConfig config_;
  TransportPool& transport_;
  StopSignal stop_;

  std::mutex queue_mutex_;
  WorkQueue* active_queue_ = nullptr;

  std::atomic<std::size_t> completed_{0};
  std::atomic<std::size_t> failed_{0};

  std::mutex error_mutex_;
  std::exception_ptr handler_error_;
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_DISPATCH_ENGINE_HPP
