// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "dispatch_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#define PAYFETCH_LOG_COMPONENT "dispatch_engine"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace fetcher {

using logging::kv;

// =============================================================================
// StopSignal
// =============================================================================

void StopSignal::request() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requested_ = true;
  }
  cv_.notify_all();
}

bool StopSignal::requested() const {
  return requested_.load();
}

bool StopSignal::wait_for(std::chrono::milliseconds delay) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] {
    return requested_.load();
  });
}

// =============================================================================
// DispatchEngine
// =============================================================================

DispatchEngine::DispatchEngine(const DispatchConfig& config, TransportPool& transport)
    : config_(config)
    , transport_(transport) {
  if (config_.workers < 1) {
    PAYFETCH_LOG_WARN("Worker count below 1, using a single worker" << kv("workers", config_.workers));
    config_.workers = 1;
  }
}

DispatchEngine::~DispatchEngine() = default;

void DispatchEngine::request_stop() {
  if (!stop_.requested()) {
    PAYFETCH_LOG_INFO("Stop requested");
  }
  stop_.request();

  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (active_queue_) {
    active_queue_->shutdown();
  }
}

RunSummary DispatchEngine::run(
  const std::vector<std::string>& payment_ids, const FetchWorker& worker,
  const OutcomeHandler& on_outcome
) {
  RunSummary summary;
  summary.submitted = payment_ids.size();
  if (payment_ids.empty()) {
    return summary;
  }

  completed_ = 0;
  failed_ = 0;
  handler_error_ = nullptr;

  WorkQueue queue;
  for (const auto& payment_id : payment_ids) {
    if (!queue.enqueue(payment_id)) {
      throw std::runtime_error("work queue rejected payment " + payment_id);
    }
  }
  queue.close();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    active_queue_ = &queue;
    // A stop that arrived before the run started still applies
    if (stop_.requested()) {
      queue.shutdown();
    }
  }

  const int thread_count =
    static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(config_.workers), payment_ids.size()));

  PAYFETCH_LOG_INFO(
    "Dispatching payments" << kv("total", payment_ids.size()) << kv("workers", thread_count)
  );

  std::vector<std::thread> threads;
  threads.reserve(static_cast<std::size_t>(thread_count));
  for (int i = 0; i < thread_count; ++i) {
    threads.emplace_back(&DispatchEngine::worker_loop, this, i, std::ref(queue), std::cref(worker),
                         std::cref(on_outcome));
  }
  for (auto& t : threads) {
    t.join();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    active_queue_ = nullptr;
  }

  summary.completed = completed_.load();
  summary.failed = failed_.load();
  summary.cancelled = summary.submitted - summary.completed;

  PAYFETCH_LOG_INFO(
    "Dispatch finished" << kv("completed", summary.completed) << kv("failed", summary.failed)
                        << kv("cancelled", summary.cancelled)
  );

  if (handler_error_) {
    std::rethrow_exception(handler_error_);
  }
  return summary;
}

void DispatchEngine::worker_loop(
  int worker_id, WorkQueue& queue, const FetchWorker& worker, const OutcomeHandler& on_outcome
) {
  WorkerContext context(worker_id);

  while (auto payment_id = queue.dequeue()) {
    PaymentOutcome outcome;
    try {
      IHttpClient& client = transport_.get_client(context);
      outcome = worker.fetch(*payment_id, client, worker_id);
    } catch (const std::exception& e) {
      PAYFETCH_LOG_ERROR(
        "Unhandled error while fetching" << kv("payment_id", *payment_id)
                                         << kv("error", e.what())
      );
      outcome = PaymentOutcome::Failure(*payment_id, 0, std::string("Unhandled error: ") + e.what());
    } catch (...) {
      PAYFETCH_LOG_ERROR("Unhandled non-standard exception" << kv("payment_id", *payment_id));
      outcome = PaymentOutcome::Failure(*payment_id, 0, "Unhandled error: unknown exception");
    }

    try {
      on_outcome(outcome);
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!handler_error_) {
          handler_error_ = std::current_exception();
        }
      }
      PAYFETCH_LOG_ERROR("Outcome handler failed, stopping run" << kv("payment_id", *payment_id));
      request_stop();
      return;
    }

    if (!outcome.succeeded()) {
      ++failed_;
    }
    std::size_t done = ++completed_;
    PAYFETCH_LOG_INFO_EVERY_N(100, "Dispatch progress" << kv("completed", done));
  }
}

}  // namespace fetcher
}  // namespace payfetch
