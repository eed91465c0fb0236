// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_FETCH_WORKER_HPP
#define PAYFETCH_FETCH_WORKER_HPP

#include <chrono>
#include <functional>
#include <string>

#include "http_client.hpp"
#include "payment_outcome.hpp"
#include "retry_policy.hpp"

namespace payfetch {
namespace fetcher {

/**
 * Resolves one payment identifier to exactly one PaymentOutcome.
 *
 * Runs the attempt loop: GET {api_base}/{payment_id}, ask the RetryPolicy,
 * wait and try again or stop. Waiting blocks only the calling thread.
 *
 * The worker holds no per-request state and may be shared by all dispatch
 * threads; each thread passes in its own client.
 */
class FetchWorker {
public:
  /**
   * Waits for the given delay. Returns false if the wait was interrupted and
   * the fetch should be abandoned.
   */
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  /**
   * @param api_base Base URL, the identifier is appended as the last path segment
   * @param policy Retry policy, must outlive the worker
   * @param timeout Per-request timeout handed to the client
   * @param sleeper Backoff wait; defaults to std::this_thread::sleep_for
   */
  FetchWorker(
    const std::string& api_base, const RetryPolicy& policy, std::chrono::milliseconds timeout,
    Sleeper sleeper = nullptr
  );

  /**
   * Fetch one payment.
   *
   * Transport failures and HTTP errors are reported in the outcome, never
   * thrown. Exceptions escaping the client propagate to the caller.
   *
   * @param payment_id Identifier to resolve
   * @param client Client owned by the calling thread
   * @param worker_id Used for log context only
   */
  PaymentOutcome fetch(const std::string& payment_id, IHttpClient& client, int worker_id = 0) const;

  /**
   * Request URL for an identifier, percent-encoded as one path segment
   */
  std::string url_for(const std::string& payment_id) const;

  /**
   * Outcome used when the attempt loop ends without a terminal decision.
   */
  static PaymentOutcome exhausted(const std::string& payment_id) {
    return PaymentOutcome::Failure(payment_id, 0, "Exhausted retries");
  }

  /**
   * Outcome used when a backoff wait was interrupted by a stop request.
   */
  static PaymentOutcome cancelled(const std::string& payment_id) {
    return PaymentOutcome::Failure(payment_id, 0, "Cancelled");
  }

private:
  std::string api_base_;
  const RetryPolicy& policy_;
  std::chrono::milliseconds timeout_;
  Sleeper sleeper_;
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_FETCH_WORKER_HPP
