// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "fetch_worker.hpp"

#include <thread>

#define PAYFETCH_LOG_COMPONENT "fetch_worker"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace fetcher {

using logging::kv;

FetchWorker::FetchWorker(
  const std::string& api_base, const RetryPolicy& policy, std::chrono::milliseconds timeout,
  Sleeper sleeper
)
    : api_base_(api_base)
    , policy_(policy)
    , timeout_(timeout)
    , sleeper_(std::move(sleeper)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
      return true;
    };
  }
}

std::string FetchWorker::url_for(const std::string& payment_id) const {
  return api_base_ + "/" + percent_encode(payment_id);
}

PaymentOutcome FetchWorker::fetch(
  const std::string& payment_id, IHttpClient& client, int worker_id
) const {
  PAYFETCH_LOG_SCOPED_CONTEXT(payment_id, std::to_string(worker_id));

  const std::string url = url_for(payment_id);

  for (int attempt = 1; attempt <= policy_.maxRetries(); ++attempt) {
    PAYFETCH_LOG_DEBUG("GET" << kv("url", url) << kv("attempt", attempt));

    HttpResult result = client.get(url, timeout_);
    RetryDecision decision = policy_.decide(payment_id, result, attempt);

    if (!decision.is_retry()) {
      const PaymentOutcome& outcome = decision.outcome;
      if (outcome.succeeded()) {
        PAYFETCH_LOG_DEBUG(
          "Resolved" << kv("status", outcome.http_status) << kv("order_id", outcome.order_id)
        );
      } else {
        PAYFETCH_LOG_WARN(
          "Fetch failed" << kv("status", outcome.http_status) << kv("error", outcome.error)
                         << kv("attempts", attempt)
        );
      }
      return decision.outcome;
    }

    if (!result.success) {
      PAYFETCH_LOG_WARN(
        "Transport error, retrying" << kv("error", result.error_message)
                                    << kv("delay_ms", decision.delay.count())
      );
    } else if (result.response.status == 429) {
      PAYFETCH_LOG_WARN_THROTTLE(
        5.0, "Rate limited by API" << kv("delay_ms", decision.delay.count())
      );
    } else {
      PAYFETCH_LOG_WARN(
        "Server error, retrying" << kv("status", result.response.status)
                                 << kv("delay_ms", decision.delay.count())
      );
    }

    if (!sleeper_(decision.delay)) {
      PAYFETCH_LOG_INFO("Backoff interrupted by stop request");
      return cancelled(payment_id);
    }
  }

  PAYFETCH_LOG_ERROR("Attempt loop ended without a terminal decision");
  return exhausted(payment_id);
}

}  // namespace fetcher
}  // namespace payfetch
