// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cctype>

#include "response_fields.hpp"

namespace payfetch {
namespace fetcher {

std::optional<std::chrono::seconds> RetryPolicy::parseRetryAfter(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }

  // Saturate so the delay stays representable as a steady_clock offset
  using rep = std::chrono::seconds::rep;
  const rep limit = kMaxRetryAfter.count();
  rep seconds = 0;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    seconds = std::min<rep>(limit, seconds * 10 + (c - '0'));
  }
  return std::chrono::seconds(seconds);
}

RetryDecision RetryPolicy::decide(
  const std::string& payment_id, const HttpResult& result, int attempt
) const {
  if (!result.success) {
    if (shouldRetry(attempt)) {
      return RetryDecision::Retry(getDelay(attempt));
    }
    return RetryDecision::Terminal(
      PaymentOutcome::Failure(payment_id, 0, "Request failed: " + result.error_message)
    );
  }

  const HttpResponse& response = result.response;
  const int status = response.status;

  if (isRetryableStatus(status)) {
    if (shouldRetry(attempt)) {
      auto delay = getDelay(attempt);
      auto retry_after = response.header("Retry-After");
      if (retry_after) {
        auto hinted = parseRetryAfter(*retry_after);
        if (hinted) {
          delay = *hinted;
        }
      }
      return RetryDecision::Retry(delay);
    }

    std::string error = "HTTP " + std::to_string(status);
    auto api_message = extract_api_message(response.body);
    if (api_message) {
      error += ": " + *api_message;
    }
    return RetryDecision::Terminal(PaymentOutcome::Failure(payment_id, status, error));
  }

  if (status >= 200 && status < 300) {
    auto fields = extract_success_fields(response.body);
    if (!fields) {
      return RetryDecision::Terminal(
        PaymentOutcome::Failure(payment_id, status, "invalid response body")
      );
    }
    return RetryDecision::Terminal(
      PaymentOutcome::Success(payment_id, status, fields->order_id, fields->external_reference)
    );
  }

  auto api_message = extract_api_message(response.body);
  return RetryDecision::Terminal(PaymentOutcome::Failure(
    payment_id, status, api_message ? *api_message : "HTTP " + std::to_string(status)
  ));
}

}  // namespace fetcher
}  // namespace payfetch
