// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_RETRY_POLICY_HPP
#define PAYFETCH_RETRY_POLICY_HPP

#include <chrono>
#include <cmath>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "http_client.hpp"
#include "payment_outcome.hpp"

namespace payfetch {
namespace fetcher {

// Longest Retry-After hint taken at face value (100 years)
constexpr std::chrono::seconds kMaxRetryAfter{3153600000LL};

/**
 * Configuration for retry behavior
 */
struct RetryConfig {
  int max_retries = 3;                          // Total attempts per payment, including the first
  double backoff_factor = 1.2;                  // Delay after attempt n is backoff_factor^n seconds
  std::chrono::milliseconds max_delay{300000};  // Cap for computed delays; Retry-After is exact
  bool jitter = false;                          // Add random jitter to computed delays
  double jitter_factor = 0.5;                   // Jitter range: [1-factor, 1+factor]
};

/**
 * Classifies the result of one attempt into RETRY(delay) or TERMINAL(outcome).
 *
 * Retryable: HTTP 429, 500, 502, 503, 504 and transport failures, as long as
 * attempt < max_retries. Retry-After (whole seconds) replaces the computed
 * delay for retryable statuses and is not capped by max_delay.
 *
 * Thread-safe: a single policy is shared by all workers; the only mutable
 * state is the jitter generator, guarded by a mutex.
 */
class RetryPolicy {
public:
  explicit RetryPolicy(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * Delay before the attempt that follows attempt number `attempt`.
   *
   * Delay formula: backoff_factor ^ attempt seconds, capped at max_delay,
   * multiplied by a random factor in [1 - jitter_factor, 1 + jitter_factor]
   * when jitter is enabled.
   *
   * @param attempt Attempt that just failed (1-indexed)
   */
  std::chrono::milliseconds getDelay(int attempt) const {
    double delay_ms = 1000.0 * std::pow(config_.backoff_factor, static_cast<double>(attempt));

    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    if (config_.jitter) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_real_distribution<> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      delay_ms *= dist(rng_);
    }

    delay_ms = std::max(delay_ms, 0.0);

    return std::chrono::milliseconds(std::llround(delay_ms));
  }

  /**
   * Decide what to do after one attempt.
   *
   * @param payment_id Identifier being fetched (copied into the outcome)
   * @param result Response or transport failure of this attempt
   * @param attempt Attempt number (1-indexed)
   */
  RetryDecision decide(const std::string& payment_id, const HttpResult& result, int attempt) const;

  bool shouldRetry(int attempt) const {
    return attempt < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  /**
   * Rate-limit and transient server statuses
   */
  static bool isRetryableStatus(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
  }

  /**
   * Parse a Retry-After value given in whole seconds.
   *
   * @return std::nullopt unless the value is a non-empty run of digits
   *         (HTTP-date values are not honored). Saturates at kMaxRetryAfter.
   */
  static std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value);

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_RETRY_POLICY_HPP
