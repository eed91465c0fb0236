// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_PAYMENT_OUTCOME_HPP
#define PAYFETCH_PAYMENT_OUTCOME_HPP

#include <array>
#include <chrono>
#include <string>
#include <utility>

namespace payfetch {
namespace fetcher {

/**
 * Terminal record for one payment identifier.
 *
 * Produced exactly once per identifier by FetchWorker, never modified
 * afterwards and handed to ResultSink by value.
 *
 * http_status == 0 means no HTTP response was obtained (transport failure
 * or a synthesized terminal error).
 */
struct PaymentOutcome {
  std::string payment_id;
  std::string order_id;
  std::string external_reference;
  int http_status = 0;
  std::string error;

  bool succeeded() const {
    return error.empty();
  }

  static PaymentOutcome Success(
    const std::string& payment_id, int status, const std::string& order_id,
    const std::string& external_reference
  ) {
    return {payment_id, order_id, external_reference, status, ""};
  }

  static PaymentOutcome Failure(const std::string& payment_id, int status, const std::string& error) {
    return {payment_id, "", "", status, error};
  }
};

inline bool operator==(const PaymentOutcome& a, const PaymentOutcome& b) {
  return a.payment_id == b.payment_id && a.order_id == b.order_id &&
         a.external_reference == b.external_reference && a.http_status == b.http_status &&
         a.error == b.error;
}

inline bool operator!=(const PaymentOutcome& a, const PaymentOutcome& b) {
  return !(a == b);
}

/**
 * Output column order, stable for the whole run.
 */
constexpr std::array<const char*, 5> kOutcomeColumns = {
  "payment_id", "order_id", "external_reference", "http_status", "error"
};

/**
 * Result of consulting the retry policy after one attempt.
 */
struct RetryDecision {
  enum class Action { Retry, Terminal };

  Action action = Action::Terminal;
  std::chrono::milliseconds delay{0};  // Only meaningful for Retry
  PaymentOutcome outcome;              // Only meaningful for Terminal

  bool is_retry() const {
    return action == Action::Retry;
  }

  static RetryDecision Retry(std::chrono::milliseconds delay) {
    RetryDecision decision;
    decision.action = Action::Retry;
    decision.delay = delay;
    return decision;
  }

  static RetryDecision Terminal(PaymentOutcome outcome) {
    RetryDecision decision;
    decision.action = Action::Terminal;
    decision.outcome = std::move(outcome);
    return decision;
  }
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_PAYMENT_OUTCOME_HPP
