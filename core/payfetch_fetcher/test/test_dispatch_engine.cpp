// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for DispatchEngine using real threads and a scripted client
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dispatch_engine.hpp"
#include "fetcher_mocks.hpp"

using namespace payfetch::fetcher;
using payfetch::fetcher::test::make_response;

namespace {

constexpr const char* kApiBase = "http://api.test/v1/payments";

/**
 * Answers by identifier prefix:
 *   missing-*  404 with an API message
 *   throw-*    throws std::runtime_error
 *   busy-*     503 forever
 *   anything   200 with order.id = identifier
 */
class ScriptedHttpClient : public IHttpClient {
public:
  explicit ScriptedHttpClient(std::atomic<int>& calls)
      : calls_(calls) {}

  HttpResult get(const std::string& url, std::chrono::milliseconds) override {
    ++calls_;
    std::string id = url.substr(url.rfind('/') + 1);
    if (id.rfind("missing-", 0) == 0) {
      return make_response(404, R"({"message":"Payment not found"})");
    }
    if (id.rfind("throw-", 0) == 0) {
      throw std::runtime_error("socket exploded");
    }
    if (id.rfind("busy-", 0) == 0) {
      return make_response(503, "");
    }
    return make_response(200, R"({"order":{"id":")" + id + R"("},"external_reference":"ref"})");
  }

private:
  std::atomic<int>& calls_;
};

std::vector<std::string> make_ids(const std::string& prefix, int count) {
  std::vector<std::string> ids;
  for (int i = 0; i < count; ++i) {
    ids.push_back(prefix + std::to_string(i));
  }
  return ids;
}

}  // namespace

class DispatchEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_unique<TransportPool>(TransportConfig{}, [this](const HttpClientOptions&) {
      return std::make_unique<ScriptedHttpClient>(calls_);
    });
    RetryConfig retry;
    retry.max_retries = 3;
    policy_ = std::make_unique<RetryPolicy>(retry);
  }

  DispatchEngine::OutcomeHandler collector() {
    return [this](const PaymentOutcome& outcome) {
      std::lock_guard<std::mutex> lock(mutex_);
      outcomes_.push_back(outcome);
    };
  }

  std::atomic<int> calls_{0};
  std::unique_ptr<TransportPool> transport_;
  std::unique_ptr<RetryPolicy> policy_;
  std::mutex mutex_;
  std::vector<PaymentOutcome> outcomes_;
};

TEST_F(DispatchEngineTest, EmptyBatch) {
  DispatchEngine engine(DispatchConfig{4}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));

  auto summary = engine.run({}, worker, collector());

  EXPECT_EQ(summary.submitted, 0u);
  EXPECT_EQ(summary.completed, 0u);
  EXPECT_TRUE(outcomes_.empty());
  EXPECT_EQ(transport_->clients_created(), 0u);
}

TEST_F(DispatchEngineTest, ExactlyOneOutcomePerIdentifier) {
  DispatchEngine engine(DispatchConfig{8}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));
  auto ids = make_ids("pay-", 300);

  auto summary = engine.run(ids, worker, collector());

  EXPECT_EQ(summary.submitted, 300u);
  EXPECT_EQ(summary.completed, 300u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(summary.cancelled, 0u);
  EXPECT_EQ(summary.succeeded(), 300u);

  ASSERT_EQ(outcomes_.size(), ids.size());
  std::multiset<std::string> seen;
  for (const auto& outcome : outcomes_) {
    seen.insert(outcome.payment_id);
    EXPECT_EQ(outcome.order_id, outcome.payment_id);
  }
  for (const auto& id : ids) {
    EXPECT_EQ(seen.count(id), 1u) << id;
  }
  EXPECT_EQ(calls_.load(), 300);
  EXPECT_LE(transport_->clients_created(), 8u);
}

TEST_F(DispatchEngineTest, FewerIdentifiersThanWorkers) {
  DispatchEngine engine(DispatchConfig{16}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));

  auto summary = engine.run(make_ids("pay-", 3), worker, collector());

  EXPECT_EQ(summary.completed, 3u);
  EXPECT_LE(transport_->clients_created(), 3u);
}

TEST_F(DispatchEngineTest, WorkerExceptionsBecomeOutcomes) {
  DispatchEngine engine(DispatchConfig{4}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));
  std::vector<std::string> ids = {"pay-1", "throw-1", "missing-1", "pay-2", "throw-2"};

  auto summary = engine.run(ids, worker, collector());

  EXPECT_EQ(summary.completed, 5u);
  EXPECT_EQ(summary.failed, 3u);
  EXPECT_EQ(summary.succeeded(), 2u);

  std::map<std::string, PaymentOutcome> by_id;
  for (const auto& outcome : outcomes_) {
    by_id[outcome.payment_id] = outcome;
  }
  ASSERT_EQ(by_id.size(), 5u);
  EXPECT_EQ(by_id["throw-1"].error, "Unhandled error: socket exploded");
  EXPECT_EQ(by_id["throw-1"].http_status, 0);
  EXPECT_EQ(by_id["missing-1"].error, "Payment not found");
  EXPECT_EQ(by_id["missing-1"].http_status, 404);
  EXPECT_TRUE(by_id["pay-2"].succeeded());
}

TEST_F(DispatchEngineTest, StopFromHandlerCancelsQueuedWork) {
  DispatchEngine engine(DispatchConfig{1}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));

  auto summary = engine.run(make_ids("pay-", 20), worker, [&](const PaymentOutcome& outcome) {
    outcomes_.push_back(outcome);
    engine.request_stop();
  });

  EXPECT_TRUE(engine.stop_requested());
  EXPECT_EQ(summary.completed, 1u);
  EXPECT_EQ(summary.cancelled, 19u);
  EXPECT_EQ(outcomes_.size(), 1u);
}

TEST_F(DispatchEngineTest, StopBeforeRunStartsNothing) {
  DispatchEngine engine(DispatchConfig{4}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));
  engine.request_stop();

  auto summary = engine.run(make_ids("pay-", 10), worker, collector());

  EXPECT_EQ(summary.completed, 0u);
  EXPECT_EQ(summary.cancelled, 10u);
  EXPECT_EQ(calls_.load(), 0);
}

TEST_F(DispatchEngineTest, StopInterruptsBackoff) {
  RetryConfig slow;
  slow.max_retries = 5;
  slow.backoff_factor = 100.0;  // 100 s after the first attempt
  slow.max_delay = std::chrono::milliseconds(600000);
  RetryPolicy slow_policy(slow);

  DispatchEngine engine(DispatchConfig{2}, *transport_);
  FetchWorker worker(
    kApiBase, slow_policy, std::chrono::milliseconds(1000),
    [&engine](std::chrono::milliseconds delay) {
      return engine.stop_signal().wait_for(delay);
    }
  );

  std::thread stopper([&engine]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    engine.request_stop();
  });

  auto start = std::chrono::steady_clock::now();
  auto summary = engine.run({"busy-1", "busy-2"}, worker, collector());
  auto elapsed = std::chrono::steady_clock::now() - start;
  stopper.join();

  EXPECT_LT(elapsed, std::chrono::seconds(10));
  EXPECT_EQ(summary.completed, 2u);
  EXPECT_EQ(summary.failed, 2u);
  for (const auto& outcome : outcomes_) {
    EXPECT_EQ(outcome.error, "Cancelled");
  }
}

TEST_F(DispatchEngineTest, HandlerExceptionIsRethrown) {
  DispatchEngine engine(DispatchConfig{1}, *transport_);
  FetchWorker worker(kApiBase, *policy_, std::chrono::milliseconds(1000));
  std::atomic<int> delivered{0};

  EXPECT_THROW(
    engine.run(
      make_ids("pay-", 50), worker,
      [&delivered](const PaymentOutcome&) {
        if (++delivered == 3) {
          throw std::runtime_error("disk full");
        }
      }
    ),
    std::runtime_error
  );
  EXPECT_TRUE(engine.stop_requested());
  EXPECT_EQ(delivered.load(), 3);
}

TEST_F(DispatchEngineTest, InvalidWorkerCountFallsBackToOne) {
  DispatchEngine engine(DispatchConfig{0}, *transport_);
  EXPECT_EQ(engine.config().workers, 1);
}

TEST(StopSignalTest, WaitCompletesWithoutStop) {
  StopSignal signal;
  EXPECT_TRUE(signal.wait_for(std::chrono::milliseconds(10)));
  EXPECT_FALSE(signal.requested());
}

TEST(StopSignalTest, WaitReturnsEarlyOnStop) {
  StopSignal signal;
  std::thread t([&signal]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    signal.request();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(signal.wait_for(std::chrono::seconds(30)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  t.join();
  EXPECT_FALSE(signal.wait_for(std::chrono::seconds(30)));
}
