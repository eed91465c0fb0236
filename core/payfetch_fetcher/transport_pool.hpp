// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_TRANSPORT_POOL_HPP
#define PAYFETCH_TRANSPORT_POOL_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "http_client.hpp"

#ifndef PAYFETCH_VERSION
#define PAYFETCH_VERSION "0.0.0"
#endif

namespace payfetch {
namespace fetcher {

/**
 * Settings applied to every client handed out by the pool.
 */
struct TransportConfig {
  std::string token;  // Bearer token for the payments API
  std::string proxy_url;
  std::chrono::milliseconds timeout{15000};
  std::size_t pool_size = 20;  // Idle keep-alive connections per client
  bool verify_ssl = true;
  std::string user_agent = "payfetch/" PAYFETCH_VERSION;
};

/**
 * State owned by one dispatch thread. The client is created on the first
 * request from this worker and reused until the worker exits.
 */
struct WorkerContext {
  int worker_id = 0;
  std::unique_ptr<IHttpClient> client;

  explicit WorkerContext(int id)
      : worker_id(id) {}
};

/**
 * Hands every worker its own long-lived HTTP client.
 *
 * Clients are never shared between workers, so there is no locking on the
 * request path. The pool itself only keeps a creation counter.
 */
class TransportPool {
public:
  using ClientFactory = std::function<std::unique_ptr<IHttpClient>(const HttpClientOptions&)>;

  /**
   * @param config Authentication, proxy and pool settings
   * @param factory Client constructor; defaults to BeastHttpClient
   */
  explicit TransportPool(const TransportConfig& config, ClientFactory factory = nullptr);

  TransportPool(const TransportPool&) = delete;
  TransportPool& operator=(const TransportPool&) = delete;

  /**
   * Return the worker's client, creating it on first use.
   */
  IHttpClient& get_client(WorkerContext& worker);

  /**
   * Options every client is built with (headers included).
   */
  const HttpClientOptions& client_options() const {
    return options_;
  }

  const TransportConfig& config() const {
    return config_;
  }

  uint64_t clients_created() const {
    return clients_created_.load();
  }

private:
  TransportConfig config_;
  HttpClientOptions options_;
  ClientFactory factory_;
  std::atomic<uint64_t> clients_created_{0};
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_TRANSPORT_POOL_HPP
