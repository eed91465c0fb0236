// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transport_pool.hpp"

#include <stdexcept>

#define PAYFETCH_LOG_COMPONENT "transport_pool"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace fetcher {

using logging::kv;

TransportPool::TransportPool(const TransportConfig& config, ClientFactory factory)
    : config_(config)
    , factory_(std::move(factory)) {
  options_.default_headers["Authorization"] = "Bearer " + config_.token;
  options_.default_headers["Accept"] = "application/json";
  options_.default_headers["User-Agent"] = config_.user_agent;
  options_.proxy_url = config_.proxy_url;
  options_.timeout = config_.timeout;
  options_.pool_size = config_.pool_size;
  options_.verify_ssl = config_.verify_ssl;

  if (!factory_) {
    factory_ = [](const HttpClientOptions& options) -> std::unique_ptr<IHttpClient> {
      return std::make_unique<BeastHttpClient>(options);
    };
  }
}

IHttpClient& TransportPool::get_client(WorkerContext& worker) {
  if (!worker.client) {
    worker.client = factory_(options_);
    if (!worker.client) {
      throw std::runtime_error("HTTP client factory returned no client");
    }
    ++clients_created_;
    PAYFETCH_LOG_DEBUG(
      "Created HTTP client" << kv("worker", worker.worker_id) << kv("pool_size", options_.pool_size)
                            << kv("proxy", options_.proxy_url.empty() ? "none" : "set")
    );
  }
  return *worker.client;
}

}  // namespace fetcher
}  // namespace payfetch
