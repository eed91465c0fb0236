// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_HTTP_CLIENT_HPP
#define PAYFETCH_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace payfetch {
namespace fetcher {

/**
 * Parsed absolute http(s) URL.
 */
struct Url {
  std::string scheme;    // "http" or "https"
  std::string userinfo;  // "user:pass" (still percent-encoded), may be empty
  std::string host;      // Without IPv6 brackets
  std::string port;      // Always set, defaults to 80 / 443
  std::string target;    // Path and query, at least "/"

  bool is_https() const {
    return scheme == "https";
  }

  /**
   * Value for the Host header and CONNECT authority ("host" or "host:port"
   * when the port is not the scheme default).
   */
  std::string authority() const;

  /**
   * Parse an absolute URL.
   *
   * @return std::nullopt if the scheme is not http/https or the host is empty
   */
  static std::optional<Url> parse(const std::string& url);
};

/**
 * Options shared by every request of one client.
 */
struct HttpClientOptions {
  std::map<std::string, std::string> default_headers;  // Sent with every request
  std::string proxy_url;                               // http://[user:pass@]host:port, empty = direct
  std::chrono::milliseconds timeout{15000};            // Per network operation
  std::size_t pool_size = 20;                          // Max idle keep-alive connections
  bool verify_ssl = true;
};

/**
 * HTTP response as seen by the fetch logic.
 */
struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // Keys lower-cased
  std::string body;

  /**
   * Case-insensitive header lookup.
   */
  std::optional<std::string> header(const std::string& name) const;
};

/**
 * Outcome of one request: either a complete HTTP response (any status) or a
 * transport-level failure (DNS, connect, TLS, timeout, broken connection).
 */
struct HttpResult {
  bool success;
  HttpResponse response;      // Valid when success
  std::string error_message;  // Transport error when !success

  static HttpResult Success(HttpResponse response) {
    return {true, std::move(response), ""};
  }

  static HttpResult Failure(const std::string& message) {
    return {false, HttpResponse{}, message};
  }
};

/**
 * Interface for issuing GET requests.
 * One instance is used by one thread at a time.
 */
class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  /**
   * Issue a GET request.
   *
   * @param url Absolute URL
   * @param timeout Per-operation timeout (resolve, connect, handshake, write, read)
   * @return Response for any HTTP status, Failure for transport errors
   */
  virtual HttpResult get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

/**
 * HTTP/1.1 client on Boost.Beast with TLS (OpenSSL) and keep-alive reuse.
 *
 * Each client owns its own io_context and its own pool of idle connections,
 * so instances never share state. Not thread-safe: give every worker its own
 * client.
 *
 * Proxy support: plain-http targets are sent to the proxy in absolute form,
 * https targets are tunnelled with CONNECT. Credentials in the proxy URL are
 * sent as Proxy-Authorization: Basic.
 */
class BeastHttpClient : public IHttpClient {
public:
  explicit BeastHttpClient(const HttpClientOptions& options);
  ~BeastHttpClient() override;

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  HttpResult get(const std::string& url, std::chrono::milliseconds timeout) override;

  /**
   * Number of idle connections currently kept for reuse.
   */
  std::size_t idle_connections() const;

  /**
   * Number of connections opened over the lifetime of this client.
   */
  uint64_t connections_opened() const;

  const HttpClientOptions& options() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Escape every byte outside the RFC 3986 unreserved set as %XX, so the
 * result is safe as a single path segment.
 */
std::string percent_encode(const std::string& s);

/**
 * Decode %XX escapes (used for proxy credentials).
 */
std::string percent_decode(const std::string& s);

/**
 * Standard base64 encoding.
 */
std::string base64_encode(const std::string& input);

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_HTTP_CLIENT_HPP
