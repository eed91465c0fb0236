// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <vector>

#define PAYFETCH_LOG_COMPONENT "http_client"
#include <payfetch_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace payfetch {
namespace fetcher {

using logging::kv;

namespace {

constexpr std::size_t kMaxResponseBodyBytes = 16 * 1024 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return s;
}

std::string to_string(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

std::string describe(const std::string& stage, const beast::error_code& ec) {
  if (ec == beast::error::timeout || ec == asio::error::operation_aborted) {
    return stage + ": timed out";
  }
  return stage + ": " + ec.message();
}

// Host with brackets restored for IPv6 literals
std::string bracketed_host(const std::string& host) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]";
  }
  return host;
}

}  // namespace

// =============================================================================
// URL helpers
// =============================================================================

std::string Url::authority() const {
  bool default_port = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
  if (default_port) {
    return bracketed_host(host);
  }
  return bracketed_host(host) + ":" + port;
}

std::optional<Url> Url::parse(const std::string& url) {
  Url result;

  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }
  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme != "http" && result.scheme != "https") {
    return std::nullopt;
  }

  std::string rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  if (path_start == std::string::npos) {
    result.target = "/";
  } else if (rest[path_start] == '?') {
    result.target = "/" + rest.substr(path_start);
  } else {
    result.target = rest.substr(path_start);
  }

  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    result.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  }

  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return std::nullopt;
      }
      port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) {
    return std::nullopt;
  }
  if (!port.empty() &&
      !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  result.port = port.empty() ? (result.is_https() ? "443" : "80") : port;

  return result;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string percent_encode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~') {
      out += c;
    } else {
      out += '%';
      out += kHex[byte >> 4];
      out += kHex[byte & 0x0F];
    }
  }
  return out;
}

std::string percent_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      out += s[i];
    }
  }
  return out;
}

std::string base64_encode(const std::string& input) {
  if (input.empty()) {
    return "";
  }
  std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(
    out.data(), reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size())
  );
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
}

// =============================================================================
// Connection
// =============================================================================

namespace {

/**
 * One open connection to an origin, either plain or TLS.
 * Owned by exactly one client; bound to that client's io_context.
 */
struct Connection {
  std::string key;  // scheme://host:port of the origin it talks to
  std::unique_ptr<beast::tcp_stream> plain;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
  beast::flat_buffer buffer;

  beast::tcp_stream& lowest() {
    return tls ? beast::get_lowest_layer(*tls) : *plain;
  }

  void close() {
    lowest().close();
  }
};

std::string origin_key(const Url& url) {
  return url.scheme + "://" + url.host + ":" + url.port;
}

}  // namespace

// =============================================================================
// BeastHttpClient::Impl
// =============================================================================

class BeastHttpClient::Impl {
public:
  explicit Impl(const HttpClientOptions& opts)
      : options(opts)
      , ssl_ctx(ssl::context::tls_client) {
    beast::error_code ec;
    ssl_ctx.set_default_verify_paths(ec);
    if (ec) {
      PAYFETCH_LOG_WARN("Could not load default CA paths" << kv("error", ec.message()));
    }
    if (!options.proxy_url.empty()) {
      proxy = Url::parse(options.proxy_url);
      if (!proxy) {
        PAYFETCH_LOG_WARN("Ignoring unparsable proxy URL" << kv("proxy", options.proxy_url));
      }
    }
  }

  ~Impl() {
    for (auto& conn : idle) {
      conn->close();
    }
  }

  HttpResult get(const std::string& url_str, std::chrono::milliseconds timeout);

  HttpClientOptions options;
  asio::io_context ioc;
  ssl::context ssl_ctx;
  std::optional<Url> proxy;
  std::deque<std::unique_ptr<Connection>> idle;
  uint64_t opened = 0;

private:
  // Run one asynchronous operation to completion on the private io_context.
  template <typename Initiate>
  beast::error_code run(Initiate&& initiate) {
    beast::error_code result = asio::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
  }

  std::unique_ptr<Connection> take_idle(const std::string& key);
  void drop_idle(const std::string& key);
  void release(std::unique_ptr<Connection> conn);

  std::unique_ptr<Connection> open(
    const Url& target, std::chrono::milliseconds timeout, std::string& error
  );
  beast::error_code resolve(
    const std::string& host, const std::string& port, std::chrono::milliseconds timeout,
    tcp::resolver::results_type& results
  );
  bool tunnel(
    beast::tcp_stream& stream, beast::flat_buffer& buffer, const Url& target,
    std::chrono::milliseconds timeout, std::string& error
  );

  template <typename Stream>
  beast::error_code exchange(
    Stream& stream, beast::flat_buffer& buffer, beast::tcp_stream& lowest,
    const http::request<http::empty_body>& req, std::chrono::milliseconds timeout,
    http::response<http::string_body>& res
  );

  http::request<http::empty_body> build_request(const Url& target) const;
  bool via_plain_proxy(const Url& target) const {
    return proxy && !target.is_https();
  }
};

std::unique_ptr<Connection> BeastHttpClient::Impl::take_idle(const std::string& key) {
  for (auto it = idle.begin(); it != idle.end(); ++it) {
    if ((*it)->key == key) {
      auto conn = std::move(*it);
      idle.erase(it);
      return conn;
    }
  }
  return nullptr;
}

void BeastHttpClient::Impl::drop_idle(const std::string& key) {
  for (auto it = idle.begin(); it != idle.end();) {
    if ((*it)->key == key) {
      (*it)->close();
      it = idle.erase(it);
    } else {
      ++it;
    }
  }
}

void BeastHttpClient::Impl::release(std::unique_ptr<Connection> conn) {
  if (idle.size() >= options.pool_size) {
    conn->close();
    return;
  }
  idle.push_back(std::move(conn));
}

beast::error_code BeastHttpClient::Impl::resolve(
  const std::string& host, const std::string& port, std::chrono::milliseconds timeout,
  tcp::resolver::results_type& results
) {
  tcp::resolver resolver(ioc);
  asio::steady_timer timer(ioc);
  beast::error_code result = asio::error::would_block;

  timer.expires_after(timeout);
  timer.async_wait([&resolver](beast::error_code ec) {
    if (!ec) {
      resolver.cancel();
    }
  });
  resolver.async_resolve(
    host, port,
    [&result, &results, &timer](beast::error_code ec, tcp::resolver::results_type r) {
      result = ec;
      results = r;
      timer.cancel();
    }
  );

  ioc.restart();
  ioc.run();
  return result;
}

bool BeastHttpClient::Impl::tunnel(
  beast::tcp_stream& stream, beast::flat_buffer& buffer, const Url& target,
  std::chrono::milliseconds timeout, std::string& error
) {
  std::string authority = bracketed_host(target.host) + ":" + target.port;

  http::request<http::empty_body> req{http::verb::connect, authority, 11};
  req.set(http::field::host, authority);
  if (!proxy->userinfo.empty()) {
    req.set(
      http::field::proxy_authorization, "Basic " + base64_encode(percent_decode(proxy->userinfo))
    );
  }

  stream.expires_after(timeout);
  auto ec = run([&](auto handler) { http::async_write(stream, req, std::move(handler)); });
  if (ec) {
    error = describe("proxy CONNECT " + authority, ec);
    return false;
  }

  // A CONNECT response has no body; the tunnel starts right after the headers
  http::response_parser<http::empty_body> parser;
  parser.skip(true);
  stream.expires_after(timeout);
  ec = run([&](auto handler) {
    http::async_read_header(stream, buffer, parser, std::move(handler));
  });
  if (ec) {
    error = describe("proxy CONNECT " + authority, ec);
    return false;
  }

  int status = parser.get().result_int();
  if (status != 200) {
    error = "proxy CONNECT " + authority + ": HTTP " + std::to_string(status);
    return false;
  }
  return true;
}

std::unique_ptr<Connection> BeastHttpClient::Impl::open(
  const Url& target, std::chrono::milliseconds timeout, std::string& error
) {
  const Url& hop = proxy ? *proxy : target;
  std::string hop_name = hop.host + ":" + hop.port;

  tcp::resolver::results_type endpoints;
  auto ec = resolve(hop.host, hop.port, timeout, endpoints);
  if (ec) {
    error = describe("resolve " + hop_name, ec);
    return nullptr;
  }

  auto conn = std::make_unique<Connection>();
  conn->key = origin_key(target);

  auto stream = std::make_unique<beast::tcp_stream>(ioc);
  stream->expires_after(timeout);
  ec = run([&](auto handler) { stream->async_connect(endpoints, std::move(handler)); });
  if (ec) {
    error = describe("connect " + hop_name, ec);
    return nullptr;
  }
  ++opened;

  if (proxy && target.is_https()) {
    if (!tunnel(*stream, conn->buffer, target, timeout, error)) {
      stream->close();
      return nullptr;
    }
    conn->buffer.consume(conn->buffer.size());
  }

  if (!target.is_https()) {
    conn->plain = std::move(stream);
    return conn;
  }

  conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(std::move(*stream), ssl_ctx);
  if (!SSL_set_tlsext_host_name(conn->tls->native_handle(), target.host.c_str())) {
    error = "TLS " + target.host + ": unable to set SNI host name";
    conn->close();
    return nullptr;
  }
  if (options.verify_ssl) {
    conn->tls->set_verify_mode(ssl::verify_peer);
    conn->tls->set_verify_callback(ssl::host_name_verification(target.host));
  } else {
    conn->tls->set_verify_mode(ssl::verify_none);
  }

  conn->lowest().expires_after(timeout);
  ec = run([&](auto handler) {
    conn->tls->async_handshake(ssl::stream_base::client, std::move(handler));
  });
  if (ec) {
    error = describe("TLS handshake " + target.host, ec);
    conn->close();
    return nullptr;
  }

  return conn;
}

http::request<http::empty_body> BeastHttpClient::Impl::build_request(const Url& target) const {
  std::string request_target = target.target;
  if (via_plain_proxy(target)) {
    request_target = target.scheme + "://" + target.authority() + target.target;
  }

  http::request<http::empty_body> req{http::verb::get, request_target, 11};
  req.set(http::field::host, target.authority());
  for (const auto& header : options.default_headers) {
    req.set(header.first, header.second);
  }
  if (via_plain_proxy(target) && !proxy->userinfo.empty()) {
    req.set(
      http::field::proxy_authorization, "Basic " + base64_encode(percent_decode(proxy->userinfo))
    );
  }
  req.keep_alive(true);
  return req;
}

template <typename Stream>
beast::error_code BeastHttpClient::Impl::exchange(
  Stream& stream, beast::flat_buffer& buffer, beast::tcp_stream& lowest,
  const http::request<http::empty_body>& req, std::chrono::milliseconds timeout,
  http::response<http::string_body>& res
) {
  lowest.expires_after(timeout);
  auto ec = run([&](auto handler) { http::async_write(stream, req, std::move(handler)); });
  if (ec) {
    return ec;
  }

  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxResponseBodyBytes);
  lowest.expires_after(timeout);
  ec = run([&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); });
  if (ec) {
    return ec;
  }
  res = parser.release();
  return {};
}

HttpResult BeastHttpClient::Impl::get(const std::string& url_str, std::chrono::milliseconds timeout) {
  auto target = Url::parse(url_str);
  if (!target) {
    return HttpResult::Failure("invalid URL: " + url_str);
  }

  const std::string key = origin_key(*target);
  auto req = build_request(*target);

  // A pooled connection may have been closed by the server while idle. Such a
  // failure is retried once on a fresh connection.
  for (int round = 0; round < 2; ++round) {
    auto conn = take_idle(key);
    bool reused = static_cast<bool>(conn);
    if (!conn) {
      std::string error;
      conn = open(*target, timeout, error);
      if (!conn) {
        return HttpResult::Failure(error);
      }
    }

    http::response<http::string_body> res;
    beast::error_code ec;
    if (conn->tls) {
      ec = exchange(*conn->tls, conn->buffer, conn->lowest(), req, timeout, res);
    } else {
      ec = exchange(*conn->plain, conn->buffer, conn->lowest(), req, timeout, res);
    }

    if (ec) {
      conn->close();
      if (reused && ec != beast::error::timeout) {
        PAYFETCH_LOG_DEBUG("Pooled connection went stale, reconnecting" << kv("error", ec.message()));
        drop_idle(key);
        continue;
      }
      return HttpResult::Failure(describe("GET " + target->authority() + target->target, ec));
    }

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res.base()) {
      response.headers.emplace(to_lower(to_string(field.name_string())), to_string(field.value()));
    }
    response.body = std::move(res.body());

    if (res.keep_alive()) {
      release(std::move(conn));
    } else {
      conn->close();
    }
    return HttpResult::Success(std::move(response));
  }

  return HttpResult::Failure("GET " + target->authority() + target->target + ": connection lost");
}

// =============================================================================
// BeastHttpClient
// =============================================================================

BeastHttpClient::BeastHttpClient(const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResult BeastHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
  return impl_->get(url, timeout);
}

std::size_t BeastHttpClient::idle_connections() const {
  return impl_->idle.size();
}

uint64_t BeastHttpClient::connections_opened() const {
  return impl_->opened;
}

const HttpClientOptions& BeastHttpClient::options() const {
  return impl_->options;
}

}  // namespace fetcher
}  // namespace payfetch
