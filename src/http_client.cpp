/**
 * @file http_client.cpp
 * @brief Boost.Beast HTTP client implementation
 *
 * @details Requests run on a private io_context per connection. Every I/O
 *          step is issued asynchronously on a beast::tcp_stream with an
 *          expiry and then driven to completion with io_context::run(),
 *          which gives blocking call sites real per-operation timeouts.
 *
 *          A small cookie jar is kept per client so that multi-hop share
 *          flows (warning page -> confirm link) behave like a browser
 *          session.
 */

#include "projectm_pod/http_client.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <mutex>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"
#include "projectm_pod/url.hpp"

namespace projectm_pod {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

const std::string &browser_user_agent() {
  static const std::string ua =
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) "
      "AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";
  return ua;
}

namespace {

constexpr std::uint32_t HEADER_LIMIT = 1024 * 1024;
constexpr std::uint64_t PUT_RESPONSE_LIMIT = 1024 * 1024;

bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

std::string host_header(const Url &url) {
  std::string host = url.host.find(':') != std::string::npos
                         ? "[" + url.host + "]"
                         : url.host;
  if (!url.port.empty())
    host += ":" + url.port;
  return host;
}

// **---- Connection ----**

/**
 * @class Connection
 * @brief One plain or TLS connection with its own io_context.
 */
class Connection {
public:
  Connection(ssl::context &tls, std::chrono::milliseconds timeout)
      : tls_(tls), timeout_(timeout) {}

  ~Connection() { close(); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  bool open(const Url &url, bool verify_peer, std::string &error) {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results =
        resolver.resolve(url.host, std::to_string(url.effective_port()), ec);
    if (ec) {
      error = fmt::format("cannot resolve {}: {}", url.host, ec.message());
      return false;
    }

    if (url.scheme == "https") {
      tls_stream_ =
          std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, tls_);
      if (!SSL_set_tlsext_host_name(tls_stream_->native_handle(),
                                    url.host.c_str())) {
        error = fmt::format("cannot set SNI host {}", url.host);
        return false;
      }
      if (verify_peer) {
        tls_stream_->set_verify_mode(ssl::verify_peer);
        tls_stream_->set_verify_callback(ssl::host_name_verification(url.host));
      } else {
        tls_stream_->set_verify_mode(ssl::verify_none);
      }
    } else if (url.scheme == "http") {
      plain_stream_ = std::make_unique<beast::tcp_stream>(ioc_);
    } else {
      error = fmt::format("unsupported URL scheme '{}'", url.scheme);
      return false;
    }

    lowest().expires_after(timeout_);
    lowest().async_connect(
        results, [&ec](beast::error_code e, const tcp::endpoint &) { ec = e; });
    run();
    if (ec) {
      error = fmt::format("cannot connect to {}:{}: {}", url.host,
                          url.effective_port(), ec.message());
      return false;
    }

    if (tls_stream_) {
      lowest().expires_after(timeout_);
      tls_stream_->async_handshake(ssl::stream_base::client,
                                   [&ec](beast::error_code e) { ec = e; });
      run();
      if (ec) {
        error = fmt::format("TLS handshake with {} failed: {}", url.host,
                            ec.message());
        return false;
      }
    }
    return true;
  }

  /// Serialize a request, one bounded write at a time
  template <class Body>
  bool write(http::request<Body> &req, std::string &error) {
    http::request_serializer<Body> sr{req};
    while (!sr.is_done()) {
      beast::error_code ec;
      lowest().expires_after(timeout_);
      visit([&](auto &stream) {
        http::async_write_some(
            stream, sr,
            [&ec](beast::error_code e, std::size_t) { ec = e; });
      });
      run();
      if (ec) {
        error = fmt::format("request write failed: {}", ec.message());
        return false;
      }
    }
    return true;
  }

  template <class Parser> bool read_header(Parser &parser, std::string &error) {
    beast::error_code ec;
    lowest().expires_after(timeout_);
    visit([&](auto &stream) {
      http::async_read_header(
          stream, buffer_, parser,
          [&ec](beast::error_code e, std::size_t) { ec = e; });
    });
    run();
    if (ec) {
      error = fmt::format("reading response headers failed: {}", ec.message());
      return false;
    }
    return true;
  }

  /// One bounded read step of a message body
  template <class Parser> bool read_some(Parser &parser, std::string &error) {
    beast::error_code ec;
    lowest().expires_after(timeout_);
    visit([&](auto &stream) {
      http::async_read_some(
          stream, buffer_, parser,
          [&ec](beast::error_code e, std::size_t) { ec = e; });
    });
    run();

    if (ec == http::error::need_buffer)
      ec = {};
    if (ec == ssl::error::stream_truncated && parser.need_eof()) {
      /// Servers that end an EOF-delimited body without close_notify
      parser.put_eof(ec);
    }
    if (ec) {
      error = fmt::format("reading response body failed: {}", ec.message());
      return false;
    }
    return true;
  }

  void close() {
    if (!plain_stream_ && !tls_stream_)
      return;
    beast::error_code ec;
    lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
    lowest().close();
    plain_stream_.reset();
    tls_stream_.reset();
  }

private:
  template <class F> void visit(F &&f) {
    if (tls_stream_)
      f(*tls_stream_);
    else
      f(*plain_stream_);
  }

  beast::tcp_stream &lowest() {
    return tls_stream_ ? beast::get_lowest_layer(*tls_stream_) : *plain_stream_;
  }

  void run() {
    ioc_.restart();
    ioc_.run();
  }

  net::io_context ioc_;
  ssl::context &tls_;
  std::chrono::milliseconds timeout_;
  std::unique_ptr<beast::tcp_stream> plain_stream_;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_stream_;
  beast::flat_buffer buffer_;
};

using BodyParser = http::response_parser<http::buffer_body>;

// **---- BeastResponse ----**

class BeastResponse : public HttpResponse {
public:
  BeastResponse(std::unique_ptr<Connection> conn,
                std::unique_ptr<BodyParser> parser, std::string url)
      : conn_(std::move(conn)), parser_(std::move(parser)),
        url_(std::move(url)) {}

  int status() const override { return parser_->get().result_int(); }

  std::string header(const std::string &name) const override {
    auto it = parser_->get().find(name);
    if (it == parser_->get().end())
      return {};
    return std::string(it->value());
  }

  const std::string &url() const override { return url_; }

  bool read(char *buf, size_t size, size_t &n, std::string &error) override {
    n = 0;
    /// A read step may only consume framing (chunk headers); keep going
    /// until body bytes arrive or the message ends.
    while (n == 0 && !parser_->is_done()) {
      parser_->get().body().data = buf;
      parser_->get().body().size = size;
      if (!conn_->read_some(*parser_, error))
        return false;
      n = size - parser_->get().body().size;
    }
    return true;
  }

private:
  std::unique_ptr<Connection> conn_;
  std::unique_ptr<BodyParser> parser_;
  std::string url_;
};

// **---- Cookie Jar ----**

struct Cookie {
  std::string domain;
  bool host_only = true;
  std::string name;
  std::string value;
};

bool cookie_matches(const Cookie &cookie, const std::string &host) {
  if (cookie.host_only)
    return host == cookie.domain;
  if (host == cookie.domain)
    return true;
  return host.size() > cookie.domain.size() &&
         host.compare(host.size() - cookie.domain.size(),
                      cookie.domain.size(), cookie.domain) == 0 &&
         host[host.size() - cookie.domain.size() - 1] == '.';
}

} // anonymous namespace

// **---- BeastHttpClient ----**

struct BeastHttpClient::Impl {
  ssl::context tls{ssl::context::tls_client};
  std::mutex cookie_mutex;
  std::vector<Cookie> cookies;

  void store_cookie(const std::string &host, const std::string &set_cookie) {
    Cookie cookie;
    cookie.domain = to_lower(host);

    size_t semi = set_cookie.find(';');
    std::string pair = trim(set_cookie.substr(0, semi));
    size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0)
      return;
    cookie.name = trim(pair.substr(0, eq));
    cookie.value = trim(pair.substr(eq + 1));

    while (semi != std::string::npos) {
      size_t next = set_cookie.find(';', semi + 1);
      std::string attr = trim(set_cookie.substr(semi + 1, next - semi - 1));
      std::string lowered = to_lower(attr);
      if (lowered.rfind("domain=", 0) == 0) {
        std::string domain = to_lower(trim(attr.substr(7)));
        if (!domain.empty() && domain.front() == '.')
          domain.erase(0, 1);
        if (!domain.empty()) {
          cookie.domain = domain;
          cookie.host_only = false;
        }
      }
      semi = next;
    }

    std::lock_guard<std::mutex> lock(cookie_mutex);
    for (auto &existing : cookies) {
      if (existing.domain == cookie.domain && existing.name == cookie.name) {
        existing = cookie;
        return;
      }
    }
    cookies.push_back(std::move(cookie));
  }

  std::string cookie_header(const std::string &host) {
    std::string lowered = to_lower(host);
    std::string out;
    std::lock_guard<std::mutex> lock(cookie_mutex);
    for (const auto &cookie : cookies) {
      if (!cookie_matches(cookie, lowered))
        continue;
      if (!out.empty())
        out += "; ";
      out += cookie.name + "=" + cookie.value;
    }
    return out;
  }
};

BeastHttpClient::BeastHttpClient(HttpClientOptions options)
    : options_(std::move(options)), impl_(std::make_unique<Impl>()) {
  if (options_.user_agent.empty())
    options_.user_agent = browser_user_agent();

  beast::error_code ec;
  impl_->tls.set_default_verify_paths(ec);
  if (ec) {
    LOG_WARN("Failed to load system CA certificates: {}", ec.message());
  }
}

BeastHttpClient::~BeastHttpClient() = default;

std::unique_ptr<HttpResponse> BeastHttpClient::get(const std::string &url,
                                                   std::string &error) {
  std::string current = url;

  for (int hop = 0;; ++hop) {
    Url parsed;
    if (!parse_url(current, parsed) || parsed.host.empty()) {
      error = fmt::format("invalid URL '{}'", current);
      return nullptr;
    }

    auto conn = std::make_unique<Connection>(impl_->tls, options_.timeout);
    if (!conn->open(parsed, options_.verify_peer, error))
      return nullptr;

    http::request<http::empty_body> req{http::verb::get, parsed.target(), 11};
    req.set(http::field::host, host_header(parsed));
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");
    std::string cookies = impl_->cookie_header(parsed.host);
    if (!cookies.empty())
      req.set(http::field::cookie, cookies);

    if (!conn->write(req, error))
      return nullptr;

    auto parser = std::make_unique<BodyParser>();
    parser->header_limit(HEADER_LIMIT);
    parser->body_limit(std::numeric_limits<std::uint64_t>::max());
    if (!conn->read_header(*parser, error))
      return nullptr;

    const auto &head = parser->get();
    for (auto it = head.find(http::field::set_cookie); it != head.end() &&
                                                       it->name() ==
                                                           http::field::set_cookie;
         ++it) {
      impl_->store_cookie(parsed.host, std::string(it->value()));
    }

    int status = head.result_int();
    auto location = head.find(http::field::location);
    if (is_redirect(status) && location != head.end()) {
      if (hop >= options_.max_redirects) {
        error = fmt::format("too many redirects (>{}) starting at {}",
                            options_.max_redirects, url);
        return nullptr;
      }
      std::string next = resolve_url(parsed, std::string(location->value()));
      LOG_DEBUG("HTTP {} redirect: {} -> {}", status, current, next);
      current = next;
      continue;
    }

    return std::make_unique<BeastResponse>(std::move(conn), std::move(parser),
                                           current);
  }
}

bool BeastHttpClient::put_file(const std::string &url,
                               const std::filesystem::path &file,
                               const std::string &content_type, int &status,
                               std::string &body, std::string &error) {
  status = 0;
  body.clear();

  Url parsed;
  if (!parse_url(url, parsed) || parsed.host.empty()) {
    error = fmt::format("invalid URL '{}'", url);
    return false;
  }

  http::request<http::file_body> req{http::verb::put, parsed.target(), 11};
  beast::error_code ec;
  req.body().open(file.c_str(), beast::file_mode::scan, ec);
  if (ec) {
    error = fmt::format("cannot open {}: {}", file.string(), ec.message());
    return false;
  }
  req.set(http::field::host, host_header(parsed));
  req.set(http::field::user_agent, options_.user_agent);
  req.set(http::field::content_type, content_type);
  req.set(http::field::connection, "close");
  req.prepare_payload();

  Connection conn(impl_->tls, options_.timeout);
  if (!conn.open(parsed, options_.verify_peer, error))
    return false;
  if (!conn.write(req, error))
    return false;

  http::response_parser<http::string_body> parser;
  parser.header_limit(HEADER_LIMIT);
  parser.body_limit(PUT_RESPONSE_LIMIT);
  if (!conn.read_header(parser, error))
    return false;
  while (!parser.is_done()) {
    if (!conn.read_some(parser, error))
      return false;
  }

  status = parser.get().result_int();
  body = parser.get().body();
  return true;
}

HttpClientFactory make_beast_client_factory(HttpClientOptions options) {
  return [options]() -> std::unique_ptr<HttpClient> {
    return std::make_unique<BeastHttpClient>(options);
  };
}

} // namespace projectm_pod
