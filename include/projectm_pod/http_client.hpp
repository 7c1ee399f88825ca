/**
 * @file http_client.hpp
 * @brief Streaming HTTP client used for downloads and uploads
 *
 * @details HttpClient is the seam between the audio fetcher / uploader and
 *          the network. BeastHttpClient is the production implementation
 *          (Boost.Beast over Asio, OpenSSL for https). Tests substitute a
 *          scripted client.
 *
 * @note Responses are streamed: get() returns once the headers of the final
 *       (non-redirect) response are read, and the body is pulled in chunks
 *       through HttpResponse::read().
 */

#ifndef PROJECTM_POD_HTTP_CLIENT_HPP
#define PROJECTM_POD_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace projectm_pod {

/**
 * @class HttpResponse
 * @brief Headers of a response plus a pull interface for its body.
 */
class HttpResponse {
public:
  virtual ~HttpResponse() = default;

  virtual int status() const = 0;

  /// Header value by case-insensitive name (empty when absent)
  virtual std::string header(const std::string &name) const = 0;

  /// URL that produced this response after following redirects
  virtual const std::string &url() const = 0;

  /**
   * @brief Read the next piece of the body.
   * @param buf Destination buffer
   * @param size Capacity of buf
   * @param n Output: bytes written to buf (0 at end of body)
   * @param error Output: failure detail
   * @return true on success (including end of body), false on I/O error
   */
  virtual bool read(char *buf, size_t size, size_t &n,
                    std::string &error) = 0;

  bool ok() const { return status() >= 200 && status() < 300; }
};

/**
 * @struct HttpClientOptions
 * @brief Behaviour shared by every request of a client.
 */
struct HttpClientOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(120)}; //< Per I/O op
  int max_redirects = 10;
  std::string user_agent;
  bool verify_peer = true;
};

/**
 * @brief Browser-like User-Agent sent with downloads.
 * @note Some share hosts serve bot-detection pages to library defaults.
 */
const std::string &browser_user_agent();

/**
 * @class HttpClient
 * @brief Abstract HTTP client.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * @brief Issue a GET, following 3xx redirects.
   * @param url Absolute http(s) URL
   * @param error Output: transport failure detail
   * @return Response positioned at the start of its body, or nullptr on
   *         transport failure (DNS, connect, TLS, timeout, bad URL)
   */
  virtual std::unique_ptr<HttpResponse> get(const std::string &url,
                                            std::string &error) = 0;

  /**
   * @brief PUT a file as the request body.
   * @param url Absolute http(s) URL
   * @param file Local file to send
   * @param content_type Value of the Content-Type header
   * @param status Output: HTTP status of the response
   * @param body Output: response body (for error reporting)
   * @param error Output: transport failure detail
   * @return true when a response was received (check status), false on
   *         transport failure
   */
  virtual bool put_file(const std::string &url,
                        const std::filesystem::path &file,
                        const std::string &content_type, int &status,
                        std::string &body, std::string &error) = 0;
};

/**
 * @class BeastHttpClient
 * @brief Boost.Beast implementation of HttpClient.
 *
 * @attention TIMEOUTS:
 *
 *   - Every connect, handshake, write and body read is bounded by
 *     options.timeout (a stalled server cannot hang a job)
 *
 *   - The overall transfer is not bounded; a slow but live download
 *     continues
 *
 * @note Thread-safe: each request owns its own io_context and socket; the
 *       shared TLS context is only read.
 */
class BeastHttpClient : public HttpClient {
public:
  explicit BeastHttpClient(HttpClientOptions options);
  ~BeastHttpClient() override;

  BeastHttpClient(const BeastHttpClient &) = delete;
  BeastHttpClient &operator=(const BeastHttpClient &) = delete;

  std::unique_ptr<HttpResponse> get(const std::string &url,
                                    std::string &error) override;

  bool put_file(const std::string &url, const std::filesystem::path &file,
                const std::string &content_type, int &status,
                std::string &body, std::string &error) override;

  const HttpClientOptions &options() const { return options_; }

private:
  struct Impl;
  HttpClientOptions options_;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Produces a fresh client (with an empty cookie jar) per job.
 */
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/// Factory of BeastHttpClient instances sharing options
HttpClientFactory make_beast_client_factory(HttpClientOptions options);

} // namespace projectm_pod

#endif // PROJECTM_POD_HTTP_CLIENT_HPP
