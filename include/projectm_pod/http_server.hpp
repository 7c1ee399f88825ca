/**
 * @file http_server.hpp
 * @brief HTTP render service (POST /render)
 *
 * @details Two layers:
 *
 *          - RenderService: turns a parsed request into a response; no
 *            sockets involved, so it is driven directly by tests
 *
 *          - HttpServer: Boost.Beast accept loop with one thread per
 *            connection; SIGINT/SIGTERM stop accepting and the server
 *            returns once in-flight renders have been answered
 *
 * @note Status mapping: 400 bad input or failed download, 401 auth,
 *       404 unknown path, 405 wrong method, 413 body too large, 500 render
 *       failure, 504 timeout.
 */

#ifndef PROJECTM_POD_HTTP_SERVER_HPP
#define PROJECTM_POD_HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "command_builder.hpp"
#include "http_client.hpp"
#include "system.hpp"

namespace projectm_pod {

namespace http = boost::beast::http;

/**
 * @struct ServerOptions
 * @brief Listener and request limits.
 */
struct ServerOptions {
  std::string host = "0.0.0.0";
  unsigned short port = 8000;
  std::string auth_token;                      //< Empty disables auth
  std::uint64_t max_body_bytes = 2048ull << 20; //< 413 above this
  std::chrono::seconds io_timeout{120};        //< Per socket operation

  /// RUNPOD_POD_HOST, RUNPOD_POD_PORT, RUNPOD_POD_AUTH_TOKEN,
  /// RUNPOD_POD_MAX_BODY_MB
  static ServerOptions from_env();
};

/**
 * @struct ServiceResponse
 * @brief Status plus either a JSON body or a file to stream.
 * @note When file is set, work_dir keeps it on disk until the response has
 *       been sent.
 */
struct ServiceResponse {
  http::status status = http::status::ok;
  std::string body;
  std::string content_type = "application/json";
  std::filesystem::path file;
  std::unique_ptr<TempDirectory> work_dir;
  std::vector<std::pair<std::string, std::string>> headers;

  /// {"detail": "<message>"}
  static ServiceResponse error(http::status status, const std::string &detail);
};

/**
 * @class RenderService
 * @brief Request handling for the render endpoint.
 */
class RenderService {
public:
  RenderService(ServerOptions options, RenderSettings settings,
                HttpClientFactory downloads);

  /**
   * @brief Checks that need only the request line and headers.
   * @return A response to send instead of reading the body, or nullopt
   */
  std::optional<ServiceResponse>
  check_head(const http::request<http::string_body> &req) const;

  /**
   * @brief Handle a complete request.
   */
  ServiceResponse handle(const http::request<http::string_body> &req);

  const ServerOptions &options() const { return options_; }

private:
  ServiceResponse render(const http::request<http::string_body> &req);

  ServerOptions options_;
  RenderSettings settings_;
  HttpClientFactory downloads_;
  std::atomic<std::uint64_t> next_request_id_{1};
};

/**
 * @brief Header-safe copy: control and non-ASCII bytes become spaces.
 */
std::string sanitize_header_value(const std::string &value);

/**
 * @class HttpServer
 * @brief Beast listener dispatching connections to RenderService.
 */
class HttpServer {
public:
  explicit HttpServer(RenderService &service) : service_(service) {}

  /**
   * @brief Bind, accept until SIGINT/SIGTERM, then drain.
   * @return 0 on clean shutdown, 1 when the listener could not start
   */
  int run();

private:
  void session_started();
  void session_finished();

  RenderService &service_;
  std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  int active_sessions_ = 0;
};

} // namespace projectm_pod

#endif // PROJECTM_POD_HTTP_SERVER_HPP
