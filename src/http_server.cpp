/**
 * @file http_server.cpp
 * @brief HTTP render service implementation
 */

#include "projectm_pod/http_server.hpp"

#include <csignal>
#include <exception>
#include <functional>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>
#include <nlohmann/json.hpp>

#include <fmt/core.h>

#include "projectm_pod/audio_fetcher.hpp"
#include "projectm_pod/config.hpp"
#include "projectm_pod/job_config.hpp"
#include "projectm_pod/logging.hpp"
#include "projectm_pod/multipart.hpp"
#include "projectm_pod/render_pipeline.hpp"

namespace projectm_pod {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using nlohmann::json;

namespace {

constexpr size_t DETAIL_TAIL = 2000; //< stdout/stderr chars in 500 details
constexpr size_t HEADER_TAIL = 512;  //< stdout/stderr chars in X-Convert-*

const char *const RENDER_OPTION_FIELDS[] = {
    "video_width",  "video_height",    "fps",        "bitrate_kbps",
    "mesh",         "encoder_speed",   "preset_duration", "timeout_sec"};

/// Last max_chars characters, without an ellipsis
std::string last_chars(const std::string &text, size_t max_chars) {
  return text.size() <= max_chars ? text : text.substr(text.size() - max_chars);
}

ServiceResponse process_error(const std::string &stdout_text,
                              const std::string &stderr_text,
                              const std::string &error = {}) {
  json detail = json::object();
  if (!error.empty())
    detail["error"] = error;
  detail["stdout"] = last_chars(stdout_text, DETAIL_TAIL);
  detail["stderr"] = last_chars(stderr_text, DETAIL_TAIL);

  ServiceResponse resp;
  resp.status = http::status::internal_server_error;
  resp.body = json{{"detail", detail}}.dump(-1, ' ', false,
                                             json::error_handler_t::replace);
  return resp;
}

} // anonymous namespace

// **---- ServerOptions ----**

ServerOptions ServerOptions::from_env() {
  ServerOptions options;
  options.host = Config::pod_host();
  options.port = static_cast<unsigned short>(Config::pod_port());
  options.auth_token = Config::auth_token();
  options.max_body_bytes =
      static_cast<std::uint64_t>(Config::max_request_mb()) << 20;
  return options;
}

ServiceResponse ServiceResponse::error(http::status status,
                                       const std::string &detail) {
  ServiceResponse resp;
  resp.status = status;
  resp.body = json{{"detail", detail}}.dump(-1, ' ', false,
                                             json::error_handler_t::replace);
  return resp;
}

std::string sanitize_header_value(const std::string &value) {
  std::string out = value;
  for (char &c : out) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x20 || u >= 0x7f)
      c = ' ';
  }
  return out;
}

// **---- RenderService ----**

RenderService::RenderService(ServerOptions options, RenderSettings settings,
                             HttpClientFactory downloads)
    : options_(std::move(options)), settings_(std::move(settings)),
      downloads_(std::move(downloads)) {}

std::optional<ServiceResponse>
RenderService::check_head(const http::request<http::string_body> &req) const {
  std::string target(req.target());
  target = target.substr(0, target.find('?'));
  if (target != "/render")
    return ServiceResponse::error(http::status::not_found, "Not Found");

  if (req.method() != http::verb::post) {
    auto resp = ServiceResponse::error(http::status::method_not_allowed,
                                       "Method Not Allowed");
    resp.headers.emplace_back("Allow", "POST");
    return std::move(resp);
  }

  if (!options_.auth_token.empty()) {
    std::string header(req[http::field::authorization]);
    if (header.rfind("Bearer ", 0) != 0) {
      auto resp = ServiceResponse::error(http::status::unauthorized,
                                         "Missing bearer token");
      resp.headers.emplace_back("WWW-Authenticate", "Bearer");
      return std::move(resp);
    }
    if (header.substr(7) != options_.auth_token) {
      auto resp = ServiceResponse::error(http::status::unauthorized,
                                         "Invalid bearer token");
      resp.headers.emplace_back("WWW-Authenticate", "Bearer");
      return std::move(resp);
    }
  }

  auto length = req.find(http::field::content_length);
  if (length != req.end()) {
    std::uint64_t declared = 0;
    try {
      declared = std::stoull(std::string(length->value()));
    } catch (const std::exception &) {
      return ServiceResponse::error(http::status::bad_request,
                                    "Invalid Content-Length");
    }
    if (declared > options_.max_body_bytes) {
      return ServiceResponse::error(
          http::status::payload_too_large,
          fmt::format("Request body exceeds {} MB",
                      options_.max_body_bytes >> 20));
    }
  }
  return std::nullopt;
}

ServiceResponse
RenderService::handle(const http::request<http::string_body> &req) {
  if (auto early = check_head(req))
    return std::move(*early);

  try {
    return render(req);
  } catch (const std::exception &e) {
    LOG_ERROR("Render request crashed: {}", e.what());
    return ServiceResponse::error(http::status::internal_server_error,
                                  std::string("Internal error: ") + e.what());
  }
}

ServiceResponse
RenderService::render(const http::request<http::string_body> &req) {
  const std::uint64_t request_id = next_request_id_++;
  const std::string prefix = fmt::format("Request {} - ", request_id);

  // **----- FORM -----**

  FormData form;
  std::string error;
  if (!parse_form(std::string(req[http::field::content_type]), req.body(),
                  form, error)) {
    LOG_WARN("{}rejected form: {}", prefix, error);
    return ServiceResponse::error(http::status::bad_request, error);
  }

  json fields = json::object();
  for (const char *name : RENDER_OPTION_FIELDS) {
    const FormPart *part = form.find(name);
    if (part && !part->is_file)
      fields[name] = part->data;
  }

  JobConfig config = default_job_config();
  if (!parse_render_options(fields, config, error)) {
    LOG_WARN("{}invalid options: {}", prefix, error);
    return ServiceResponse::error(http::status::bad_request, error);
  }

  /// Uploaded file wins over a URL
  const FormPart *audio_file = form.find("audio_file");
  std::string audio_url = trim(form.value("audio_url"));
  if (audio_file && audio_file->is_file && !audio_file->data.empty()) {
    config.audio_bytes = audio_file->data;
    config.audio_suffix = audio_suffix_for(audio_file->filename);
  } else if (!audio_url.empty()) {
    config.audio_url = audio_url;
  } else if (audio_file && audio_file->is_file) {
    return ServiceResponse::error(http::status::bad_request,
                                  "Uploaded audio_file is empty");
  } else {
    return ServiceResponse::error(http::status::bad_request,
                                  "Must supply audio_file or audio_url");
  }

  /// Timeline: URL, then uploaded file, then inline text
  const FormPart *timeline_file = form.find("timeline_file");
  std::string timeline_url = trim(form.value("timeline_url"));
  std::string timeline_ini = form.value("timeline_ini");
  if (!timeline_url.empty()) {
    config.timeline_url = timeline_url;
  } else if (timeline_file && timeline_file->is_file &&
             !timeline_file->data.empty()) {
    config.timeline_text = timeline_file->data;
  } else if (!trim(timeline_ini).empty()) {
    config.timeline_text = timeline_ini;
  }

  // **----- RENDER -----**

  auto work_dir = std::make_unique<TempDirectory>("render_pod_");
  if (!work_dir->valid()) {
    return ServiceResponse::error(http::status::internal_server_error,
                                  work_dir->error());
  }

  LOG_PHASE("{}render request ({} bytes body)", prefix, req.body().size());
  std::unique_ptr<HttpClient> client = downloads_();
  AudioFetcher fetcher(*client);
  RenderPipeline pipeline(config, settings_, fetcher, work_dir->path(), prefix);
  RenderReport report = pipeline.run();
  const ProcessOutcome &out = report.outcome;
  LOG_INFO("{}render finished: {}", prefix, render_status_name(report.status));

  switch (report.status) {
  case RenderStatus::Success:
    break;
  case RenderStatus::InputError:
    return ServiceResponse::error(http::status::bad_request, report.error);
  case RenderStatus::DownloadError:
    return ServiceResponse::error(
        http::status::bad_request,
        fmt::format("Failed to download {}: {}", report.failed_input,
                    report.error));
  case RenderStatus::TimedOut:
    return ServiceResponse::error(http::status::gateway_timeout,
                                  "Conversion timed out");
  case RenderStatus::NonZeroExit:
  case RenderStatus::OutputMissing:
    return process_error(out.stdout_text, out.stderr_text);
  case RenderStatus::LaunchFailed:
  case RenderStatus::InternalError:
    return process_error(out.stdout_text, out.stderr_text, report.error);
  }

  // **----- RESPOND -----**

  ServiceResponse resp;
  resp.status = http::status::ok;
  resp.content_type = "video/mp4";
  resp.file = report.output;
  resp.work_dir = std::move(work_dir);
  resp.headers.emplace_back(
      "Content-Disposition",
      fmt::format("attachment; filename=\"{}\"", settings_.output_name));
  resp.headers.emplace_back(
      "X-Convert-Stdout",
      sanitize_header_value(last_chars(out.stdout_text, HEADER_TAIL)));
  resp.headers.emplace_back(
      "X-Convert-Stderr",
      sanitize_header_value(last_chars(out.stderr_text, HEADER_TAIL)));
  return resp;
}

// **---- Connection Handling ----**

namespace {

/**
 * @struct Session
 * @brief One accepted connection with its own io_context.
 */
struct Session {
  net::io_context ioc;
  beast::tcp_stream stream{ioc};
  beast::flat_buffer buffer;
  std::chrono::seconds timeout;

  explicit Session(std::chrono::seconds t) : timeout(t) {}

  /// Run one async operation to completion under the I/O timeout
  template <class Start> beast::error_code step(Start &&start) {
    beast::error_code ec;
    stream.expires_after(timeout);
    start([&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.restart();
    ioc.run();
    return ec;
  }

  template <class Body> bool write(http::response<Body> &res) {
    http::response_serializer<Body> sr{res};
    while (!sr.is_done()) {
      beast::error_code ec = step([&](auto handler) {
        http::async_write_some(stream, sr, std::move(handler));
      });
      if (ec) {
        LOG_DEBUG("response write failed: {}", ec.message());
        return false;
      }
    }
    return true;
  }

  void send(ServiceResponse &resp) {
    if (!resp.file.empty()) {
      http::response<http::file_body> res{resp.status, 11};
      beast::error_code ec;
      res.body().open(resp.file.c_str(), beast::file_mode::scan, ec);
      if (!ec) {
        res.set(http::field::content_type, resp.content_type);
        for (const auto &h : resp.headers)
          res.set(h.first, h.second);
        res.keep_alive(false);
        res.prepare_payload();
        write(res);
        return;
      }
      LOG_ERROR("cannot open rendered file {}: {}", resp.file.string(),
                ec.message());
      resp = ServiceResponse::error(http::status::internal_server_error,
                                    "Rendered file could not be opened");
    }

    http::response<http::string_body> res{resp.status, 11};
    res.set(http::field::content_type, resp.content_type);
    for (const auto &h : resp.headers)
      res.set(h.first, h.second);
    res.body() = resp.body;
    res.keep_alive(false);
    res.prepare_payload();
    write(res);
  }

  void close() {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.close();
  }
};

void serve_connection(RenderService &service, Session &s) {
  http::request_parser<http::string_body> parser;
  parser.header_limit(64 * 1024);
  parser.body_limit(service.options().max_body_bytes);

  beast::error_code ec = s.step([&](auto handler) {
    http::async_read_header(s.stream, s.buffer, parser, std::move(handler));
  });
  if (ec) {
    LOG_DEBUG("reading request headers failed: {}", ec.message());
    s.close();
    return;
  }

  if (auto early = service.check_head(parser.get())) {
    s.send(*early);
    s.close();
    return;
  }

  if (beast::iequals(parser.get()[http::field::expect], "100-continue")) {
    http::response<http::empty_body> cont{http::status::continue_, 11};
    s.write(cont);
  }

  while (!parser.is_done()) {
    ec = s.step([&](auto handler) {
      http::async_read_some(s.stream, s.buffer, parser, std::move(handler));
    });
    if (ec == http::error::body_limit) {
      auto resp = ServiceResponse::error(
          http::status::payload_too_large,
          fmt::format("Request body exceeds {} MB",
                      service.options().max_body_bytes >> 20));
      s.send(resp);
      s.close();
      return;
    }
    if (ec) {
      LOG_DEBUG("reading request body failed: {}", ec.message());
      s.close();
      return;
    }
  }

  ServiceResponse resp = service.handle(parser.get());
  LOG_INFO("POST /render -> {}", static_cast<unsigned>(resp.status));
  s.send(resp);
  s.close();
}

} // anonymous namespace

// **---- HttpServer ----**

void HttpServer::session_started() {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  ++active_sessions_;
}

void HttpServer::session_finished() {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    --active_sessions_;
  }
  sessions_cv_.notify_all();
}

int HttpServer::run() {
  const ServerOptions &opts = service_.options();
  net::io_context ioc;
  beast::error_code ec;

  auto address = net::ip::make_address(opts.host, ec);
  if (ec) {
    LOG_ERROR("Invalid listen address '{}': {}", opts.host, ec.message());
    return 1;
  }
  tcp::endpoint endpoint{address, opts.port};

  tcp::acceptor acceptor(ioc);
  acceptor.open(endpoint.protocol(), ec);
  if (!ec)
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor.bind(endpoint, ec);
  if (!ec)
    acceptor.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    LOG_ERROR("Cannot listen on {}:{}: {}", opts.host, opts.port,
              ec.message());
    return 1;
  }

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&acceptor](beast::error_code, int signo) {
    LOG_WARN("Received signal {}; no longer accepting connections", signo);
    beast::error_code ignored;
    acceptor.close(ignored);
  });

  std::function<void()> do_accept = [&]() {
    auto session = std::make_shared<Session>(opts.io_timeout);
    acceptor.async_accept(
        session->stream.socket(), [&, session](beast::error_code aec) {
          if (aec == net::error::operation_aborted || !acceptor.is_open())
            return;
          if (aec) {
            LOG_WARN("accept failed: {}", aec.message());
          } else {
            session_started();
            std::thread([this, session]() {
              serve_connection(service_, *session);
              session_finished();
            }).detach();
          }
          do_accept();
        });
  };
  do_accept();

  LOG_SUCCESS("Listening on http://{}:{} (auth {})", opts.host, opts.port,
              opts.auth_token.empty() ? "disabled" : "enabled");
  ioc.run();

  std::unique_lock<std::mutex> lock(sessions_mutex_);
  if (active_sessions_ > 0) {
    LOG_INFO("Waiting for {} in-flight request(s)", active_sessions_);
  }
  sessions_cv_.wait(lock, [this] { return active_sessions_ == 0; });
  LOG_INFO("Server stopped");
  return 0;
}

} // namespace projectm_pod
