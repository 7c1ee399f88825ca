/**
 * @file main.cpp
 * @brief Entry point for the projectM render worker
 *
 * @details Modes:
 *
 *          - job [path|-]: read one job record (JSON) from a file or stdin,
 *            render it and print the result record on stdout
 *
 *          - serve: run the HTTP render service (POST /render)
 *
 *          - no mode: RUNPOD_START_SERVER=1 selects serve; serverless
 *            markers (RUNPOD_ENDPOINT_ID, RUNPOD_JOB_ID) select job;
 *            RUNPOD_POD_PORT selects serve; a piped stdin selects job
 *
 * @note Logs go to stderr so stdout carries only the result record.
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "projectm_pod/command_builder.hpp"
#include "projectm_pod/config.hpp"
#include "projectm_pod/http_client.hpp"
#include "projectm_pod/http_server.hpp"
#include "projectm_pod/job_handler.hpp"
#include "projectm_pod/logging.hpp"
#include "projectm_pod/uploader.hpp"

using namespace projectm_pod;

namespace {

void print_usage() {
  LOG_WARN("Usage: ./projectm_pod [--verbose] job [<file>|-]");
  LOG_WARN("       ./projectm_pod [--verbose] serve");
}

HttpClientOptions client_options(double timeout_sec) {
  HttpClientOptions options;
  options.timeout = std::chrono::milliseconds(
      static_cast<long long>(timeout_sec * 1000.0));
  options.user_agent = browser_user_agent();
  return options;
}

int run_job_mode(const std::string &source) {
  std::string text;
  if (source.empty() || source == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  } else {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
      LOG_ERROR("Cannot open job file: {}", source);
      return 1;
    }
    text.assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
  }

  nlohmann::json job;
  try {
    job = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_ERROR("Job record is not valid JSON: {}", e.what());
    nlohmann::json result = {
        {"error", std::string("Job record is not valid JSON: ") + e.what()}};
    std::cout << result.dump() << std::endl;
    return 1;
  }

  BeastHttpClient upload_client(client_options(Config::upload_timeout_sec()));
  HttpPutUploader uploader(upload_client, Config::upload_endpoint());
  JobHandler handler(
      RenderSettings::from_env(),
      make_beast_client_factory(client_options(Config::download_timeout_sec())),
      uploader);

  JobResult result = handler.process(job);
  std::cout << result.to_json().dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace)
            << std::endl;
  return result.ok() ? 0 : 1;
}

int run_serve_mode() {
  RenderService service(
      ServerOptions::from_env(), RenderSettings::from_env(),
      make_beast_client_factory(client_options(Config::download_timeout_sec())));
  HttpServer server(service);
  return server.run();
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  int arg = 1;
  if (arg < argc && std::string(argv[arg]) == "--verbose") {
    set_log_level(LogLevel::Debug);
    ++arg;
  }

  std::string mode = arg < argc ? argv[arg++] : "";

  try {
    if (mode == "job")
      return run_job_mode(arg < argc ? argv[arg] : "-");
    if (mode == "serve")
      return run_serve_mode();
    if (!mode.empty()) {
      print_usage();
      return 1;
    }

    // **---- DEFAULT MODE ----**

    if (Config::start_server()) {
      LOG_INFO("projectM render worker - server mode");
      return run_serve_mode();
    }
    if (Config::has_env("RUNPOD_ENDPOINT_ID") ||
        Config::has_env("RUNPOD_JOB_ID")) {
      LOG_INFO("projectM render worker - serverless job (stdin)");
      return run_job_mode("-");
    }
    if (Config::has_env("RUNPOD_POD_PORT")) {
      LOG_INFO("projectM render worker - server mode");
      return run_serve_mode();
    }
    if (!isatty(STDIN_FILENO)) {
      LOG_INFO("projectM render worker - job mode (stdin)");
      return run_job_mode("-");
    }
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal: {}", e.what());
    return 1;
  }

  print_usage();
  return 1;
}
