/**
 * @file job_handler.cpp
 * @brief Job record entry point implementation
 */

#include "projectm_pod/job_handler.hpp"

#include <cctype>
#include <cmath>
#include <exception>

#include <fmt/core.h>

#include "projectm_pod/audio_fetcher.hpp"
#include "projectm_pod/job_config.hpp"
#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"

namespace projectm_pod {

using nlohmann::json;

namespace {

std::string job_id_of(const json &job) {
  if (!job.is_object())
    return {};
  auto it = job.find("id");
  if (it == job.end() || it->is_null())
    return {};
  return it->is_string() ? it->get<std::string>() : it->dump();
}

/// Storage-safe tag for the uploaded object name
std::string object_tag(const std::string &job_id,
                       const std::filesystem::path &work_dir) {
  std::string tag;
  for (char c : job_id) {
    bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                c == '_' || c == '.';
    tag += safe ? c : '_';
  }
  if (tag.empty())
    tag = work_dir.filename().string();
  return tag;
}

/// Input map for logging with inline payloads reduced to their size
json redact_input(const json &input) {
  if (!input.is_object())
    return input;
  json out = input;
  for (const char *key : {"audio_b64", "timeline_ini"}) {
    auto it = out.find(key);
    if (it != out.end() && it->is_string())
      *it = fmt::format("<{} chars>", it->get_ref<const std::string &>().size());
  }
  return out;
}

} // anonymous namespace

std::string format_seconds(double seconds) {
  if (std::isfinite(seconds) && std::floor(seconds) == seconds &&
      std::fabs(seconds) < 1e15)
    return fmt::format("{:.1f}", seconds);
  return fmt::format("{}", seconds);
}

JobResult render_failure(const RenderReport &report, double timeout_sec) {
  const ProcessOutcome &out = report.outcome;
  switch (report.status) {
  case RenderStatus::InputError:
    return JobResult::failure(ErrorKind::Input, report.error);
  case RenderStatus::DownloadError:
    if (report.failed_input == "timeline")
      return JobResult::failure(ErrorKind::Download,
                                "Timeline download failed: " + report.error);
    return JobResult::failure(ErrorKind::Download,
                              "Remote download failed: " + report.error);
  case RenderStatus::TimedOut:
    return JobResult::failure(
        ErrorKind::Timeout,
        fmt::format("Conversion timed out after {} seconds",
                    format_seconds(timeout_sec)),
        out.stdout_text, out.stderr_text);
  case RenderStatus::NonZeroExit:
    return JobResult::failure(
        ErrorKind::Process,
        fmt::format("Conversion failed (exit code {})", out.exit_code),
        out.stdout_text, out.stderr_text);
  case RenderStatus::OutputMissing:
    return JobResult::failure(
        ErrorKind::Process, "Conversion completed but output file is missing",
        out.stdout_text, out.stderr_text);
  case RenderStatus::LaunchFailed:
    return JobResult::failure(ErrorKind::Process,
                              "Unexpected conversion failure: " + report.error);
  case RenderStatus::InternalError:
    return JobResult::failure(ErrorKind::Internal,
                              "Unexpected conversion failure: " + report.error);
  case RenderStatus::Success:
    break;
  }
  return JobResult::failure(ErrorKind::Internal,
                            "Unexpected conversion failure: render succeeded "
                            "but was reported as failed");
}

// **---- JobHandler ----**

JobHandler::JobHandler(RenderSettings settings, HttpClientFactory downloads,
                       Uploader &uploader)
    : settings_(std::move(settings)), downloads_(std::move(downloads)),
      uploader_(uploader) {}

json JobHandler::handle(const json &job) { return process(job).to_json(); }

JobResult JobHandler::process(const json &job) {
  std::string job_id = job_id_of(job);
  std::string label = job_id.empty() ? "unknown" : job_id;

  try {
    JobResult result = run_job(job, job_id);
    if (!result.ok()) {
      LOG_ERROR("Job {} - returning error ({}): {}", label,
                error_kind_name(result.error_kind()), result.error());
    }
    return result;
  } catch (const std::exception &e) {
    LOG_ERROR("Job {} - handler crashed: {}", label, e.what());
    return JobResult::failure(ErrorKind::Internal,
                              std::string("Handler crashed: ") + e.what());
  }
}

JobResult JobHandler::run_job(const json &job, const std::string &job_id) {
  const std::string prefix =
      fmt::format("Job {} - ", job_id.empty() ? "unknown" : job_id);
  LOG_PHASE("Received job{}", job_id.empty() ? "" : " " + job_id);

  if (!job.is_object())
    return JobResult::failure(ErrorKind::Input,
                              "Job record must be a JSON object");

  json input = json::object();
  auto it = job.find("input");
  if (it != job.end() && !it->is_null())
    input = *it;
  LOG_DEBUG("{}input: {}", prefix, redact_input(input).dump());

  // **----- VALIDATE -----**

  JobConfig config = default_job_config();
  std::string error;
  if (!parse_job_input(input, config, error)) {
    LOG_ERROR("{}invalid input: {}", prefix, error);
    return JobResult::failure(ErrorKind::Input, error);
  }

  // **----- RENDER -----**

  TempDirectory work_dir("runpod_projectm_");
  if (!work_dir.valid()) {
    return JobResult::failure(ErrorKind::Internal,
                              "Handler crashed: " + work_dir.error());
  }

  std::unique_ptr<HttpClient> client = downloads_();
  AudioFetcher fetcher(*client);
  RenderPipeline pipeline(config, settings_, fetcher, work_dir.path(), prefix);
  RenderReport report = pipeline.run();
  if (report.status != RenderStatus::Success)
    return render_failure(report, config.timeout_sec);

  // **----- DELIVER -----**

  ResultAssembler assembler(uploader_);
  std::string object_name =
      object_tag(job_id, work_dir.path()) + "-" + settings_.output_name;
  return assembler.assemble(report.output, report.outcome, object_name,
                            prefix);
}

} // namespace projectm_pod
