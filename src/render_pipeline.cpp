/**
 * @file render_pipeline.cpp
 * @brief Per-job render orchestration implementation
 */

#include "projectm_pod/render_pipeline.hpp"

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/media.hpp"
#include "projectm_pod/process_supervisor.hpp"
#include "projectm_pod/system.hpp"

namespace projectm_pod {

namespace fs = std::filesystem;

// **---- Constructor ----**

RenderPipeline::RenderPipeline(const JobConfig &config,
                               const RenderSettings &settings,
                               AudioFetcher &fetcher, fs::path work_dir,
                               std::string log_prefix)
    : config_(config), settings_(settings), fetcher_(fetcher),
      work_dir_(std::move(work_dir)), log_prefix_(std::move(log_prefix)) {}

// **---- Input Preparation ----**

bool RenderPipeline::prepare_audio(fs::path &audio, RenderReport &report) {
  audio = work_dir_ / ("audio" + config_.audio_suffix);

  if (config_.audio_bytes) {
    LOG_INFO("{}received inline audio payload ({} bytes)", log_prefix_,
             config_.audio_bytes->size());
    std::string error;
    if (!write_file(audio, *config_.audio_bytes, error)) {
      report.status = RenderStatus::InternalError;
      report.error = error;
      return false;
    }
    return true;
  }

  if (config_.audio_url.empty()) {
    report.status = RenderStatus::InputError;
    report.error = "Missing audio_b64 or audio_url in payload";
    return false;
  }
  if (!settings_.allow_remote_audio) {
    report.status = RenderStatus::InputError;
    report.error = "Remote audio URLs are disabled on this worker";
    return false;
  }

  LOG_INFO("{}downloading audio from {}", log_prefix_, config_.audio_url);
  FetchResult fetched = fetcher_.fetch(config_.audio_url, audio);
  if (!fetched) {
    LOG_ERROR("{}download failed: {}", log_prefix_, fetched.error);
    report.status = RenderStatus::DownloadError;
    report.failed_input = "audio";
    report.error = fetched.error;
    return false;
  }
  LOG_INFO("{}download complete ({} bytes)", log_prefix_, fetched.bytes);
  return true;
}

bool RenderPipeline::prepare_timeline(fs::path &timeline,
                                      RenderReport &report) {
  timeline.clear();
  if (!config_.has_timeline())
    return true;

  fs::path path = work_dir_ / "timeline.ini";

  if (config_.timeline_text) {
    LOG_INFO("{}using inline timeline.ini payload", log_prefix_);
    std::string error;
    if (!write_file(path, *config_.timeline_text, error)) {
      report.status = RenderStatus::InternalError;
      report.error = error;
      return false;
    }
    timeline = path;
    return true;
  }

  LOG_INFO("{}downloading timeline from {}", log_prefix_,
           config_.timeline_url);
  FetchResult fetched = fetcher_.download(config_.timeline_url, path);
  if (!fetched) {
    LOG_ERROR("{}timeline download failed: {}", log_prefix_, fetched.error);
    report.status = RenderStatus::DownloadError;
    report.failed_input = "timeline";
    report.error = fetched.error;
    return false;
  }
  timeline = path;
  return true;
}

bool RenderPipeline::probe_audio(const fs::path &audio, RenderReport &report) {
  AudioProbe probe;
  if (!probe.open(audio)) {
    if (settings_.validate_audio) {
      LOG_ERROR("{}audio rejected: {}", log_prefix_, probe.error());
      report.status = RenderStatus::InputError;
      report.error = "Audio could not be decoded: " + probe.error();
      return false;
    }
    LOG_WARN("{}audio probe failed ({}); passing it to the renderer anyway",
             log_prefix_, probe.error());
    return true;
  }

  LOG_INFO("{}audio: {} / {}, {}", log_prefix_, probe.format_name(),
           probe.codec_name(), format_time(probe.duration()));
  return true;
}

// **---- Logging Helpers ----**

void RenderPipeline::log_streams(const ProcessOutcome &outcome, bool failed) {
  if (!outcome.stdout_text.empty()) {
    if (failed) {
      LOG_ERROR("{}STDOUT: {}", log_prefix_,
                tail_text(outcome.stdout_text, settings_.log_tail));
    } else {
      LOG_INFO("{}STDOUT: {}", log_prefix_,
               tail_text(outcome.stdout_text, settings_.log_tail));
    }
  }
  if (!outcome.stderr_text.empty()) {
    if (failed) {
      LOG_ERROR("{}STDERR: {}", log_prefix_,
                tail_text(outcome.stderr_text, settings_.log_tail));
    } else {
      LOG_INFO("{}STDERR: {}", log_prefix_,
               tail_text(outcome.stderr_text, settings_.log_tail));
    }
  }
}

// **---- Main Processing ----**

RenderReport RenderPipeline::run() {
  RenderReport report;
  report.output = work_dir_ / settings_.output_name;

  // **----- INPUTS -----**

  fs::path audio, timeline;
  if (!prepare_audio(audio, report))
    return report;
  if (!prepare_timeline(timeline, report))
    return report;
  if (!probe_audio(audio, report))
    return report;

  // **----- RENDER -----**

  auto argv =
      build_render_command(settings_, config_, audio, report.output, timeline);
  LOG_PHASE("{}executing renderer: {}", log_prefix_, format_command(argv));
  LOG_INFO("{}timeout {:.0f} sec, mesh={}, fps={}, bitrate={} kbps",
           log_prefix_, config_.timeout_sec, config_.mesh, config_.fps,
           config_.bitrate_kbps);

  report.outcome = run_process(argv, config_.timeout_sec);
  report.status = classify_render(report.outcome, report.output);

  // **----- CLASSIFY -----**

  switch (report.status) {
  case RenderStatus::Success:
    LOG_SUCCESS("{}renderer completed in {:.1f}s", log_prefix_,
                report.outcome.elapsed_sec);
    log_streams(report.outcome, false);
    break;
  case RenderStatus::TimedOut:
    LOG_ERROR("{}conversion timed out after {:.0f} seconds", log_prefix_,
              config_.timeout_sec);
    log_streams(report.outcome, true);
    break;
  case RenderStatus::NonZeroExit:
    LOG_ERROR("{}conversion failed with exit code {}", log_prefix_,
              report.outcome.exit_code);
    log_streams(report.outcome, true);
    break;
  case RenderStatus::OutputMissing:
    LOG_ERROR("{}output missing after conversion", log_prefix_);
    log_streams(report.outcome, true);
    break;
  case RenderStatus::LaunchFailed:
    report.error = report.outcome.error;
    LOG_ERROR("{}renderer could not be started: {}", log_prefix_,
              report.error);
    break;
  default:
    break;
  }
  return report;
}

} // namespace projectm_pod
