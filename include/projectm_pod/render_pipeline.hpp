/**
 * @file render_pipeline.hpp
 * @brief Per-job render orchestration
 *
 * @details The RenderPipeline class runs one render inside a job directory:
 *
 *          1. Materialize the audio (inline bytes or remote fetch)
 *
 *          2. Materialize the timeline, when one is given
 *
 *          3. Probe the audio with libavformat
 *
 *          4. Build the renderer command
 *
 *          5. Run it under the job timeout
 *
 *          6. Classify the outcome and log output tails
 *
 * @note The job directory belongs to the caller and must outlive the report:
 *       the rendered file is still needed for result assembly.
 */

#ifndef PROJECTM_POD_RENDER_PIPELINE_HPP
#define PROJECTM_POD_RENDER_PIPELINE_HPP

#include <filesystem>
#include <string>

#include "audio_fetcher.hpp"
#include "command_builder.hpp"
#include "job_config.hpp"
#include "types.hpp"

namespace projectm_pod {

/**
 * @struct RenderReport
 * @brief What happened to one render.
 */
struct RenderReport {
  RenderStatus status = RenderStatus::InternalError;
  ProcessOutcome outcome;        //< Meaningful when ran() is true
  std::filesystem::path output;  //< Where the renderer was asked to write
  std::string error;             //< Detail for statuses decided before launch
  std::string failed_input;      //< "audio" or "timeline" for DownloadError

  bool ran() const {
    return status == RenderStatus::Success ||
           status == RenderStatus::NonZeroExit ||
           status == RenderStatus::OutputMissing ||
           status == RenderStatus::TimedOut;
  }
};

/**
 * @class RenderPipeline
 * @brief Runs one JobConfig through fetch, build, supervise and classify.
 */
class RenderPipeline {
  const JobConfig &config_;
  const RenderSettings &settings_;
  AudioFetcher &fetcher_;
  std::filesystem::path work_dir_;
  std::string log_prefix_; //< "Job <id> - " (may be empty)

  bool prepare_audio(std::filesystem::path &audio, RenderReport &report);
  bool prepare_timeline(std::filesystem::path &timeline, RenderReport &report);
  bool probe_audio(const std::filesystem::path &audio, RenderReport &report);

  void log_streams(const ProcessOutcome &outcome, bool failed);

public:
  /**
   * @param config Validated job options
   * @param settings Renderer paths and policies
   * @param fetcher Used for audio_url / timeline_url
   * @param work_dir Existing, job-owned directory
   * @param log_prefix Prepended to every log line
   */
  RenderPipeline(const JobConfig &config, const RenderSettings &settings,
                 AudioFetcher &fetcher, std::filesystem::path work_dir,
                 std::string log_prefix = {});

  /**
   * @brief Run the render to completion.
   * @return Report; the child process has been reaped in every case
   */
  RenderReport run();
};

} // namespace projectm_pod

#endif // PROJECTM_POD_RENDER_PIPELINE_HPP
