/**
 * @file job_handler.hpp
 * @brief Serverless-style entry point: one job record in, one result out
 *
 * @details A job record looks like {"id": "...", "input": {...}} where input
 *          carries the JobConfig fields. handle() never throws: every
 *          failure, including unexpected exceptions, becomes a result
 *          record with an "error" key.
 */

#ifndef PROJECTM_POD_JOB_HANDLER_HPP
#define PROJECTM_POD_JOB_HANDLER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "command_builder.hpp"
#include "http_client.hpp"
#include "render_pipeline.hpp"
#include "result_assembler.hpp"
#include "uploader.hpp"

namespace projectm_pod {

/**
 * @class JobHandler
 * @brief Runs job records end to end.
 * @note Safe to call from several threads; each job gets its own directory,
 *       HTTP client and child process. The uploader must be thread-safe.
 */
class JobHandler {
public:
  /**
   * @param settings Renderer paths and policies
   * @param downloads Creates the per-job client used for remote inputs
   * @param uploader Storage for rendered videos (must outlive the handler)
   */
  JobHandler(RenderSettings settings, HttpClientFactory downloads,
             Uploader &uploader);

  /**
   * @brief Process one job record.
   * @return Result record (see JobResult::to_json)
   */
  nlohmann::json handle(const nlohmann::json &job);

  /// Same as handle() but returns the typed result
  JobResult process(const nlohmann::json &job);

private:
  JobResult run_job(const nlohmann::json &job, const std::string &job_id);

  RenderSettings settings_;
  HttpClientFactory downloads_;
  Uploader &uploader_;
};

/**
 * @brief Map a failed render to the job failure record.
 * @param report Any status except Success
 * @param timeout_sec Budget the renderer was given (for the timeout message)
 */
JobResult render_failure(const RenderReport &report, double timeout_sec);

/**
 * @brief Seconds formatted the way job messages print them ("10800.0").
 */
std::string format_seconds(double seconds);

} // namespace projectm_pod

#endif // PROJECTM_POD_JOB_HANDLER_HPP
