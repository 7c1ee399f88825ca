/**
 * @file result_assembler.hpp
 * @brief Job result records and the upload-or-inline decision
 *
 * @details A successful render is handed to the Uploader. When that works
 *          the result carries a URL; when it fails the video is inlined as
 *          base64 and the upload error is reported next to it. An upload
 *          failure never turns a rendered video into a job failure.
 */

#ifndef PROJECTM_POD_RESULT_ASSEMBLER_HPP
#define PROJECTM_POD_RESULT_ASSEMBLER_HPP

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"
#include "uploader.hpp"

namespace projectm_pod {

/**
 * @class JobResult
 * @brief Tagged success/failure record.
 * @note Only the named constructors create one, so exactly one variant is
 *       populated.
 */
class JobResult {
public:
  static JobResult uploaded(std::string video_url, double file_size_mb,
                            std::string stdout_text, std::string stderr_text);

  static JobResult inlined(std::string video_b64, double file_size_mb,
                           std::string upload_error, std::string stdout_text,
                           std::string stderr_text);

  /// Failure before any process ran (no stdout/stderr keys)
  static JobResult failure(ErrorKind kind, std::string message);

  /// Failure of a process that ran; its output is kept
  static JobResult failure(ErrorKind kind, std::string message,
                           std::string stdout_text, std::string stderr_text);

  bool ok() const { return kind_ == ErrorKind::None; }
  ErrorKind error_kind() const { return kind_; }
  const std::string &error() const { return error_; }

  const std::string &video_url() const { return video_url_; }
  const std::string &video_b64() const { return video_b64_; }
  const std::string &upload_error() const { return upload_error_; }
  double file_size_mb() const { return file_size_mb_; }

  const std::string &stdout_text() const { return stdout_; }
  const std::string &stderr_text() const { return stderr_; }
  bool has_streams() const { return has_streams_; }

  /**
   * @brief Wire record.
   * @details Success: video_url | base_video_b64, file_size_mb,
   *          [upload_error], stdout, stderr.
   *          Failure: error, [stdout, stderr].
   */
  nlohmann::json to_json() const;

private:
  JobResult() = default;

  ErrorKind kind_ = ErrorKind::None;
  std::string error_;
  std::string video_url_;
  std::string video_b64_;
  std::string upload_error_;
  double file_size_mb_ = 0;
  std::string stdout_;
  std::string stderr_;
  bool has_streams_ = false;
};

/**
 * @class ResultAssembler
 * @brief Turns a successful render into a JobResult.
 */
class ResultAssembler {
public:
  explicit ResultAssembler(Uploader &uploader) : uploader_(uploader) {}

  /**
   * @brief Upload the output, falling back to inline base64.
   * @param output Rendered file (must exist)
   * @param outcome Renderer outcome (stdout/stderr are carried over)
   * @param object_name Storage name passed to the uploader
   * @param log_prefix Prepended to log lines ("Job <id> - ")
   */
  JobResult assemble(const std::filesystem::path &output,
                     const ProcessOutcome &outcome,
                     const std::string &object_name,
                     const std::string &log_prefix = {});

private:
  Uploader &uploader_;
};

} // namespace projectm_pod

#endif // PROJECTM_POD_RESULT_ASSEMBLER_HPP
