/**
 * @file result_assembler.cpp
 * @brief Job result records and upload fallback implementation
 */

#include "projectm_pod/result_assembler.hpp"

#include <system_error>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/media.hpp"
#include "projectm_pod/system.hpp"

namespace projectm_pod {

// **---- JobResult ----**

JobResult JobResult::uploaded(std::string video_url, double file_size_mb,
                              std::string stdout_text,
                              std::string stderr_text) {
  JobResult r;
  r.video_url_ = std::move(video_url);
  r.file_size_mb_ = file_size_mb;
  r.stdout_ = std::move(stdout_text);
  r.stderr_ = std::move(stderr_text);
  r.has_streams_ = true;
  return r;
}

JobResult JobResult::inlined(std::string video_b64, double file_size_mb,
                             std::string upload_error, std::string stdout_text,
                             std::string stderr_text) {
  JobResult r;
  r.video_b64_ = std::move(video_b64);
  r.file_size_mb_ = file_size_mb;
  r.upload_error_ = std::move(upload_error);
  r.stdout_ = std::move(stdout_text);
  r.stderr_ = std::move(stderr_text);
  r.has_streams_ = true;
  return r;
}

JobResult JobResult::failure(ErrorKind kind, std::string message) {
  JobResult r;
  r.kind_ = kind == ErrorKind::None ? ErrorKind::Internal : kind;
  r.error_ = std::move(message);
  return r;
}

JobResult JobResult::failure(ErrorKind kind, std::string message,
                             std::string stdout_text,
                             std::string stderr_text) {
  JobResult r = failure(kind, std::move(message));
  r.stdout_ = std::move(stdout_text);
  r.stderr_ = std::move(stderr_text);
  r.has_streams_ = true;
  return r;
}

nlohmann::json JobResult::to_json() const {
  nlohmann::json out = nlohmann::json::object();
  if (!ok()) {
    out["error"] = error_;
  } else {
    if (!video_url_.empty())
      out["video_url"] = video_url_;
    else
      out["base_video_b64"] = video_b64_;
    out["file_size_mb"] = file_size_mb_;
    if (!upload_error_.empty())
      out["upload_error"] = upload_error_;
  }
  if (has_streams_) {
    out["stdout"] = stdout_;
    out["stderr"] = stderr_;
  }
  return out;
}

// **---- ResultAssembler ----**

JobResult ResultAssembler::assemble(const std::filesystem::path &output,
                                    const ProcessOutcome &outcome,
                                    const std::string &object_name,
                                    const std::string &log_prefix) {
  std::error_code ec;
  auto bytes = std::filesystem::file_size(output, ec);
  if (ec) {
    return JobResult::failure(
        ErrorKind::Internal,
        "Unexpected conversion failure: cannot stat output: " + ec.message(),
        outcome.stdout_text, outcome.stderr_text);
  }
  double mb = size_mb(bytes);

  LOG_INFO("{}uploading video ({:.2f} MB)", log_prefix, mb);
  UploadResult upload = uploader_.upload(output, object_name);
  if (upload.ok) {
    LOG_SUCCESS("{}video uploaded: {}", log_prefix, upload.reference);
    return JobResult::uploaded(upload.reference, mb, outcome.stdout_text,
                               outcome.stderr_text);
  }

  LOG_ERROR("{}upload failed: {}", log_prefix, upload.error);
  LOG_INFO("{}falling back to base64 encoding", log_prefix);

  std::string b64, error;
  if (!base64_encode_file(output, b64, error)) {
    return JobResult::failure(ErrorKind::Internal,
                              "Unexpected conversion failure: " + error,
                              outcome.stdout_text, outcome.stderr_text);
  }
  return JobResult::inlined(std::move(b64), mb, upload.error,
                            outcome.stdout_text, outcome.stderr_text);
}

} // namespace projectm_pod
