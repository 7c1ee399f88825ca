/**
 * @file types.cpp
 * @brief Core type helpers
 */

#include "projectm_pod/types.hpp"

namespace projectm_pod {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Input:
    return "input";
  case ErrorKind::Download:
    return "download";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Process:
    return "process";
  case ErrorKind::Upload:
    return "upload";
  case ErrorKind::Internal:
    return "internal";
  }
  return "unknown";
}

const char *render_status_name(RenderStatus status) {
  switch (status) {
  case RenderStatus::Success:
    return "success";
  case RenderStatus::NonZeroExit:
    return "non_zero_exit";
  case RenderStatus::OutputMissing:
    return "output_missing";
  case RenderStatus::TimedOut:
    return "timed_out";
  case RenderStatus::LaunchFailed:
    return "launch_failed";
  case RenderStatus::InputError:
    return "input_error";
  case RenderStatus::DownloadError:
    return "download_error";
  case RenderStatus::InternalError:
    return "internal_error";
  }
  return "unknown";
}

} // namespace projectm_pod
