/**
 * @file types.hpp
 * @brief Core data types and constants for projectm_pod
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Download and redirect-chase constants
 *
 *          - ErrorKind taxonomy shared by every stage
 *
 *          - ProcessOutcome for supervised renderer runs
 *
 *          - FetchResult for materialized remote files
 */

#ifndef PROJECTM_POD_TYPES_HPP
#define PROJECTM_POD_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace projectm_pod {

// **----- CONSTANTS -----**

/**
 * @brief Chunk size used when streaming a download to disk.
 */
constexpr size_t DOWNLOAD_CHUNK_SIZE = 1024 * 1024; //< 1MB

/**
 * @brief Maximum number of fetch -> extract iterations per remote audio URL.
 * @note Each iteration may itself follow HTTP 3xx redirects; this bounds
 *       the HTML landing-page chase only.
 */
constexpr int MAX_RESOLVE_ATTEMPTS = 4;

/**
 * @brief Largest HTML body decoded when looking for a redirect candidate.
 */
constexpr size_t MAX_HTML_BYTES = 16 * 1024 * 1024; //< 16MB

// **----- ERROR TAXONOMY -----**

/**
 * @brief Classification of a job failure.
 * @note Upload is recoverable (inline fallback); every other kind is
 *       terminal for the job.
 */
enum class ErrorKind : uint8_t {
  None = 0,
  Input,    //< Missing/invalid audio source or malformed field
  Download, //< Remote fetch failed or HTML chase exhausted
  Timeout,  //< Renderer exceeded its wall-clock budget
  Process,  //< Non-zero exit, missing output or launch failure
  Upload,   //< CDN hand-off failed
  Internal  //< Unexpected failure inside the handler
};

/// Short lowercase name for logs and JSON.
const char *error_kind_name(ErrorKind kind);

// **----- DATA STRUCTURES -----**

/**
 * @struct FetchResult
 * @brief Outcome of materializing a remote file.
 * @note When ok is true the file at path exists and is non-empty.
 *       When ok is false no file is left at path.
 */
struct FetchResult {
  bool ok = false;
  std::filesystem::path path;
  std::uintmax_t bytes = 0;
  int http_status = 0; //< Last HTTP status seen (0 = none)
  std::string error;

  explicit operator bool() const noexcept { return ok; }
};

/**
 * @brief How a supervised process ended.
 */
enum class ProcessStatus : uint8_t {
  Exited,      //< Process terminated on its own (any exit code)
  TimedOut,    //< Killed after exceeding its timeout
  LaunchFailed //< Could not be started (fork/exec error)
};

/**
 * @brief Classification of one render attempt.
 * @note Exactly one holds per attempt. The first five describe a renderer
 *       run; the rest are decided before the renderer starts.
 */
enum class RenderStatus : uint8_t {
  Success,       //< Exit 0 and the output file exists
  NonZeroExit,   //< Exit code != 0 (or killed by a signal)
  OutputMissing, //< Exit 0 but no output file
  TimedOut,      //< Killed after exceeding timeout_sec
  LaunchFailed,  //< Renderer could not be started
  InputError,    //< Invalid or missing job input
  DownloadError, //< Remote audio/timeline could not be fetched
  InternalError  //< Local I/O failure while preparing the job
};

/// Short name for logs ("success", "non_zero_exit", ...)
const char *render_status_name(RenderStatus status);

/**
 * @struct ProcessOutcome
 * @brief Result of one supervised process execution.
 * @note exit_code is the negative signal number when the process was
 *       terminated by a signal. The pid has always been reaped before the
 *       outcome is returned.
 */
struct ProcessOutcome {
  ProcessStatus status = ProcessStatus::LaunchFailed;
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  double elapsed_sec = 0;
  int pid = -1;
  std::string error; //< Launch failure detail
};

} // namespace projectm_pod

#endif // PROJECTM_POD_TYPES_HPP
