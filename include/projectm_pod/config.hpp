/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once on first use and are read-only afterwards,
 *          so concurrent jobs share them safely.
 *
 */

#ifndef PROJECTM_POD_CONFIG_HPP
#define PROJECTM_POD_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace projectm_pod {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// True when the variable is set to a non-empty value.
inline bool has_env(const char *name) {
  const char *val = std::getenv(name);
  return val && *val;
}

// **---- RENDERER ----**

/// External renderer entry point (wraps projectM + encoder)
inline const std::string &convert_script() {
  static std::string val =
      get_env_string("RUNPOD_CONVERT_SCRIPT", "/app/convert.sh");
  return val;
}

/// projectM preset directory passed with -p
inline const std::string &preset_dir() {
  static std::string val = get_env_string(
      "RUNPOD_PRESET_DIR", "/usr/local/share/projectM/presets");
  return val;
}

/// projectM texture directory passed with --texture
inline const std::string &texture_dir() {
  static std::string val = get_env_string(
      "RUNPOD_TEXTURE_DIR", "/usr/local/share/projectM/textures");
  return val;
}

/// File name of the rendered video inside the job directory
inline const std::string &output_name() {
  static std::string val = get_env_string("RUNPOD_OUTPUT_NAME", "output.mp4");
  return val;
}

/**
 * @brief Default wall-clock budget for one conversion (seconds)
 * @note Jobs may override it with timeout_sec.
 */
inline double default_timeout_sec() {
  static double val = get_env_double("RUNPOD_CONVERT_TIMEOUT", 10800.0);
  return val;
}

/// Default projectM mesh size when a job does not specify one
inline const std::string &default_mesh() {
  static std::string val = get_env_string("PROJECTM_MESH", "320x240");
  return val;
}

/// Default x264 speed preset when a job does not specify one
inline const std::string &default_encoder_speed() {
  static std::string val =
      get_env_string("PROJECTM_ENCODER_SPEED", "veryfast");
  return val;
}

// **---- REMOTE AUDIO ----**

/**
 * @brief Accept audio_url inputs at all
 * @note Deployments that only take inline payloads set this to 0.
 */
inline bool allow_remote_audio() {
  static bool val = (get_env_int("RUNPOD_ALLOW_REMOTE_AUDIO", 1) != 0);
  return val;
}

/// Per-request timeout for downloads (seconds)
inline double download_timeout_sec() {
  static double val = get_env_double("RUNPOD_DOWNLOAD_TIMEOUT", 120.0);
  return val;
}

/**
 * @brief Reject audio that libavformat cannot open
 * @note When 0, probe failures are only logged.
 */
inline bool validate_audio() {
  static bool val = (get_env_int("RUNPOD_VALIDATE_AUDIO", 0) != 0);
  return val;
}

// **---- UPLOAD ----**

/**
 * @brief Base URL the rendered video is PUT under
 * @note Empty disables uploading; results then carry inline base64.
 */
inline const std::string &upload_endpoint() {
  static std::string val = get_env_string("RUNPOD_UPLOAD_ENDPOINT", "");
  return val;
}

/// Per-request timeout for uploads (seconds)
inline double upload_timeout_sec() {
  static double val = get_env_double("RUNPOD_UPLOAD_TIMEOUT", 600.0);
  return val;
}

// **---- LOGGING ----**

/// RUNPOD_LOG_LEVEL: DEBUG, INFO, WARNING, ERROR
inline const std::string &log_level() {
  static std::string val = get_env_string("RUNPOD_LOG_LEVEL", "INFO");
  return val;
}

/// Characters of renderer stdout/stderr kept when logging a tail
inline int log_std_tail() {
  static int val = get_env_int("RUNPOD_LOG_STD_TAIL", 1200);
  return val;
}

// **---- HTTP SERVICE ----**

/// Static bearer token; empty disables the check
inline const std::string &auth_token() {
  static std::string val = [] {
    std::string token = get_env_string("RUNPOD_POD_AUTH_TOKEN", "");
    auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return std::string();
    auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
  }();
  return val;
}

inline const std::string &pod_host() {
  static std::string val = get_env_string("RUNPOD_POD_HOST", "0.0.0.0");
  return val;
}

inline int pod_port() {
  static int val = get_env_int("RUNPOD_POD_PORT", 8000);
  return val;
}

/// Largest accepted request body (MB)
inline int max_request_mb() {
  static int val = get_env_int("RUNPOD_POD_MAX_BODY_MB", 2048);
  return val;
}

/**
 * @brief Start the HTTP service when no mode is given on the command line
 */
inline bool start_server() {
  static bool val = (get_env_int("RUNPOD_START_SERVER", 0) != 0);
  return val;
}

} // namespace Config
} // namespace projectm_pod

#endif // PROJECTM_POD_CONFIG_HPP
