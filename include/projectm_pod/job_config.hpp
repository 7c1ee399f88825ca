/**
 * @file job_config.hpp
 * @brief Validated per-job rendering options
 *
 * @details JobConfig is built once from a loosely-typed record (job JSON or
 *          HTTP form fields) and is read-only afterwards. Coercion rules:
 *
 *          - Integers: JSON integer, JSON float (truncated) or a decimal
 *            integer string
 *
 *          - timeout_sec: any JSON number or numeric string
 *
 *          - Missing, null or "" take the default
 *
 *          Anything else is an input error naming the field; the renderer
 *          is never started with a silently defaulted value.
 */

#ifndef PROJECTM_POD_JOB_CONFIG_HPP
#define PROJECTM_POD_JOB_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace projectm_pod {

/**
 * @struct JobConfig
 * @brief Every option of one render.
 */
struct JobConfig {
  /// Audio source (inline wins over URL)
  std::optional<std::string> audio_bytes;
  std::string audio_url;
  std::string audio_suffix = ".mp3"; //< Local file is audio<suffix>

  /// Timeline source (inline text wins over URL)
  std::optional<std::string> timeline_text;
  std::string timeline_url;

  int video_width = 1920;
  int video_height = 1080;
  int fps = 60;
  int bitrate_kbps = 8000;
  std::string mesh;          //< "<W>x<H>"
  std::string encoder_speed; //< x264 preset name
  int preset_duration = 60;  //< Seconds per preset when no timeline
  double timeout_sec = 0;

  bool has_audio() const { return audio_bytes || !audio_url.empty(); }
  bool has_timeline() const { return timeline_text || !timeline_url.empty(); }
};

/**
 * @brief Defaults: built-in values plus the environment overrides
 *        (PROJECTM_MESH, PROJECTM_ENCODER_SPEED, RUNPOD_CONVERT_TIMEOUT).
 */
JobConfig default_job_config();

/**
 * @brief Apply the rendering options (dimensions, rates, mesh, speed,
 *        durations, timeout) found in input on top of config.
 * @return false on the first invalid field (error names it)
 */
bool parse_render_options(const nlohmann::json &input, JobConfig &config,
                          std::string &error);

/**
 * @brief Build a JobConfig from the "input" map of a job record.
 * @note Reads audio_b64 / audio_url / audio_filename / timeline_ini /
 *       timeline_url in addition to the rendering options. A record without
 *       any audio source is rejected.
 */
bool parse_job_input(const nlohmann::json &input, JobConfig &config,
                     std::string &error);

/**
 * @brief Local audio suffix for an uploaded or hinted file name.
 * @return The name's extension (".wav", ...) or ".mp3" when it has none
 */
std::string audio_suffix_for(const std::string &filename);

/// x264 speed presets accepted for encoder_speed
const std::vector<std::string> &encoder_speed_presets();

/// "<W>x<H>" with both parts positive integers
bool is_valid_mesh(const std::string &mesh);

} // namespace projectm_pod

#endif // PROJECTM_POD_JOB_CONFIG_HPP
