/**
 * @file command_builder.hpp
 * @brief Renderer argument vector construction
 */

#ifndef PROJECTM_POD_COMMAND_BUILDER_HPP
#define PROJECTM_POD_COMMAND_BUILDER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "job_config.hpp"

namespace projectm_pod {

/**
 * @struct RenderSettings
 * @brief Process-wide renderer paths and policies.
 */
struct RenderSettings {
  std::string convert_script;
  std::string preset_dir;
  std::string texture_dir;
  std::string output_name = "output.mp4";
  bool allow_remote_audio = true;
  bool validate_audio = false; //< Probe failure rejects the job
  size_t log_tail = 1200;      //< Chars of stdout/stderr logged

  /// Every field from its RUNPOD_* variable (see config.hpp)
  static RenderSettings from_env();
};

/**
 * @brief Build the renderer argv.
 *
 * @details Layout:
 *
 *   script -i <audio> -o <output> -p <preset_dir> --texture <texture_dir>
 *   --mesh <mesh> --video-size <W>x<H> -r <fps> -b <bitrate_kbps>
 *   --speed <encoder_speed>
 *
 *   followed by exactly one of `--timeline <path>` (timeline given) or
 *   `-d <preset_duration>`.
 *
 * @param timeline Empty path means no timeline
 */
std::vector<std::string>
build_render_command(const RenderSettings &settings, const JobConfig &config,
                     const std::filesystem::path &audio,
                     const std::filesystem::path &output,
                     const std::filesystem::path &timeline = {});

/**
 * @brief Join argv for logging, quoting arguments that need it.
 */
std::string format_command(const std::vector<std::string> &argv);

} // namespace projectm_pod

#endif // PROJECTM_POD_COMMAND_BUILDER_HPP
