/**
 * @file command_builder.cpp
 * @brief Renderer argument vector construction implementation
 */

#include "projectm_pod/command_builder.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "projectm_pod/config.hpp"

namespace projectm_pod {

RenderSettings RenderSettings::from_env() {
  RenderSettings settings;
  settings.convert_script = Config::convert_script();
  settings.preset_dir = Config::preset_dir();
  settings.texture_dir = Config::texture_dir();
  settings.output_name = Config::output_name();
  settings.allow_remote_audio = Config::allow_remote_audio();
  settings.validate_audio = Config::validate_audio();
  settings.log_tail = static_cast<size_t>(std::max(0, Config::log_std_tail()));
  return settings;
}

std::vector<std::string>
build_render_command(const RenderSettings &settings, const JobConfig &config,
                     const std::filesystem::path &audio,
                     const std::filesystem::path &output,
                     const std::filesystem::path &timeline) {
  std::vector<std::string> argv = {
      settings.convert_script,
      "-i",
      audio.string(),
      "-o",
      output.string(),
      "-p",
      settings.preset_dir,
      "--texture",
      settings.texture_dir,
      "--mesh",
      config.mesh,
      "--video-size",
      fmt::format("{}x{}", config.video_width, config.video_height),
      "-r",
      std::to_string(config.fps),
      "-b",
      std::to_string(config.bitrate_kbps),
      "--speed",
      config.encoder_speed,
  };

  /// Timeline and flat preset duration are mutually exclusive
  if (!timeline.empty()) {
    argv.push_back("--timeline");
    argv.push_back(timeline.string());
  } else {
    argv.push_back("-d");
    argv.push_back(std::to_string(config.preset_duration));
  }
  return argv;
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty())
      out += ' ';
    bool plain = !arg.empty() &&
                 arg.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string::npos;
    if (plain) {
      out += arg;
      continue;
    }
    out += '\'';
    for (char c : arg) {
      if (c == '\'')
        out += "'\\''";
      else
        out += c;
    }
    out += '\'';
  }
  return out;
}

} // namespace projectm_pod
