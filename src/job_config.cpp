/**
 * @file job_config.cpp
 * @brief JobConfig coercion and validation
 */

#include "projectm_pod/job_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

#include <fmt/core.h>

#include "projectm_pod/config.hpp"
#include "projectm_pod/media.hpp"
#include "projectm_pod/system.hpp"

namespace projectm_pod {

using nlohmann::json;

namespace {

/// Missing, null and "" all mean "use the default"
const json *field(const json &input, const char *key) {
  auto it = input.find(key);
  if (it == input.end() || it->is_null())
    return nullptr;
  if (it->is_string() && trim(it->get_ref<const std::string &>()).empty())
    return nullptr;
  return &*it;
}

bool parse_int_text(const std::string &text, long long &out) {
  std::string t = trim(text);
  if (!t.empty() && t.front() == '+')
    t.erase(0, 1);
  if (t.empty() || t.front() == '+')
    return false;
  auto res = std::from_chars(t.data(), t.data() + t.size(), out);
  return res.ec == std::errc() && res.ptr == t.data() + t.size();
}

bool parse_double_text(const std::string &text, double &out) {
  std::string t = trim(text);
  if (t.empty())
    return false;
  char *end = nullptr;
  out = std::strtod(t.c_str(), &end);
  return end == t.c_str() + t.size();
}

bool coerce_int(const json &input, const char *key, int &out,
                std::string &error) {
  const json *value = field(input, key);
  if (!value)
    return true;

  long long parsed = 0;
  bool ok = false;
  if (value->is_number_integer()) {
    double d = value->get<double>();
    ok = d >= static_cast<double>(std::numeric_limits<long long>::min()) &&
         d <= static_cast<double>(std::numeric_limits<long long>::max());
    if (ok)
      parsed = value->is_number_unsigned()
                   ? static_cast<long long>(value->get<unsigned long long>())
                   : value->get<long long>();
  } else if (value->is_number_float()) {
    double d = value->get<double>();
    ok = std::isfinite(d) && std::fabs(d) < 1e15;
    if (ok)
      parsed = static_cast<long long>(std::trunc(d));
  } else if (value->is_string()) {
    ok = parse_int_text(value->get<std::string>(), parsed);
  }

  if (!ok) {
    error = fmt::format("Invalid value for {}: expected an integer, got {}",
                        key, value->dump());
    return false;
  }
  if (parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
    error = fmt::format("Invalid value for {}: must be a positive integer, "
                        "got {}",
                        key, parsed);
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool coerce_seconds(const json &input, const char *key, double &out,
                    std::string &error) {
  const json *value = field(input, key);
  if (!value)
    return true;

  double parsed = 0;
  bool ok = false;
  if (value->is_number()) {
    parsed = value->get<double>();
    ok = true;
  } else if (value->is_string()) {
    ok = parse_double_text(value->get<std::string>(), parsed);
  }

  if (!ok) {
    error = fmt::format("Invalid value for {}: expected a number, got {}", key,
                        value->dump());
    return false;
  }
  if (!std::isfinite(parsed) || parsed <= 0) {
    error = fmt::format("Invalid value for {}: must be a positive number, "
                        "got {}",
                        key, value->dump());
    return false;
  }
  out = parsed;
  return true;
}

bool coerce_string(const json &input, const char *key, std::string &out,
                   std::string &error) {
  const json *value = field(input, key);
  if (!value)
    return true;
  if (!value->is_string()) {
    error = fmt::format("Invalid value for {}: expected a string, got {}", key,
                        value->dump());
    return false;
  }
  out = value->get<std::string>();
  return true;
}

} // anonymous namespace

const std::vector<std::string> &encoder_speed_presets() {
  static const std::vector<std::string> presets = {
      "ultrafast", "superfast", "veryfast", "faster",   "fast",
      "medium",    "slow",      "slower",   "veryslow", "placebo"};
  return presets;
}

bool is_valid_mesh(const std::string &mesh) {
  static const std::regex pattern(R"(^([0-9]+)x([0-9]+)$)");
  std::smatch m;
  if (!std::regex_match(mesh, m, pattern))
    return false;
  long long w = 0, h = 0;
  return parse_int_text(m[1].str(), w) && parse_int_text(m[2].str(), h) &&
         w > 0 && h > 0;
}

std::string audio_suffix_for(const std::string &filename) {
  std::string name = filename;
  size_t slash = name.find_last_of("/\\");
  if (slash != std::string::npos)
    name = name.substr(slash + 1);

  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
    return ".mp3";

  std::string suffix = name.substr(dot);
  bool clean = std::all_of(suffix.begin() + 1, suffix.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
  });
  return clean ? suffix : ".mp3";
}

JobConfig default_job_config() {
  JobConfig config;
  config.mesh = Config::default_mesh();
  config.encoder_speed = Config::default_encoder_speed();
  config.timeout_sec = Config::default_timeout_sec();
  return config;
}

bool parse_render_options(const json &input, JobConfig &config,
                          std::string &error) {
  if (!input.is_object()) {
    error = "Job input must be a JSON object";
    return false;
  }

  if (!coerce_int(input, "video_width", config.video_width, error) ||
      !coerce_int(input, "video_height", config.video_height, error) ||
      !coerce_int(input, "fps", config.fps, error) ||
      !coerce_int(input, "bitrate_kbps", config.bitrate_kbps, error) ||
      !coerce_int(input, "preset_duration", config.preset_duration, error) ||
      !coerce_seconds(input, "timeout_sec", config.timeout_sec, error) ||
      !coerce_string(input, "mesh", config.mesh, error) ||
      !coerce_string(input, "encoder_speed", config.encoder_speed, error))
    return false;

  config.mesh = trim(config.mesh);
  if (!is_valid_mesh(config.mesh)) {
    error = fmt::format("Invalid value for mesh: expected <W>x<H>, got '{}'",
                        config.mesh);
    return false;
  }

  config.encoder_speed = to_lower(trim(config.encoder_speed));
  const auto &presets = encoder_speed_presets();
  if (std::find(presets.begin(), presets.end(), config.encoder_speed) ==
      presets.end()) {
    error = fmt::format("Invalid value for encoder_speed: '{}'",
                        config.encoder_speed);
    return false;
  }
  return true;
}

bool parse_job_input(const json &input, JobConfig &config,
                     std::string &error) {
  if (!input.is_object()) {
    error = "Job input must be a JSON object";
    return false;
  }

  std::string audio_b64, audio_filename, timeline_ini;
  if (!coerce_string(input, "audio_b64", audio_b64, error) ||
      !coerce_string(input, "audio_url", config.audio_url, error) ||
      !coerce_string(input, "audio_filename", audio_filename, error) ||
      !coerce_string(input, "timeline_ini", timeline_ini, error) ||
      !coerce_string(input, "timeline_url", config.timeline_url, error))
    return false;

  config.audio_url = trim(config.audio_url);
  config.timeline_url = trim(config.timeline_url);

  if (audio_b64.empty() && config.audio_url.empty()) {
    error = "Missing audio_b64 or audio_url in payload";
    return false;
  }

  if (!parse_render_options(input, config, error))
    return false;

  if (!audio_b64.empty()) {
    std::string bytes;
    if (!base64_decode(audio_b64, bytes)) {
      error = "Invalid audio_b64: not valid base64";
      return false;
    }
    if (bytes.empty()) {
      error = "Invalid audio_b64: decoded payload is empty";
      return false;
    }
    config.audio_bytes = std::move(bytes);
  }

  if (!audio_filename.empty())
    config.audio_suffix = audio_suffix_for(audio_filename);

  if (!timeline_ini.empty())
    config.timeline_text = std::move(timeline_ini);
  return true;
}

} // namespace projectm_pod
