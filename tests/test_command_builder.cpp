#include <gtest/gtest.h>

#include <algorithm>

#include "projectm_pod/command_builder.hpp"
#include "projectm_pod/job_config.hpp"

using namespace projectm_pod;

namespace {

RenderSettings test_settings() {
  RenderSettings settings;
  settings.convert_script = "/app/convert.sh";
  settings.preset_dir = "/presets";
  settings.texture_dir = "/textures";
  return settings;
}

JobConfig test_config() {
  JobConfig config;
  config.mesh = "320x240";
  config.encoder_speed = "veryfast";
  return config;
}

bool contains(const std::vector<std::string> &argv, const std::string &arg) {
  return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

/// Value following a flag ("" when absent)
std::string value_of(const std::vector<std::string> &argv,
                     const std::string &flag) {
  auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || it + 1 == argv.end())
    return {};
  return *(it + 1);
}

} // namespace

TEST(CommandBuilder, FullArgumentVector) {
  JobConfig config = test_config();
  config.video_width = 1280;
  config.video_height = 720;
  config.fps = 30;
  config.bitrate_kbps = 4000;
  auto argv = build_render_command(test_settings(), config, "/w/audio.mp3",
                                   "/w/output.mp4");

  ASSERT_FALSE(argv.empty());
  EXPECT_EQ(argv[0], "/app/convert.sh");
  EXPECT_EQ(value_of(argv, "-i"), "/w/audio.mp3");
  EXPECT_EQ(value_of(argv, "-o"), "/w/output.mp4");
  EXPECT_EQ(value_of(argv, "-p"), "/presets");
  EXPECT_EQ(value_of(argv, "--texture"), "/textures");
  EXPECT_EQ(value_of(argv, "--mesh"), "320x240");
  EXPECT_EQ(value_of(argv, "--video-size"), "1280x720");
  EXPECT_EQ(value_of(argv, "-r"), "30");
  EXPECT_EQ(value_of(argv, "-b"), "4000");
  EXPECT_EQ(value_of(argv, "--speed"), "veryfast");
}

TEST(CommandBuilder, PresetDurationWithoutTimeline) {
  JobConfig config = test_config();
  config.preset_duration = 45;
  auto argv = build_render_command(test_settings(), config, "/w/a.mp3",
                                   "/w/o.mp4");
  EXPECT_EQ(value_of(argv, "-d"), "45");
  EXPECT_FALSE(contains(argv, "--timeline"));
}

TEST(CommandBuilder, TimelineReplacesPresetDuration) {
  auto argv = build_render_command(test_settings(), test_config(), "/w/a.mp3",
                                   "/w/o.mp4", "/w/timeline.ini");
  EXPECT_EQ(value_of(argv, "--timeline"), "/w/timeline.ini");
  EXPECT_FALSE(contains(argv, "-d"));
  EXPECT_EQ(argv.back(), "/w/timeline.ini");
}

TEST(CommandBuilder, FormatQuotesOnlyWhenNeeded) {
  EXPECT_EQ(format_command({"/bin/run", "-i", "a b.mp3", "it's", ""}),
            "/bin/run -i 'a b.mp3' 'it'\\''s' ''");
}
