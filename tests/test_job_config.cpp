#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "projectm_pod/job_config.hpp"

using namespace projectm_pod;
using nlohmann::json;

namespace {

JobConfig base_config() {
  JobConfig config;
  config.mesh = "320x240";
  config.encoder_speed = "veryfast";
  config.timeout_sec = 10800;
  return config;
}

} // namespace

TEST(RenderOptions, DefaultsWhenAbsent) {
  JobConfig config = base_config();
  std::string error;
  ASSERT_TRUE(parse_render_options(json::object(), config, error)) << error;
  EXPECT_EQ(config.video_width, 1920);
  EXPECT_EQ(config.video_height, 1080);
  EXPECT_EQ(config.fps, 60);
  EXPECT_EQ(config.bitrate_kbps, 8000);
  EXPECT_EQ(config.preset_duration, 60);
  EXPECT_EQ(config.mesh, "320x240");
  EXPECT_EQ(config.encoder_speed, "veryfast");
  EXPECT_DOUBLE_EQ(config.timeout_sec, 10800);
}

TEST(RenderOptions, CoercesNumbersAndStrings) {
  JobConfig config = base_config();
  std::string error;
  json input = {{"video_width", "1280"}, {"video_height", 720.9},
                {"fps", 30},             {"bitrate_kbps", " 4000 "},
                {"timeout_sec", "90.5"}, {"encoder_speed", " Medium "},
                {"mesh", "128x96"},      {"preset_duration", nullptr}};
  ASSERT_TRUE(parse_render_options(input, config, error)) << error;
  EXPECT_EQ(config.video_width, 1280);
  EXPECT_EQ(config.video_height, 720);
  EXPECT_EQ(config.fps, 30);
  EXPECT_EQ(config.bitrate_kbps, 4000);
  EXPECT_DOUBLE_EQ(config.timeout_sec, 90.5);
  EXPECT_EQ(config.encoder_speed, "medium");
  EXPECT_EQ(config.mesh, "128x96");
  EXPECT_EQ(config.preset_duration, 60);
}

TEST(RenderOptions, BlankStringKeepsDefault) {
  JobConfig config = base_config();
  std::string error;
  ASSERT_TRUE(parse_render_options({{"fps", "  "}, {"mesh", ""}}, config, error));
  EXPECT_EQ(config.fps, 60);
  EXPECT_EQ(config.mesh, "320x240");
}

TEST(RenderOptions, RejectsBadValues) {
  struct Case {
    json input;
    const char *key;
  };
  const Case cases[] = {
      {{{"video_width", "wide"}}, "video_width"},
      {{{"fps", 0}}, "fps"},
      {{{"bitrate_kbps", -5}}, "bitrate_kbps"},
      {{{"video_height", json::array()}}, "video_height"},
      {{{"timeout_sec", "soon"}}, "timeout_sec"},
      {{{"timeout_sec", 0}}, "timeout_sec"},
      {{{"mesh", "320by240"}}, "mesh"},
      {{{"mesh", 320}}, "mesh"},
      {{{"encoder_speed", "warp"}}, "encoder_speed"},
  };
  for (const auto &c : cases) {
    JobConfig config = base_config();
    std::string error;
    EXPECT_FALSE(parse_render_options(c.input, config, error)) << c.input;
    EXPECT_NE(error.find(std::string("Invalid value for ") + c.key),
              std::string::npos)
        << error;
  }
}

TEST(JobInput, RequiresObject) {
  JobConfig config = base_config();
  std::string error;
  EXPECT_FALSE(parse_job_input(json::array(), config, error));
  EXPECT_EQ(error, "Job input must be a JSON object");
}

TEST(JobInput, MissingAudioCheckedFirst) {
  JobConfig config = base_config();
  std::string error;
  EXPECT_FALSE(parse_job_input({{"fps", "bad"}}, config, error));
  EXPECT_EQ(error, "Missing audio_b64 or audio_url in payload");
}

TEST(JobInput, DecodesInlineAudio) {
  JobConfig config = base_config();
  std::string error;
  json input = {{"audio_b64", "SUQzBA=="},
                {"audio_url", "https://example.com/ignored.mp3"},
                {"audio_filename", "my song.flac"},
                {"timeline_ini", "[preset]\n"}};
  ASSERT_TRUE(parse_job_input(input, config, error)) << error;
  ASSERT_TRUE(config.audio_bytes);
  EXPECT_EQ(*config.audio_bytes, std::string("ID3\x04", 4));
  EXPECT_EQ(config.audio_suffix, ".flac");
  ASSERT_TRUE(config.timeline_text);
  EXPECT_EQ(*config.timeline_text, "[preset]\n");
}

TEST(JobInput, RejectsBadBase64) {
  JobConfig config = base_config();
  std::string error;
  EXPECT_FALSE(parse_job_input({{"audio_b64", "@@@"}}, config, error));
  EXPECT_EQ(error, "Invalid audio_b64: not valid base64");
}

TEST(JobInput, UrlOnly) {
  JobConfig config = base_config();
  std::string error;
  ASSERT_TRUE(parse_job_input(
      {{"audio_url", " https://example.com/a.mp3 "}, {"timeline_url", ""}},
      config, error));
  EXPECT_FALSE(config.audio_bytes);
  EXPECT_EQ(config.audio_url, "https://example.com/a.mp3");
  EXPECT_FALSE(config.has_timeline());
}

TEST(AudioSuffix, UsesCleanExtensionOnly) {
  EXPECT_EQ(audio_suffix_for("track.wav"), ".wav");
  EXPECT_EQ(audio_suffix_for("dir/sub/track.M4A"), ".M4A");
  EXPECT_EQ(audio_suffix_for("noext"), ".mp3");
  EXPECT_EQ(audio_suffix_for(".hidden"), ".mp3");
  EXPECT_EQ(audio_suffix_for("weird.m$3"), ".mp3");
  EXPECT_EQ(audio_suffix_for(""), ".mp3");
}

TEST(Mesh, Validation) {
  EXPECT_TRUE(is_valid_mesh("320x240"));
  EXPECT_FALSE(is_valid_mesh("0x240"));
  EXPECT_FALSE(is_valid_mesh("320x"));
  EXPECT_FALSE(is_valid_mesh("320X240"));
}
