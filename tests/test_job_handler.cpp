#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_http.hpp"
#include "projectm_pod/job_handler.hpp"
#include "projectm_pod/media.hpp"
#include "projectm_pod/system.hpp"

using namespace projectm_pod;
using projectm_pod::testing::FakeHttpClient;
using projectm_pod::testing::FakeReply;
using nlohmann::json;

namespace {

/// Stand-in renderer: records its arguments and writes the -o file
const char *kStubRenderer = R"(#!/bin/sh
out=""
timeline=""
prev=""
for arg in "$@"; do
  case "$prev" in
    -o) out="$arg" ;;
    --timeline) timeline="$arg" ;;
  esac
  prev="$arg"
done
echo "args: $*"
[ -n "$timeline" ] && echo "timeline: $(cat "$timeline")"
case "$STUB_MODE" in
  fail) echo "renderer exploded" >&2; exit 2 ;;
  nooutput) exit 0 ;;
  hang) sleep 60 ;;
esac
printf 'rendered' > "$out"
echo "encoder done" >&2
)";

/// Uploader recording object names
class RecordingUploader : public Uploader {
public:
  UploadResult upload(const std::filesystem::path &file,
                      const std::string &object_name) override {
    names.push_back(object_name);
    UploadResult result;
    if (fail) {
      result.error = "storage offline";
      return result;
    }
    std::string data, error;
    result.ok = read_file(file, data, error) && data == "rendered";
    result.reference = "https://cdn.example.com/" + object_name;
    return result;
  }

  std::vector<std::string> names;
  bool fail = false;
};

class JobHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    auto script = dir_.path() / "convert.sh";
    std::string error;
    ASSERT_TRUE(write_file(script, kStubRenderer, error)) << error;
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    settings_.convert_script = script.string();
    settings_.preset_dir = "/presets";
    settings_.texture_dir = "/textures";
    settings_.output_name = "output.mp4";

    /// Per-request work directories land in scratch_
    scratch_ = dir_.path() / "scratch";
    std::filesystem::create_directory(scratch_);
    if (const char *old = std::getenv("TMPDIR"))
      saved_tmpdir_ = old;
    ::setenv("TMPDIR", scratch_.c_str(), 1);
    ::unsetenv("STUB_MODE");
  }

  void TearDown() override {
    ::unsetenv("STUB_MODE");
    if (saved_tmpdir_)
      ::setenv("TMPDIR", saved_tmpdir_->c_str(), 1);
    else
      ::unsetenv("TMPDIR");
  }

  /// True once every work directory has been removed
  bool scratch_is_empty() const {
    return std::filesystem::is_empty(scratch_);
  }

  /// Per-job clients get the scripted replies
  HttpClientFactory factory() {
    return [this]() {
      auto client = std::make_unique<FakeHttpClient>();
      for (const auto &reply : replies_)
        client->push(reply);
      return client;
    };
  }

  json run(const json &job) {
    JobHandler handler(settings_, factory(), uploader_);
    return handler.handle(job);
  }

  static json inline_job(json extra = json::object()) {
    json input = {{"audio_b64", base64_encode("ID3fake")}, {"mesh", "64x48"}};
    input.update(extra);
    return {{"id", "job-42"}, {"input", input}};
  }

  TempDirectory dir_{"job_handler_test_"};
  RenderSettings settings_;
  std::filesystem::path scratch_;
  std::optional<std::string> saved_tmpdir_;
  RecordingUploader uploader_;
  std::vector<FakeReply> replies_;
};

} // namespace

TEST_F(JobHandlerTest, InlineAudioUploadsResult) {
  json result = run(inline_job({{"fps", "24"}}));

  ASSERT_FALSE(result.contains("error")) << result.dump();
  EXPECT_EQ(result["video_url"], "https://cdn.example.com/job-42-output.mp4");
  EXPECT_TRUE(result["file_size_mb"].is_number());
  EXPECT_NE(result["stdout"].get<std::string>().find("-r 24"),
            std::string::npos);
  EXPECT_NE(result["stdout"].get<std::string>().find("--mesh 64x48"),
            std::string::npos);
  EXPECT_EQ(result["stderr"], "encoder done\n");
  ASSERT_EQ(uploader_.names.size(), 1u);
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, FallsBackToInlineVideo) {
  uploader_.fail = true;
  json result = run(inline_job());

  ASSERT_FALSE(result.contains("error")) << result.dump();
  EXPECT_EQ(result["base_video_b64"], base64_encode("rendered"));
  EXPECT_EQ(result["upload_error"], "storage offline");
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, InlineTimelineIsPassed) {
  json result = run(inline_job({{"timeline_ini", "[0]\npreset=a.milk"},
                                {"preset_duration", 30}}));
  ASSERT_FALSE(result.contains("error")) << result.dump();
  std::string out = result["stdout"];
  EXPECT_NE(out.find("--timeline"), std::string::npos);
  EXPECT_EQ(out.find(" -d 30"), std::string::npos);
  EXPECT_NE(out.find("timeline: [0]"), std::string::npos);
}

TEST_F(JobHandlerTest, MissingAudio) {
  json result = run({{"id", "x"}, {"input", {{"fps", 30}}}});
  EXPECT_EQ(result, (json{{"error", "Missing audio_b64 or audio_url in payload"}}));
}

TEST_F(JobHandlerTest, NonObjectJob) {
  json result = run(json::array());
  EXPECT_EQ(result["error"], "Job record must be a JSON object");
}

TEST_F(JobHandlerTest, RendererFailure) {
  ::setenv("STUB_MODE", "fail", 1);
  json result = run(inline_job());
  EXPECT_EQ(result["error"], "Conversion failed (exit code 2)");
  EXPECT_EQ(result["stderr"], "renderer exploded\n");
  EXPECT_TRUE(result.contains("stdout"));
  EXPECT_TRUE(uploader_.names.empty());
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, MissingOutput) {
  ::setenv("STUB_MODE", "nooutput", 1);
  json result = run(inline_job());
  EXPECT_EQ(result["error"], "Conversion completed but output file is missing");
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, Timeout) {
  ::setenv("STUB_MODE", "hang", 1);
  json result = run(inline_job({{"timeout_sec", 1}}));
  EXPECT_EQ(result["error"], "Conversion timed out after 1.0 seconds");
  EXPECT_TRUE(result.contains("stdout"));
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, LaunchFailure) {
  settings_.convert_script = (dir_.path() / "missing.sh").string();
  json result = run(inline_job());
  std::string error = result["error"];
  EXPECT_EQ(error.rfind("Unexpected conversion failure: cannot execute", 0), 0u)
      << error;
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, RemoteAudioDownloaded) {
  FakeReply audio;
  audio.content_type = "audio/mpeg";
  audio.body = "ID3remote";
  replies_.push_back(audio);

  json job = {{"id", 7},
              {"input", {{"audio_url", "https://cdn.example.com/a.mp3"}}}};
  json result = run(job);
  ASSERT_FALSE(result.contains("error")) << result.dump();
  EXPECT_EQ(result["video_url"], "https://cdn.example.com/7-output.mp4");
}

TEST_F(JobHandlerTest, RemoteAudioFailure) {
  FakeReply page;
  page.content_type = "text/html";
  page.body = "<html>login</html>";
  replies_.push_back(page);

  json job = {{"input", {{"audio_url", "https://private.example.com/a"}}}};
  json result = run(job);
  std::string error = result["error"];
  EXPECT_EQ(error.rfind("Remote download failed: Remote URL returned HTML", 0),
            0u)
      << error;
  EXPECT_FALSE(result.contains("stdout"));
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, RemoteAudioDisabled) {
  settings_.allow_remote_audio = false;
  json job = {{"input", {{"audio_url", "https://cdn.example.com/a.mp3"}}}};
  json result = run(job);
  EXPECT_EQ(result["error"], "Remote audio URLs are disabled on this worker");
}

TEST_F(JobHandlerTest, TimelineDownloadFailure) {
  FakeReply missing;
  missing.status = 404;
  replies_.push_back(missing);

  json result =
      run(inline_job({{"timeline_url", "https://example.com/t.ini"}}));
  EXPECT_EQ(result["error"],
            "Timeline download failed: HTTP 404 from https://example.com/t.ini");
  EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobHandlerTest, InvalidOption) {
  json result = run(inline_job({{"encoder_speed", "warp"}}));
  std::string error = result["error"];
  EXPECT_EQ(error.rfind("Invalid value for encoder_speed", 0), 0u) << error;
  EXPECT_TRUE(scratch_is_empty());
}

TEST(FormatSeconds, IntegralValuesKeepOneDecimal) {
  EXPECT_EQ(format_seconds(10800), "10800.0");
  EXPECT_EQ(format_seconds(1.5), "1.5");
}
