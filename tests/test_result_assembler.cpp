#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fake_http.hpp"
#include "projectm_pod/media.hpp"
#include "projectm_pod/result_assembler.hpp"
#include "projectm_pod/system.hpp"
#include "projectm_pod/uploader.hpp"

using namespace projectm_pod;
using projectm_pod::testing::FakeHttpClient;

namespace {

class ResultAssemblerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    output_ = dir_.path() / "output.mp4";
    std::string error;
    ASSERT_TRUE(write_file(output_, "rendered", error)) << error;
    outcome_.status = ProcessStatus::Exited;
    outcome_.exit_code = 0;
    outcome_.stdout_text = "frames: 120\n";
    outcome_.stderr_text = "encoder warning\n";
  }

  TempDirectory dir_{"assembler_test_"};
  std::filesystem::path output_;
  ProcessOutcome outcome_;
  FakeHttpClient client_;
};

} // namespace

TEST_F(ResultAssemblerTest, UploadSuccessGivesUrl) {
  HttpPutUploader uploader(client_, "https://cdn.example.com/videos/");
  ResultAssembler assembler(uploader);

  JobResult result = assembler.assemble(output_, outcome_, "job 1-output.mp4");
  ASSERT_TRUE(result.ok()) << result.error();
  EXPECT_EQ(result.video_url(),
            "https://cdn.example.com/videos/job+1-output.mp4");
  EXPECT_EQ(client_.put_types.at(0), "video/mp4");
  EXPECT_EQ(client_.stored.at(result.video_url()), "rendered");

  nlohmann::json json = result.to_json();
  EXPECT_EQ(json["video_url"], result.video_url());
  EXPECT_FALSE(json.contains("base_video_b64"));
  EXPECT_FALSE(json.contains("upload_error"));
  EXPECT_EQ(json["stdout"], "frames: 120\n");
  EXPECT_EQ(json["stderr"], "encoder warning\n");
  EXPECT_TRUE(json["file_size_mb"].is_number());
}

TEST_F(ResultAssemblerTest, UploadFailureFallsBackToBase64) {
  client_.put_status = 503;
  client_.put_body = "busy";
  HttpPutUploader uploader(client_, "https://cdn.example.com/videos");
  ResultAssembler assembler(uploader);

  JobResult result = assembler.assemble(output_, outcome_, "out.mp4");
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.video_url().empty());
  EXPECT_EQ(result.video_b64(), base64_encode("rendered"));
  EXPECT_EQ(result.upload_error(),
            "upload to https://cdn.example.com/videos/out.mp4 returned HTTP "
            "503: busy");

  nlohmann::json json = result.to_json();
  EXPECT_EQ(json["base_video_b64"], "cmVuZGVyZWQ=");
  EXPECT_EQ(json["upload_error"], result.upload_error());
  EXPECT_FALSE(json.contains("video_url"));
}

TEST_F(ResultAssemblerTest, UnconfiguredEndpointFallsBack) {
  HttpPutUploader uploader(client_, "  ");
  ResultAssembler assembler(uploader);

  JobResult result = assembler.assemble(output_, outcome_, "out.mp4");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.upload_error(), "RUNPOD_UPLOAD_ENDPOINT is not configured");
  EXPECT_TRUE(client_.puts.empty());
}

TEST_F(ResultAssemblerTest, MissingOutputIsInternalError) {
  HttpPutUploader uploader(client_, "https://cdn.example.com");
  ResultAssembler assembler(uploader);

  JobResult result =
      assembler.assemble(dir_.path() / "missing.mp4", outcome_, "x.mp4");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error_kind(), ErrorKind::Internal);
  EXPECT_EQ(result.error().rfind("Unexpected conversion failure: ", 0), 0u);
  EXPECT_TRUE(result.has_streams());
}

TEST(JobResultJson, FailureWithoutStreams) {
  nlohmann::json json =
      JobResult::failure(ErrorKind::Input, "Missing audio").to_json();
  EXPECT_EQ(json, (nlohmann::json{{"error", "Missing audio"}}));
}

TEST(JobResultJson, FailureWithStreams) {
  nlohmann::json json =
      JobResult::failure(ErrorKind::Process, "Conversion failed (exit code 1)",
                         "out", "err")
          .to_json();
  EXPECT_EQ(json["error"], "Conversion failed (exit code 1)");
  EXPECT_EQ(json["stdout"], "out");
  EXPECT_EQ(json["stderr"], "err");
  EXPECT_FALSE(json.contains("file_size_mb"));
}
