#include <gtest/gtest.h>

#include <fstream>

#include "fake_http.hpp"
#include "projectm_pod/audio_fetcher.hpp"
#include "projectm_pod/system.hpp"

using namespace projectm_pod;
using projectm_pod::testing::FakeHttpClient;
using projectm_pod::testing::FakeReply;

namespace {

FakeReply audio(const std::string &body) {
  FakeReply reply;
  reply.content_type = "Audio/MPEG";
  reply.body = body;
  return reply;
}

FakeReply html(const std::string &body) {
  FakeReply reply;
  reply.content_type = "text/html; charset=utf-8";
  reply.body = body;
  return reply;
}

class AudioFetcherTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(dir_.valid()); }

  std::filesystem::path dest() const { return dir_.path() / "audio.mp3"; }

  TempDirectory dir_{"fetcher_test_"};
  FakeHttpClient client_;
};

} // namespace

TEST_F(AudioFetcherTest, DirectAudioIsStreamed) {
  client_.push(audio("ID3 audio bytes"));
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://cdn.example.com/a.mp3", dest());
  ASSERT_TRUE(result) << result.error;
  EXPECT_EQ(result.bytes, 15u);
  EXPECT_EQ(result.http_status, 200);

  std::string data, error;
  ASSERT_TRUE(read_file(dest(), data, error));
  EXPECT_EQ(data, "ID3 audio bytes");
}

TEST_F(AudioFetcherTest, ShareLinkIsNormalizedBeforeRequest) {
  client_.push(audio("x"));
  AudioFetcher fetcher(client_);
  ASSERT_TRUE(fetcher.fetch("https://www.dropbox.com/s/abc/song.mp3?dl=0",
                            dest()));
  ASSERT_EQ(client_.requests.size(), 1u);
  EXPECT_EQ(client_.requests[0], "https://www.dropbox.com/s/abc/song.mp3?dl=1");
}

TEST_F(AudioFetcherTest, FollowsHtmlRedirectPages) {
  client_.push(html("<meta http-equiv=\"refresh\" content=\"0;url=/step2\">"));
  client_.push(html("<script>window.location.href = "
                    "'https://files.example.com/final.mp3'</script>"));
  client_.push(audio("final"));
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://landing.example.com/p/1", dest());
  ASSERT_TRUE(result) << result.error;
  ASSERT_EQ(client_.requests.size(), 3u);
  EXPECT_EQ(client_.requests[1], "https://landing.example.com/step2");
  EXPECT_EQ(client_.requests[2], "https://files.example.com/final.mp3");
}

TEST_F(AudioFetcherTest, GivesUpAfterFourPages) {
  /// Every page points at another page
  client_.push(html("<meta http-equiv=\"refresh\" content=\"0;url=/again\">"));
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://loop.example.com/start", dest());
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error,
            "Could not resolve remote audio after multiple attempts.");
  EXPECT_EQ(client_.requests.size(), 4u);
  EXPECT_FALSE(std::filesystem::exists(dest()));
}

TEST_F(AudioFetcherTest, HtmlWithoutCandidate) {
  client_.push(html("<html><body>Please sign in</body></html>"));
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://private.example.com/x", dest());
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error,
            "Remote URL returned HTML or requires authentication. Ensure the "
            "link is publicly accessible.");
  EXPECT_EQ(client_.requests.size(), 1u);
}

TEST_F(AudioFetcherTest, EmptyAudioBodyIsRemoved) {
  std::ofstream(dest()) << "stale";
  client_.push(audio(""));
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://cdn.example.com/empty.mp3", dest());
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error, "Remote download returned an empty file.");
  EXPECT_FALSE(std::filesystem::exists(dest()));
}

TEST_F(AudioFetcherTest, HttpErrorStatus) {
  FakeReply missing;
  missing.status = 404;
  missing.content_type = "text/html";
  client_.push(missing);
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://cdn.example.com/gone.mp3", dest());
  EXPECT_FALSE(result);
  EXPECT_EQ(result.http_status, 404);
  EXPECT_EQ(result.error, "HTTP 404 from https://cdn.example.com/gone.mp3");
}

TEST_F(AudioFetcherTest, TransportError) {
  FakeReply refused;
  refused.transport_error = true;
  client_.push(refused);
  AudioFetcher fetcher(client_);

  FetchResult result = fetcher.fetch("https://down.example.com/a.mp3", dest());
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error, "connection refused");
}

TEST_F(AudioFetcherTest, DownloadAcceptsAnyContentType) {
  FakeReply ini;
  ini.content_type = "text/plain";
  ini.body = "[timeline]\n";
  client_.push(ini);
  AudioFetcher fetcher(client_);

  auto target = dir_.path() / "timeline.ini";
  FetchResult result = fetcher.download("https://example.com/t.ini", target);
  ASSERT_TRUE(result) << result.error;
  std::string data, error;
  ASSERT_TRUE(read_file(target, data, error));
  EXPECT_EQ(data, "[timeline]\n");
}
