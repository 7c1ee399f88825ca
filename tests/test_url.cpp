#include <gtest/gtest.h>

#include "projectm_pod/url.hpp"

using namespace projectm_pod;

TEST(ParseUrl, SplitsComponents) {
  Url url;
  ASSERT_TRUE(parse_url("HTTPS://user@Example.com:8443/a/b?x=1#frag", url));
  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.userinfo, "user");
  EXPECT_EQ(url.port, "8443");
  EXPECT_EQ(url.path, "/a/b");
  EXPECT_EQ(url.query, "x=1");
  EXPECT_EQ(url.fragment, "frag");
  EXPECT_EQ(url.target(), "/a/b?x=1");
  EXPECT_EQ(url.effective_port(), 8443);
}

TEST(ParseUrl, DefaultPorts) {
  Url http, https;
  ASSERT_TRUE(parse_url("http://example.com/", http));
  ASSERT_TRUE(parse_url("https://example.com/", https));
  EXPECT_EQ(http.effective_port(), 80);
  EXPECT_EQ(https.effective_port(), 443);
}

TEST(ParseUrl, RejectsNonUrls) {
  Url url;
  EXPECT_FALSE(parse_url("not a url", url));
  EXPECT_FALSE(parse_url("", url));
}

TEST(ResolveUrl, RelativeReferences) {
  Url base;
  ASSERT_TRUE(parse_url("https://example.com/dir/page.html?q=1", base));
  EXPECT_EQ(resolve_url(base, "/abs/file.mp3"),
            "https://example.com/abs/file.mp3");
  EXPECT_EQ(resolve_url(base, "file.mp3"),
            "https://example.com/dir/file.mp3");
  EXPECT_EQ(resolve_url(base, "//cdn.example.com/x.mp3"),
            "https://cdn.example.com/x.mp3");
}

TEST(NormalizeStorageUrl, DropboxForcesDownload) {
  EXPECT_EQ(normalize_storage_url("https://www.dropbox.com/s/abc/song.mp3?dl=0"),
            "https://www.dropbox.com/s/abc/song.mp3?dl=1");
  EXPECT_EQ(normalize_storage_url("https://dropbox.com/s/abc/song.mp3"),
            "https://www.dropbox.com/s/abc/song.mp3?dl=1");
}

TEST(NormalizeStorageUrl, OneDriveAddsDownloadFlag) {
  EXPECT_EQ(normalize_storage_url("https://onedrive.live.com/redir?resid=ABC"),
            "https://onedrive.live.com/redir?resid=ABC&download=1");
  EXPECT_EQ(normalize_storage_url("https://1drv.ms/u/s!xyz"),
            "https://1drv.ms/u/s!xyz?download=1");
}

TEST(NormalizeStorageUrl, GoogleDriveFileLink) {
  EXPECT_EQ(normalize_storage_url(
                "https://drive.google.com/file/d/FILE123/view?usp=sharing"),
            "https://drive.google.com/uc?export=download&id=FILE123");
  EXPECT_EQ(normalize_storage_url("https://drive.google.com/open?id=FILE456"),
            "https://drive.google.com/uc?export=download&id=FILE456");
}

TEST(NormalizeStorageUrl, GoogleDriveWithoutIdUnchanged) {
  const std::string url = "https://drive.google.com/drive/folders";
  EXPECT_EQ(normalize_storage_url(url), url);
}

TEST(NormalizeStorageUrl, OtherHostsUnchanged) {
  const std::string url = "https://cdn.example.com/audio/track.mp3?sig=a%2Bb";
  EXPECT_EQ(normalize_storage_url(url), url);
  EXPECT_EQ(normalize_storage_url("garbage"), "garbage");
}

TEST(UrlEncoding, RoundTripsReservedCharacters) {
  EXPECT_EQ(url_encode("a b&c/d"), "a+b%26c%2Fd");
  EXPECT_EQ(url_decode("a+b%26c%2Fd"), "a b&c/d");
  EXPECT_EQ(url_decode("a+b", false), "a+b");
}
