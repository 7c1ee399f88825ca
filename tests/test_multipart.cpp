#include <gtest/gtest.h>

#include "projectm_pod/multipart.hpp"

using namespace projectm_pod;

namespace {

const std::string kBoundary = "----formBoundary42";

std::string sample_body() {
  std::string body;
  body += "--" + kBoundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"fps\"\r\n\r\n";
  body += "30\r\n";
  body += "--" + kBoundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"audio_file\"; "
          "filename=\"song; live.mp3\"\r\n";
  body += "Content-Type: audio/mpeg\r\n\r\n";
  body += std::string("ID3\0\r\nbinary", 12);
  body += "\r\n--" + kBoundary + "--\r\n";
  return body;
}

} // namespace

TEST(Multipart, Boundary) {
  std::string boundary;
  ASSERT_TRUE(multipart_boundary(
      "multipart/form-data; boundary=\"" + kBoundary + "\"", boundary));
  EXPECT_EQ(boundary, kBoundary);
  EXPECT_FALSE(multipart_boundary("application/json", boundary));
  EXPECT_FALSE(multipart_boundary("multipart/form-data", boundary));
}

TEST(Multipart, ParsesFieldsAndFiles) {
  FormData form;
  std::string error;
  ASSERT_TRUE(parse_multipart(sample_body(), kBoundary, form, error)) << error;
  ASSERT_EQ(form.parts.size(), 2u);

  EXPECT_EQ(form.value("fps"), "30");

  const FormPart *file = form.find("audio_file");
  ASSERT_NE(file, nullptr);
  EXPECT_TRUE(file->is_file);
  EXPECT_EQ(file->filename, "song; live.mp3");
  EXPECT_EQ(file->content_type, "audio/mpeg");
  EXPECT_EQ(file->data, std::string("ID3\0\r\nbinary", 12));
  EXPECT_EQ(form.value("audio_file"), "");
}

TEST(Multipart, RejectsUnterminatedPart) {
  std::string body = "--" + kBoundary +
                     "\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\n"
                     "value without end";
  FormData form;
  std::string error;
  EXPECT_FALSE(parse_multipart(body, kBoundary, form, error));
  EXPECT_FALSE(error.empty());
}

TEST(Urlencoded, DecodesPairs) {
  FormData form;
  parse_urlencoded("audio_url=https%3A%2F%2Fexample.com%2Fa.mp3&mesh=64x48&"
                   "note=a+b&flag",
                   form);
  EXPECT_EQ(form.value("audio_url"), "https://example.com/a.mp3");
  EXPECT_EQ(form.value("mesh"), "64x48");
  EXPECT_EQ(form.value("note"), "a b");
  ASSERT_NE(form.find("flag"), nullptr);
  EXPECT_EQ(form.value("flag"), "");
}

TEST(ParseForm, DispatchesOnContentType) {
  FormData form;
  std::string error;
  ASSERT_TRUE(parse_form("multipart/form-data; boundary=" + kBoundary,
                         sample_body(), form, error));
  EXPECT_EQ(form.parts.size(), 2u);

  FormData other;
  EXPECT_FALSE(parse_form("application/json", "{}", other, error));
  EXPECT_EQ(error, "unsupported Content-Type 'application/json'");
}
