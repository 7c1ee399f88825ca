/**
 * @file uploader.cpp
 * @brief HTTP PUT uploader implementation
 */

#include "projectm_pod/uploader.hpp"

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"
#include "projectm_pod/url.hpp"

namespace projectm_pod {

namespace {

/// Content-Type from the extension of the rendered file
std::string content_type_for(const std::filesystem::path &file) {
  std::string ext = to_lower(file.extension().string());
  if (ext == ".mp4" || ext == ".m4v")
    return "video/mp4";
  if (ext == ".webm")
    return "video/webm";
  if (ext == ".mkv")
    return "video/x-matroska";
  if (ext == ".mov")
    return "video/quicktime";
  return "application/octet-stream";
}

} // anonymous namespace

HttpPutUploader::HttpPutUploader(HttpClient &client, std::string endpoint)
    : client_(client), endpoint_(trim(endpoint)) {
  while (!endpoint_.empty() && endpoint_.back() == '/')
    endpoint_.pop_back();
}

std::string HttpPutUploader::object_url(const std::string &object_name) const {
  return endpoint_ + "/" + url_encode(object_name);
}

UploadResult HttpPutUploader::upload(const std::filesystem::path &file,
                                     const std::string &object_name) {
  UploadResult result;
  if (endpoint_.empty()) {
    result.error = "RUNPOD_UPLOAD_ENDPOINT is not configured";
    return result;
  }

  std::string url = object_url(object_name);
  LOG_DEBUG("PUT {} -> {}", file.string(), url);

  int status = 0;
  std::string body, error;
  if (!client_.put_file(url, file, content_type_for(file), status, body,
                        error)) {
    result.error = fmt::format("upload to {} failed: {}", url, error);
    return result;
  }
  if (status < 200 || status >= 300) {
    result.error = fmt::format("upload to {} returned HTTP {}: {}", url,
                               status, tail_text(trim(body), 200));
    return result;
  }

  result.ok = true;
  result.reference = url;
  return result;
}

} // namespace projectm_pod
