/**
 * @file audio_fetcher.cpp
 * @brief Remote audio resolution and download implementation
 */

#include "projectm_pod/audio_fetcher.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "projectm_pod/html_extract.hpp"
#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"
#include "projectm_pod/url.hpp"

namespace projectm_pod {

namespace fs = std::filesystem;

namespace {

void remove_partial(const fs::path &dest) {
  std::error_code ec;
  fs::remove(dest, ec);
}

FetchResult failure(std::string error, int http_status = 0) {
  FetchResult result;
  result.error = std::move(error);
  result.http_status = http_status;
  return result;
}

std::string status_error(const HttpResponse &response) {
  return fmt::format("HTTP {} from {}", response.status(), response.url());
}

bool is_audio_content_type(const std::string &content_type) {
  return to_lower(trim(content_type)).rfind("audio/", 0) == 0;
}

/// Read at most MAX_HTML_BYTES of the body
bool read_text_body(HttpResponse &response, std::string &out,
                    std::string &error) {
  std::vector<char> chunk(64 * 1024);
  while (out.size() < MAX_HTML_BYTES) {
    size_t n = 0;
    size_t want = std::min(chunk.size(), MAX_HTML_BYTES - out.size());
    if (!response.read(chunk.data(), want, n, error))
      return false;
    if (n == 0)
      break;
    out.append(chunk.data(), n);
  }
  return true;
}

} // anonymous namespace

FetchResult AudioFetcher::save_body(HttpResponse &response,
                                    const fs::path &dest) {
  std::ofstream out(dest, std::ios::binary | std::ios::trunc);
  if (!out) {
    return failure(fmt::format("cannot open {} for writing", dest.string()),
                   response.status());
  }

  std::vector<char> chunk(DOWNLOAD_CHUNK_SIZE);
  std::uintmax_t total = 0;
  std::string error;
  for (;;) {
    size_t n = 0;
    if (!response.read(chunk.data(), chunk.size(), n, error)) {
      out.close();
      remove_partial(dest);
      return failure(error, response.status());
    }
    if (n == 0)
      break;
    out.write(chunk.data(), static_cast<std::streamsize>(n));
    if (!out) {
      out.close();
      remove_partial(dest);
      return failure(fmt::format("write to {} failed", dest.string()),
                     response.status());
    }
    total += n;
  }
  out.close();

  if (total == 0) {
    remove_partial(dest);
    return failure("Remote download returned an empty file.",
                   response.status());
  }

  FetchResult result;
  result.ok = true;
  result.path = dest;
  result.bytes = total;
  result.http_status = response.status();
  return result;
}

FetchResult AudioFetcher::fetch(const std::string &url, const fs::path &dest) {
  std::string current = normalize_storage_url(url);
  if (current != url) {
    LOG_DEBUG("Normalized share link: {} -> {}", url, current);
  }

  for (int attempt = 1; attempt <= MAX_RESOLVE_ATTEMPTS; ++attempt) {
    LOG_DEBUG("Resolve attempt {}/{}: {}", attempt, MAX_RESOLVE_ATTEMPTS,
              current);

    std::string error;
    auto response = client_.get(current, error);
    if (!response) {
      remove_partial(dest);
      return failure(error);
    }
    if (!response->ok()) {
      remove_partial(dest);
      return failure(status_error(*response), response->status());
    }

    std::string content_type = response->header("Content-Type");
    if (is_audio_content_type(content_type)) {
      LOG_DEBUG("Streaming {} ({})", response->url(), content_type);
      return save_body(*response, dest);
    }

    std::string body;
    if (!read_text_body(*response, body, error)) {
      remove_partial(dest);
      return failure(error, response->status());
    }

    auto candidate = extract_direct_audio_url(decode_text_lossy(body));
    if (!candidate) {
      remove_partial(dest);
      return failure("Remote URL returned HTML or requires authentication. "
                     "Ensure the link is publicly accessible.",
                     response->status());
    }

    /// Relative candidates resolve against the page they came from
    Url page;
    if (candidate->find("://") == std::string::npos &&
        parse_url(response->url(), page)) {
      current = resolve_url(page, *candidate);
    } else {
      current = *candidate;
    }
    LOG_DEBUG("Landing page {} points to {}", response->url(), current);
  }

  remove_partial(dest);
  return failure("Could not resolve remote audio after multiple attempts.");
}

FetchResult AudioFetcher::download(const std::string &url,
                                   const fs::path &dest) {
  std::string error;
  auto response = client_.get(url, error);
  if (!response) {
    remove_partial(dest);
    return failure(error);
  }
  if (!response->ok()) {
    remove_partial(dest);
    return failure(status_error(*response), response->status());
  }
  return save_body(*response, dest);
}

} // namespace projectm_pod
