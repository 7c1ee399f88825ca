/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - TempDirectory creation via mkdtemp and recursive removal
 *
 *          - Whole-file read/write helpers
 *
 *          - Text formatting utilities
 */

#include "projectm_pod/system.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include <stdlib.h>

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"

namespace projectm_pod {

namespace fs = std::filesystem;

namespace {

/// About 114 years; keeps the integer conversion defined
constexpr double MAX_FORMATTED_SECONDS = 3.6e9;

} // anonymous namespace

// **---- TempDirectory ----**

TempDirectory::TempDirectory(const std::string &prefix) {
  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec) {
    root = "/tmp";
  }

  std::string pattern = (root / (prefix + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (mkdtemp(buf.data()) == nullptr) {
    error_ = fmt::format("mkdtemp({}) failed: {}", pattern,
                         std::strerror(errno));
    return;
  }
  path_ = fs::path(buf.data());
}

TempDirectory::~TempDirectory() { remove(); }

TempDirectory::TempDirectory(TempDirectory &&other) noexcept
    : path_(std::move(other.path_)), error_(std::move(other.error_)) {
  other.path_.clear();
}

TempDirectory &TempDirectory::operator=(TempDirectory &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    error_ = std::move(other.error_);
    other.path_.clear();
  }
  return *this;
}

void TempDirectory::remove() {
  if (path_.empty())
    return;

  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove temp directory {}: {}", path_.string(),
             ec.message());
  }
  path_.clear();
}

// **---- File Helpers ----**

bool read_file(const fs::path &path, std::string &out, std::string &error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = fmt::format("cannot open {}", path.string());
    return false;
  }

  std::error_code ec;
  auto size = fs::file_size(path, ec);
  out.clear();
  if (!ec) {
    out.reserve(static_cast<size_t>(size));
  }
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  if (in.bad()) {
    error = fmt::format("read error on {}", path.string());
    return false;
  }
  return true;
}

bool write_file(const fs::path &path, std::string_view data,
                std::string &error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = fmt::format("cannot create {}", path.string());
    return false;
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    error = fmt::format("write error on {}", path.string());
    return false;
  }
  return true;
}

double size_mb(std::uintmax_t bytes) {
  double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  return std::round(mb * 100.0) / 100.0;
}

// **---- Text Utilities ----**

std::string tail_text(const std::string &text, size_t max_chars) {
  if (text.size() <= max_chars)
    return text;
  return "..." + text.substr(text.size() - max_chars);
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  return std::string(text.substr(begin, end - begin));
}

std::string format_time(double seconds) {
  /// Corrupt container metadata can report absurd or NaN durations
  if (!(seconds > 0))
    seconds = 0;
  long long total =
      static_cast<long long>(std::min(seconds, MAX_FORMATTED_SECONDS));
  long long h = total / 3600;
  long long m = (total % 3600) / 60;
  long long s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace projectm_pod
