/**
 * @file media.cpp
 * @brief Audio probing and base64 helpers implementation
 */

#include "projectm_pod/media.hpp"

#include <cctype>
#include <climits>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/base64.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"

namespace projectm_pod {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

/// av_base64_* take int sizes
constexpr size_t MAX_BASE64_INPUT = (INT_MAX / 4) * 3 - 3;

} // anonymous namespace

// **---- AudioProbe ----**

AudioProbe::~AudioProbe() {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool AudioProbe::open(const std::filesystem::path &path) {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  audio_stream_idx = -1;
  error_.clear();

  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    error_ = "Failed to open input: " + av_error_string(ret);
    return false;
  }

  /// Reads a few packets to fill in stream parameters
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    error_ = "Failed to find stream info: " + av_error_string(ret);
    return false;
  }

  audio_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_stream_idx < 0) {
    error_ = "No audio stream found";
    return false;
  }
  return true;
}

double AudioProbe::duration() const {
  if (!fmt_ctx)
    return 0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE)
    return fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);

  /// Fall back to the longest stream
  double longest = 0;
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    AVStream *st = fmt_ctx->streams[i];
    if (st->duration != AV_NOPTS_VALUE) {
      double d = static_cast<double>(st->duration) * av_q2d(st->time_base);
      if (d > longest)
        longest = d;
    }
  }
  return longest;
}

std::string AudioProbe::format_name() const {
  if (!fmt_ctx || !fmt_ctx->iformat || !fmt_ctx->iformat->name)
    return {};
  return fmt_ctx->iformat->name;
}

std::string AudioProbe::codec_name() const {
  if (!fmt_ctx || audio_stream_idx < 0)
    return {};
  return avcodec_get_name(
      fmt_ctx->streams[audio_stream_idx]->codecpar->codec_id);
}

// **---- Base64 ----**

std::string base64_encode(std::string_view data) {
  if (data.empty())
    return {};
  if (data.size() > MAX_BASE64_INPUT) {
    LOG_ERROR("base64 input of {} bytes exceeds the encoder limit",
              data.size());
    return {};
  }

  std::string out(AV_BASE64_SIZE(data.size()), '\0');
  const char *encoded =
      av_base64_encode(&out[0], static_cast<int>(out.size()),
                       reinterpret_cast<const uint8_t *>(data.data()),
                       static_cast<int>(data.size()));
  if (!encoded)
    return {};
  out.resize(out.size() - 1); //< Drop the terminating NUL
  return out;
}

bool base64_decode(std::string_view text, std::string &out) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      compact += c;
  }
  out.clear();
  if (compact.empty())
    return true;
  if (compact.size() % 4 != 0 || compact.size() > INT_MAX)
    return false;

  out.resize(AV_BASE64_DECODE_SIZE(compact.size()));
  int n = av_base64_decode(reinterpret_cast<uint8_t *>(&out[0]),
                           compact.c_str(), static_cast<int>(out.size()));
  if (n < 0) {
    out.clear();
    return false;
  }
  out.resize(static_cast<size_t>(n));
  return true;
}

bool base64_encode_file(const std::filesystem::path &path, std::string &out,
                        std::string &error) {
  std::string data;
  if (!read_file(path, data, error))
    return false;
  if (data.size() > MAX_BASE64_INPUT) {
    error = fmt::format("{} is too large to inline ({} bytes)", path.string(),
                        data.size());
    return false;
  }
  out = base64_encode(data);
  return true;
}

} // namespace projectm_pod
