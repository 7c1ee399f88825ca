/**
 * @file media.hpp
 * @brief Media helpers backed by FFmpeg (libavformat, libavutil)
 *
 * @details Provides:
 *
 *          - AudioProbe: opens an audio file and reports its container,
 *            codec and duration before the renderer is started
 *
 *          - Base64 encode/decode for inline payloads
 */

#ifndef PROJECTM_POD_MEDIA_HPP
#define PROJECTM_POD_MEDIA_HPP

extern "C" {
#include <libavformat/avformat.h>
}

#include <filesystem>
#include <string>
#include <string_view>

namespace projectm_pod {

/**
 * @class AudioProbe
 * @brief Reads container headers of an audio file.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Owns its AVFormatContext; freed in the destructor, including
 *              after a failed open()
 *
 *            - One instance per file and thread (libavformat contexts are
 *              not thread-safe)
 */
class AudioProbe {
  AVFormatContext *fmt_ctx = nullptr;
  int audio_stream_idx = -1;
  std::string error_;

public:
  AudioProbe() = default;
  ~AudioProbe();

  AudioProbe(const AudioProbe &) = delete;
  AudioProbe &operator=(const AudioProbe &) = delete;

  /**
   * @brief Open the file and locate its best audio stream.
   * @return true when the file decodes as audio, false otherwise (error())
   */
  bool open(const std::filesystem::path &path);

  /// Duration in seconds (0 when unknown)
  double duration() const;

  /// Short container name, e.g. "mp3" or "mov,mp4,m4a,3gp,3g2,mj2"
  std::string format_name() const;

  /// Codec name of the selected audio stream
  std::string codec_name() const;

  const std::string &error() const { return error_; }
};

// **---- Base64 ----**

/**
 * @brief Encode bytes as standard base64 (with padding).
 */
std::string base64_encode(std::string_view data);

/**
 * @brief Decode standard base64.
 * @note ASCII whitespace (line breaks in pasted payloads) is ignored.
 * @return false when the text is not valid base64
 */
bool base64_decode(std::string_view text, std::string &out);

/**
 * @brief Read a file and return its base64 encoding.
 * @return false on read failure (error is filled)
 */
bool base64_encode_file(const std::filesystem::path &path, std::string &out,
                        std::string &error);

} // namespace projectm_pod

#endif // PROJECTM_POD_MEDIA_HPP
