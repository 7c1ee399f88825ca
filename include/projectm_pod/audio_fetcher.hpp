/**
 * @file audio_fetcher.hpp
 * @brief Remote audio resolution and download
 *
 * @details AudioFetcher turns a user-supplied link into a local audio file:
 *
 *          1. Normalize cloud-storage share links
 *
 *          2. GET the URL (HTTP redirects are followed by the client)
 *
 *          3. audio/* response: stream it to disk, done
 *
 *          4. Anything else: read it as text, look for an embedded
 *             download URL and go back to 2 with it
 *
 *          Steps 2-4 run at most MAX_RESOLVE_ATTEMPTS times.
 */

#ifndef PROJECTM_POD_AUDIO_FETCHER_HPP
#define PROJECTM_POD_AUDIO_FETCHER_HPP

#include <filesystem>
#include <string>

#include "http_client.hpp"
#include "types.hpp"

namespace projectm_pod {

/**
 * @class AudioFetcher
 * @brief Bounded fetch -> extract chase over an HttpClient.
 * @note Holds a reference; the client must outlive the fetcher.
 */
class AudioFetcher {
public:
  explicit AudioFetcher(HttpClient &client) : client_(client) {}

  /**
   * @brief Resolve a (possibly indirect) audio link to a local file.
   * @param url User-supplied URL
   * @param dest Destination path (overwritten)
   * @return FetchResult; on failure no file is left at dest
   */
  FetchResult fetch(const std::string &url,
                    const std::filesystem::path &dest);

  /**
   * @brief Download a URL as-is, whatever its content type.
   * @note Used for timeline files. No HTML chase, no normalization.
   */
  FetchResult download(const std::string &url,
                       const std::filesystem::path &dest);

private:
  /// Stream the remaining body of response to dest
  FetchResult save_body(HttpResponse &response,
                        const std::filesystem::path &dest);

  HttpClient &client_;
};

} // namespace projectm_pod

#endif // PROJECTM_POD_AUDIO_FETCHER_HPP
