/**
 * @file url.hpp
 * @brief URL parsing, query encoding and storage-link normalization
 *
 * @details Provides:
 *          - Url: split representation of an absolute URL
 *
 *          - Query helpers with form encoding (space as '+')
 *
 *          - normalize_storage_url: rewrites cloud-storage share links into
 *            direct-download URLs
 */

#ifndef PROJECTM_POD_URL_HPP
#define PROJECTM_POD_URL_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace projectm_pod {

/**
 * @struct Url
 * @brief Components of scheme://[userinfo@]host[:port]/path?query#fragment
 * @note query and fragment are stored without their leading '?' / '#'.
 */
struct Url {
  std::string scheme; //< Lowercase
  std::string userinfo;
  std::string host; //< Without brackets for IPv6 literals
  std::string port; //< Empty when not given
  std::string path;
  std::string query;
  std::string fragment;

  /// host[:port] with userinfo, as it appears in the URL
  std::string netloc() const;

  /// Reassemble the URL
  std::string str() const;

  /// Request target for an HTTP request line (path + query)
  std::string target() const;

  /// Explicit port, or the scheme default (80/443)
  unsigned short effective_port() const;
};

/**
 * @brief Parse an absolute URL.
 * @return false when the text has no scheme:// prefix or an invalid port
 */
bool parse_url(const std::string &text, Url &out);

/// Ordered (name, value) pairs; names are unique after parse_query
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Decode a query string, keeping blank values.
 * @note Duplicate names collapse to one entry at the first position
 *       carrying the last value.
 */
QueryParams parse_query(std::string_view query);

/**
 * @brief Replace a parameter value in place or append it.
 */
void set_query_param(QueryParams &params, const std::string &name,
                     const std::string &value);

/**
 * @brief Form-encode parameters ("a=1&b=x+y").
 */
std::string encode_query(const QueryParams &params);

/// Percent-encode everything except unreserved characters; space as '+'
std::string url_encode(std::string_view text);

/// Decode %XX escapes and (optionally) '+' as space
std::string url_decode(std::string_view text, bool plus_as_space = true);

/**
 * @brief Resolve a Location header value against the URL it came from.
 */
std::string resolve_url(const Url &base, const std::string &reference);

/**
 * @brief Coerce known cloud-storage share links into direct downloads.
 *
 * @attention RULES (matched on the lowercase host):
 *
 * - dropbox.com: force dl=1, host pinned to www.dropbox.com
 *
 * - onedrive / 1drv.ms / sharepoint.com: force download=1
 *
 * - drive.google.com / docs.google.com: file id from /file/d/{id}/ or the
 *   id parameter, rewritten to https://drive.google.com/uc?export=download&id={id}
 *
 * @return Rewritten URL, or the input unchanged for any other host or for
 *         text that does not parse as a URL
 */
std::string normalize_storage_url(const std::string &url);

} // namespace projectm_pod

#endif // PROJECTM_POD_URL_HPP
