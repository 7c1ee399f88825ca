/**
 * @file html_extract.hpp
 * @brief Heuristic extraction of direct-download URLs from landing pages
 *
 * @details Share links frequently answer with an HTML page (interstitial,
 *          virus-scan warning, JavaScript redirect) instead of the media.
 *          The extractor runs an ordered list of independent matchers and
 *          returns the first hit. Order encodes confidence, most structured
 *          first:
 *
 *          1. Script redirect (window.location)
 *
 *          2. Meta refresh
 *
 *          3. Drive uc? anchor
 *
 *          4. JSON "downloadUrl"
 *
 *          5. googleusercontent data-url attribute
 *
 *          6. Drive large-file confirm form
 *
 *          7. First bare URL carrying a known audio/file-host hint
 */

#ifndef PROJECTM_POD_HTML_EXTRACT_HPP
#define PROJECTM_POD_HTML_EXTRACT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace projectm_pod {

/// Matcher signature: cleaned candidate URL or nullopt
using HtmlMatcher = std::optional<std::string> (*)(const std::string &html);

/**
 * @struct NamedMatcher
 * @brief A matcher and the name used when logging which one fired.
 */
struct NamedMatcher {
  const char *name;
  HtmlMatcher match;
};

// **---- Individual Matchers ----**

std::optional<std::string> match_script_redirect(const std::string &html);
std::optional<std::string> match_meta_refresh(const std::string &html);
std::optional<std::string> match_drive_anchor(const std::string &html);
std::optional<std::string> match_json_download_url(const std::string &html);
std::optional<std::string> match_usercontent_data_url(const std::string &html);
std::optional<std::string> match_drive_confirm_form(const std::string &html);
std::optional<std::string> match_hinted_url(const std::string &html);

/**
 * @brief The matchers in priority order.
 */
const std::vector<NamedMatcher> &html_matchers();

/**
 * @brief Substrings that mark a bare URL as a likely direct download.
 */
const std::vector<std::string> &direct_audio_hints();

// **---- Extraction ----**

/**
 * @brief Locate an embedded direct-download URL.
 * @param html Decoded page text (see decode_text_lossy)
 * @return Cleaned candidate URL, or nullopt when no matcher fires
 */
std::optional<std::string> extract_direct_audio_url(const std::string &html);

// **---- Text Decoding ----**

/**
 * @brief Decode HTML character references (&amp;, &#39;, &#x2F;, ...).
 */
std::string html_unescape(std::string_view text);

/**
 * @brief Interpret backslash escapes (\uXXXX, \xNN, \/, \\, \n, ...).
 * @return nullopt when an escape sequence is malformed
 */
std::optional<std::string> unescape_backslashes(std::string_view text);

/**
 * @brief HTML-unescape, then one best-effort backslash pass.
 * @note The backslash pass is skipped when it fails.
 */
std::string clean_candidate(std::string_view candidate);

/**
 * @brief Treat bytes as UTF-8, replacing invalid sequences with U+FFFD.
 */
std::string decode_text_lossy(std::string_view bytes);

} // namespace projectm_pod

#endif // PROJECTM_POD_HTML_EXTRACT_HPP
