/**
 * @file html_extract.cpp
 * @brief Landing-page URL extraction implementation
 *
 * @details Each matcher owns its compiled patterns as function-local
 *          statics, so they are built once and shared read-only between
 *          concurrent jobs.
 */

#include "projectm_pod/html_extract.hpp"

#include <cctype>
#include <cstdint>
#include <regex>

#include "projectm_pod/logging.hpp"
#include "projectm_pod/system.hpp"
#include "projectm_pod/url.hpp"

namespace projectm_pod {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

/// First capture group of the first match, cleaned
std::optional<std::string> first_group(const std::regex &pattern,
                                       const std::string &html) {
  std::smatch match;
  if (std::regex_search(html, match, pattern) && match.size() > 1 &&
      match[1].matched) {
    return clean_candidate(match[1].str());
  }
  return std::nullopt;
}

void append_utf8(std::string &out, uint32_t cp) {
  if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    cp = 0xFFFD;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

/// Parse exactly `count` hex digits at text[pos]
bool parse_hex(std::string_view text, size_t pos, size_t count,
               uint32_t &value) {
  if (pos + count > text.size())
    return false;
  value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    int digit;
    if (c >= '0' && c <= '9')
      digit = c - '0';
    else if (c >= 'a' && c <= 'f')
      digit = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
      digit = c - 'A' + 10;
    else
      return false;
    value = (value << 4) | static_cast<uint32_t>(digit);
  }
  return true;
}

struct NamedEntity {
  const char *name;
  uint32_t cp;
  bool needs_semicolon;
};

/// Entities seen in share pages; the legacy four also parse without ';'
const NamedEntity kEntities[] = {
    {"amp", '&', false},  {"lt", '<', false},     {"gt", '>', false},
    {"quot", '"', false}, {"apos", '\'', true},   {"nbsp", 0xA0, true},
    {"sol", '/', true},   {"colon", ':', true},   {"equals", '=', true},
    {"quest", '?', true}, {"percnt", '%', true},  {"num", '#', true},
    {"lowbar", '_', true}, {"period", '.', true}, {"comma", ',', true},
    {"plus", '+', true},  {"hyphen", 0x2010, true},
};

/// Whitespace or a quote ends a bare URL
bool is_url_terminator(char c) {
  switch (c) {
  case ' ':
  case '\t':
  case '\n':
  case '\r':
  case '\f':
  case '\v':
  case '"':
  case '\'':
    return true;
  default:
    return false;
  }
}

} // anonymous namespace

// **---- Individual Matchers ----**

std::optional<std::string> match_script_redirect(const std::string &html) {
  static const std::regex call(
      R"re(window\.location(?:\.replace|\.href)?\s{0,32}\(\s{0,32}['"]([^'"]{1,4096})['"])re",
      kIcase);
  static const std::regex assign(
      R"re(window\.location(?:\.href)?\s{0,32}=\s{0,32}['"]([^'"]{1,4096})['"])re",
      kIcase);

  if (auto hit = first_group(call, html))
    return hit;
  return first_group(assign, html);
}

std::optional<std::string> match_meta_refresh(const std::string &html) {
  static const std::regex pattern(
      R"re(content\s{0,32}=\s{0,32}["']\d{1,10}\s{0,32};\s{0,32}url\s{0,32}=\s{0,32}'?([^"']{1,4096})["'])re",
      kIcase);
  return first_group(pattern, html);
}

std::optional<std::string> match_drive_anchor(const std::string &html) {
  static const std::regex pattern(
      R"re(href="(https://drive\.google\.com/uc\?[^"]{1,4096})")re", kIcase);
  return first_group(pattern, html);
}

std::optional<std::string> match_json_download_url(const std::string &html) {
  static const std::regex pattern(
      R"re("downloadUrl":"(https:[^"]{1,4096})")re", kIcase);
  return first_group(pattern, html);
}

std::optional<std::string>
match_usercontent_data_url(const std::string &html) {
  static const std::regex pattern(
      R"re(data-url="(https://[^"]{1,2048}googleusercontent\.com[^"]{1,2048})")re",
      kIcase);
  return first_group(pattern, html);
}

std::optional<std::string> match_drive_confirm_form(const std::string &html) {
  static const std::regex confirm_pattern(
      R"re(name=["']confirm["']\s{1,32}value=["']([^"']{1,4096})["'])re",
      kIcase);
  static const std::regex id_pattern(
      R"re(name=["']id["']\s{1,32}value=["']([^"']{1,4096})["'])re", kIcase);

  auto confirm = first_group(confirm_pattern, html);
  if (!confirm)
    return std::nullopt;
  auto id = first_group(id_pattern, html);
  if (!id)
    return std::nullopt;

  QueryParams query = {
      {"export", "download"}, {"confirm", *confirm}, {"id", *id}};
  return "https://drive.google.com/uc?" + encode_query(query);
}

std::optional<std::string> match_hinted_url(const std::string &html) {
  const auto &hints = direct_audio_hints();

  /// Linear scan; a single unbroken URL may be megabytes long
  size_t pos = 0;
  while ((pos = html.find("http", pos)) != std::string::npos) {
    size_t scheme_end = pos + 4;
    if (scheme_end < html.size() && html[scheme_end] == 's')
      ++scheme_end;
    if (html.compare(scheme_end, 3, "://") != 0) {
      pos += 4;
      continue;
    }

    size_t end = scheme_end + 3;
    while (end < html.size() && !is_url_terminator(html[end]))
      ++end;
    if (end == scheme_end + 3) {
      pos = end;
      continue;
    }

    std::string cleaned = clean_candidate(
        std::string_view(html).substr(pos, end - pos));
    std::string lowered = to_lower(cleaned);
    for (const auto &hint : hints) {
      if (lowered.find(hint) != std::string::npos)
        return cleaned;
    }
    pos = end;
  }
  return std::nullopt;
}

const std::vector<NamedMatcher> &html_matchers() {
  static const std::vector<NamedMatcher> matchers = {
      {"script-redirect", match_script_redirect},
      {"meta-refresh", match_meta_refresh},
      {"drive-anchor", match_drive_anchor},
      {"json-download-url", match_json_download_url},
      {"usercontent-data-url", match_usercontent_data_url},
      {"drive-confirm-form", match_drive_confirm_form},
      {"hinted-url", match_hinted_url},
  };
  return matchers;
}

const std::vector<std::string> &direct_audio_hints() {
  static const std::vector<std::string> hints = {
      "download.aspx",       ".files.1drv.com", ".download.",
      ".mp3",                ".wav",            ".flac",
      ".m4a",                "drive.google.com/uc",
      "googleusercontent.com",
  };
  return hints;
}

// **---- Extraction ----**

std::optional<std::string> extract_direct_audio_url(const std::string &html) {
  for (const auto &matcher : html_matchers()) {
    auto candidate = matcher.match(html);
    if (candidate && !candidate->empty()) {
      LOG_DEBUG("Landing page matcher '{}' fired", matcher.name);
      return candidate;
    }
  }
  return std::nullopt;
}

// **---- Text Decoding ----**

std::string html_unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c != '&') {
      out += c;
      ++i;
      continue;
    }

    /// Numeric reference: &#NNN; or &#xHH;
    if (i + 1 < text.size() && text[i + 1] == '#') {
      size_t pos = i + 2;
      bool hex = pos < text.size() && (text[pos] == 'x' || text[pos] == 'X');
      if (hex)
        ++pos;
      size_t digits_begin = pos;
      uint32_t cp = 0;
      while (pos < text.size() &&
             (hex ? std::isxdigit(static_cast<unsigned char>(text[pos]))
                  : std::isdigit(static_cast<unsigned char>(text[pos])))) {
        uint32_t digit;
        char d = text[pos];
        if (d >= '0' && d <= '9')
          digit = static_cast<uint32_t>(d - '0');
        else
          digit = static_cast<uint32_t>(std::tolower(d) - 'a' + 10);
        if (cp <= 0x10FFFF)
          cp = cp * (hex ? 16 : 10) + digit;
        ++pos;
      }
      if (pos > digits_begin) {
        if (pos < text.size() && text[pos] == ';')
          ++pos;
        append_utf8(out, cp);
        i = pos;
        continue;
      }
      out += c;
      ++i;
      continue;
    }

    /// Named reference
    size_t pos = i + 1;
    while (pos < text.size() && pos - i <= 32 &&
           std::isalnum(static_cast<unsigned char>(text[pos])))
      ++pos;
    std::string_view name = text.substr(i + 1, pos - i - 1);
    bool has_semicolon = pos < text.size() && text[pos] == ';';

    bool replaced = false;
    for (const auto &entity : kEntities) {
      std::string_view entity_name(entity.name);
      if (has_semicolon && name == entity_name) {
        append_utf8(out, entity.cp);
        i = pos + 1;
        replaced = true;
        break;
      }
      if (!entity.needs_semicolon &&
          name.substr(0, entity_name.size()) == entity_name) {
        append_utf8(out, entity.cp);
        i += 1 + entity_name.size();
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      out += c;
      ++i;
    }
  }
  return out;
}

std::optional<std::string> unescape_backslashes(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c != '\\') {
      out += c;
      ++i;
      continue;
    }
    if (i + 1 >= text.size())
      return std::nullopt; //< Trailing backslash

    char e = text[i + 1];
    uint32_t cp = 0;
    switch (e) {
    case '\\':
    case '\'':
    case '"':
    case '/':
      out += e;
      i += 2;
      break;
    case 'n':
      out += '\n';
      i += 2;
      break;
    case 'r':
      out += '\r';
      i += 2;
      break;
    case 't':
      out += '\t';
      i += 2;
      break;
    case 'a':
      out += '\a';
      i += 2;
      break;
    case 'b':
      out += '\b';
      i += 2;
      break;
    case 'f':
      out += '\f';
      i += 2;
      break;
    case 'v':
      out += '\v';
      i += 2;
      break;
    case 'x':
      if (!parse_hex(text, i + 2, 2, cp))
        return std::nullopt;
      append_utf8(out, cp);
      i += 4;
      break;
    case 'u':
      if (!parse_hex(text, i + 2, 4, cp))
        return std::nullopt;
      i += 6;
      /// Join UTF-16 surrogate pairs written as two \u escapes
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < text.size() &&
          text[i] == '\\' && text[i + 1] == 'u') {
        uint32_t low = 0;
        if (parse_hex(text, i + 2, 4, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    case 'U':
      if (!parse_hex(text, i + 2, 8, cp) || cp > 0x10FFFF)
        return std::nullopt;
      append_utf8(out, cp);
      i += 10;
      break;
    case 'N':
      return std::nullopt; //< Named unicode escapes are not supported
    default:
      if (e >= '0' && e <= '7') {
        size_t pos = i + 1;
        while (pos < text.size() && pos < i + 4 && text[pos] >= '0' &&
               text[pos] <= '7') {
          cp = cp * 8 + static_cast<uint32_t>(text[pos] - '0');
          ++pos;
        }
        append_utf8(out, cp);
        i = pos;
      } else {
        /// Unknown escape: keep it verbatim
        out += c;
        out += e;
        i += 2;
      }
      break;
    }
  }
  return out;
}

std::string clean_candidate(std::string_view candidate) {
  std::string decoded = html_unescape(candidate);
  if (auto unescaped = unescape_backslashes(decoded))
    return *unescaped;
  return decoded;
}

std::string decode_text_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    uint32_t min_cp = 0;
    if (c < 0x80) {
      out += static_cast<char>(c);
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      min_cp = 0x10000;
    }

    bool valid = len > 0 && i + len <= bytes.size();
    uint32_t cp = 0;
    if (valid) {
      cp = c & (0xFF >> (len + 1));
      for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
        if ((cc & 0xC0) != 0x80) {
          valid = false;
          break;
        }
        cp = (cp << 6) | (cc & 0x3F);
      }
    }
    if (valid && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
      valid = false;

    if (valid) {
      out.append(bytes.data() + i, len);
      i += len;
    } else {
      append_utf8(out, 0xFFFD);
      ++i;
    }
  }
  return out;
}

} // namespace projectm_pod
