/**
 * @file url.cpp
 * @brief URL parsing and storage-link normalization implementation
 */

#include "projectm_pod/url.hpp"

#include <cctype>
#include <cstdlib>

#include "projectm_pod/system.hpp"

namespace projectm_pod {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

/// Split "a/b/c" into non-empty segments
std::vector<std::string> path_segments(const std::string &path) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find('/', pos);
    if (end == std::string::npos)
      end = path.size();
    if (end > pos)
      parts.push_back(path.substr(pos, end - pos));
    pos = end + 1;
  }
  return parts;
}

const std::string *find_param(const QueryParams &params,
                              const std::string &name) {
  for (const auto &kv : params) {
    if (kv.first == name)
      return &kv.second;
  }
  return nullptr;
}

} // anonymous namespace

// **---- Url ----**

std::string Url::netloc() const {
  std::string out;
  if (!userinfo.empty())
    out += userinfo + "@";
  if (host.find(':') != std::string::npos)
    out += "[" + host + "]";
  else
    out += host;
  if (!port.empty())
    out += ":" + port;
  return out;
}

std::string Url::str() const {
  std::string out = scheme + "://" + netloc() + path;
  if (!query.empty())
    out += "?" + query;
  if (!fragment.empty())
    out += "#" + fragment;
  return out;
}

std::string Url::target() const {
  std::string out = path.empty() ? "/" : path;
  if (!query.empty())
    out += "?" + query;
  return out;
}

unsigned short Url::effective_port() const {
  if (!port.empty())
    return static_cast<unsigned short>(std::atoi(port.c_str()));
  return scheme == "https" ? 443 : 80;
}

bool parse_url(const std::string &text, Url &out) {
  size_t scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0)
    return false;

  std::string scheme = to_lower(std::string_view(text).substr(0, scheme_end));
  for (char c : scheme) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '.')
      return false;
  }

  Url url;
  url.scheme = scheme;

  size_t auth_begin = scheme_end + 3;
  size_t auth_end = text.find_first_of("/?#", auth_begin);
  if (auth_end == std::string::npos)
    auth_end = text.size();
  std::string authority = text.substr(auth_begin, auth_end - auth_begin);

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    url.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  }

  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos)
      return false;
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        return false;
      url.port = authority.substr(close + 2);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      url.host = authority.substr(0, colon);
      url.port = authority.substr(colon + 1);
    } else {
      url.host = authority;
    }
  }

  for (char c : url.port) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  if (!url.port.empty() && std::atol(url.port.c_str()) > 65535)
    return false;

  std::string rest = text.substr(auth_end);
  size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    url.fragment = rest.substr(hash + 1);
    rest.erase(hash);
  }
  size_t question = rest.find('?');
  if (question != std::string::npos) {
    url.query = rest.substr(question + 1);
    rest.erase(question);
  }
  url.path = rest;

  out = std::move(url);
  return true;
}

// **---- Query Helpers ----**

std::string url_encode(std::string_view text) {
  static const char *digits = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (unsigned char c : text) {
    if (is_unreserved(c)) {
      out += static_cast<char>(c);
    } else if (c == ' ') {
      out += '+';
    } else {
      out += '%';
      out += digits[c >> 4];
      out += digits[c & 0x0F];
    }
  }
  return out;
}

std::string url_decode(std::string_view text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out += ' ';
      continue;
    }
    out += c;
  }
  return out;
}

QueryParams parse_query(std::string_view query) {
  QueryParams params;
  size_t pos = 0;
  while (pos <= query.size()) {
    size_t end = query.find('&', pos);
    if (end == std::string_view::npos)
      end = query.size();
    std::string_view pair = query.substr(pos, end - pos);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      std::string name = url_decode(pair.substr(0, eq));
      std::string value =
          eq == std::string_view::npos ? "" : url_decode(pair.substr(eq + 1));
      set_query_param(params, name, value);
    }
    pos = end + 1;
  }
  return params;
}

void set_query_param(QueryParams &params, const std::string &name,
                     const std::string &value) {
  for (auto &kv : params) {
    if (kv.first == name) {
      kv.second = value;
      return;
    }
  }
  params.emplace_back(name, value);
}

std::string encode_query(const QueryParams &params) {
  std::string out;
  for (const auto &kv : params) {
    if (!out.empty())
      out += '&';
    out += url_encode(kv.first);
    out += '=';
    out += url_encode(kv.second);
  }
  return out;
}

std::string resolve_url(const Url &base, const std::string &reference) {
  if (reference.find("://") != std::string::npos) {
    Url absolute;
    if (parse_url(reference, absolute))
      return reference;
  }
  if (reference.rfind("//", 0) == 0)
    return base.scheme + ":" + reference;

  std::string origin = base.scheme + "://" + base.netloc();
  if (!reference.empty() && reference.front() == '/')
    return origin + reference;
  if (!reference.empty() && reference.front() == '?')
    return origin + (base.path.empty() ? "/" : base.path) + reference;

  std::string dir = base.path;
  size_t slash = dir.rfind('/');
  dir = (slash == std::string::npos) ? "/" : dir.substr(0, slash + 1);
  return origin + dir + reference;
}

// **---- Storage Link Normalization ----**

std::string normalize_storage_url(const std::string &url) {
  Url parsed;
  if (!parse_url(url, parsed))
    return url;

  std::string host = to_lower(parsed.netloc());

  if (host.find("dropbox.com") != std::string::npos) {
    QueryParams query = parse_query(parsed.query);
    set_query_param(query, "dl", "1");
    parsed.userinfo.clear();
    parsed.host = "www.dropbox.com";
    parsed.port.clear();
    parsed.query = encode_query(query);
    return parsed.str();
  }

  if (host.find("onedrive") != std::string::npos ||
      host.find("1drv.ms") != std::string::npos ||
      host.find("sharepoint.com") != std::string::npos) {
    QueryParams query = parse_query(parsed.query);
    set_query_param(query, "download", "1");
    parsed.query = encode_query(query);
    return parsed.str();
  }

  if (host.find("drive.google.com") != std::string::npos ||
      host.find("docs.google.com") != std::string::npos) {
    std::string file_id;
    auto parts = path_segments(parsed.path);
    QueryParams query = parse_query(parsed.query);
    if (parts.size() >= 3 && parts[0] == "file" && parts[1] == "d") {
      file_id = parts[2];
    } else if (const std::string *id = find_param(query, "id")) {
      file_id = *id;
    }
    if (file_id.empty())
      return url;

    parsed.scheme = "https";
    parsed.userinfo.clear();
    parsed.host = "drive.google.com";
    parsed.port.clear();
    parsed.path = "/uc";
    parsed.query = encode_query({{"export", "download"}, {"id", file_id}});
    return parsed.str();
  }

  return url;
}

} // namespace projectm_pod
