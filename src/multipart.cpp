/**
 * @file multipart.cpp
 * @brief HTML form body parsing implementation
 */

#include "projectm_pod/multipart.hpp"

#include <fmt/core.h>

#include "projectm_pod/system.hpp"
#include "projectm_pod/url.hpp"

namespace projectm_pod {

namespace {

/**
 * @brief Split a header value into ;-separated parameters.
 * @details Quoted values may contain ';' and backslash escapes.
 *          Parameter names are lowercased.
 */
std::vector<std::pair<std::string, std::string>>
header_params(std::string_view value) {
  std::vector<std::pair<std::string, std::string>> params;
  size_t i = value.find(';');
  while (i != std::string_view::npos && i < value.size()) {
    ++i; //< Skip ';'
    while (i < value.size() && (value[i] == ' ' || value[i] == '\t'))
      ++i;
    size_t eq = value.find_first_of("=;", i);
    if (eq == std::string_view::npos || value[eq] == ';') {
      i = eq;
      continue;
    }
    std::string name = to_lower(trim(value.substr(i, eq - i)));
    std::string val;
    i = eq + 1;
    if (i < value.size() && value[i] == '"') {
      ++i;
      while (i < value.size() && value[i] != '"') {
        if (value[i] == '\\' && i + 1 < value.size())
          ++i;
        val += value[i++];
      }
      i = value.find(';', i);
    } else {
      size_t end = value.find(';', i);
      val = trim(value.substr(i, end == std::string_view::npos
                                     ? std::string_view::npos
                                     : end - i));
      i = end;
    }
    params.emplace_back(std::move(name), std::move(val));
  }
  return params;
}

std::string media_type(const std::string &content_type) {
  return to_lower(trim(content_type.substr(0, content_type.find(';'))));
}

/// Parse the header block of one part
bool parse_part_headers(std::string_view block, FormPart &part,
                        std::string &error) {
  bool have_disposition = false;
  size_t pos = 0;
  while (pos < block.size()) {
    size_t end = block.find("\r\n", pos);
    if (end == std::string_view::npos)
      end = block.size();
    std::string_view line = block.substr(pos, end - pos);
    pos = end + 2;
    if (line.empty())
      continue;

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      error = "malformed part header";
      return false;
    }
    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string_view value = line.substr(colon + 1);

    if (name == "content-disposition") {
      have_disposition = true;
      for (auto &kv : header_params(value)) {
        if (kv.first == "name") {
          part.name = kv.second;
        } else if (kv.first == "filename") {
          part.filename = kv.second;
          part.is_file = true;
        }
      }
    } else if (name == "content-type") {
      part.content_type = trim(value);
    }
  }
  if (!have_disposition) {
    error = "part without Content-Disposition";
    return false;
  }
  return true;
}

} // anonymous namespace

// **---- FormData ----**

const FormPart *FormData::find(const std::string &name) const {
  for (const auto &part : parts) {
    if (part.name == name)
      return &part;
  }
  return nullptr;
}

std::string FormData::value(const std::string &name) const {
  const FormPart *part = find(name);
  return (part && !part->is_file) ? part->data : std::string();
}

// **---- Parsers ----**

bool multipart_boundary(const std::string &content_type,
                        std::string &boundary) {
  if (media_type(content_type) != "multipart/form-data")
    return false;
  for (auto &kv : header_params(content_type)) {
    if (kv.first == "boundary" && !kv.second.empty()) {
      boundary = kv.second;
      return true;
    }
  }
  return false;
}

bool parse_multipart(std::string_view body, const std::string &boundary,
                     FormData &out, std::string &error) {
  const std::string delimiter = "--" + boundary;
  const std::string separator = "\r\n" + delimiter;

  size_t pos;
  if (body.compare(0, delimiter.size(), delimiter) == 0) {
    pos = delimiter.size();
  } else {
    /// Preamble before the first delimiter
    pos = body.find(separator);
    if (pos == std::string_view::npos) {
      error = "multipart body has no boundary delimiter";
      return false;
    }
    pos += separator.size();
  }

  for (;;) {
    if (body.compare(pos, 2, "--") == 0)
      return true; //< Closing delimiter

    /// Transport padding, then CRLF
    while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t'))
      ++pos;
    if (body.compare(pos, 2, "\r\n") != 0) {
      error = "malformed multipart delimiter line";
      return false;
    }
    pos += 2;

    size_t headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string_view::npos) {
      error = "unterminated part headers";
      return false;
    }

    FormPart part;
    if (!parse_part_headers(body.substr(pos, headers_end - pos), part, error))
      return false;

    size_t data_begin = headers_end + 4;
    size_t data_end = body.find(separator, data_begin);
    if (data_end == std::string_view::npos) {
      error = fmt::format("part '{}' is not terminated", part.name);
      return false;
    }
    part.data.assign(body.data() + data_begin, data_end - data_begin);
    out.parts.push_back(std::move(part));

    pos = data_end + separator.size();
  }
}

void parse_urlencoded(std::string_view body, FormData &out) {
  size_t pos = 0;
  while (pos <= body.size()) {
    size_t end = body.find('&', pos);
    if (end == std::string_view::npos)
      end = body.size();
    std::string_view pair = body.substr(pos, end - pos);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      FormPart part;
      part.name = url_decode(pair.substr(0, eq));
      if (eq != std::string_view::npos)
        part.data = url_decode(pair.substr(eq + 1));
      out.parts.push_back(std::move(part));
    }
    pos = end + 1;
  }
}

bool parse_form(const std::string &content_type, std::string_view body,
                FormData &out, std::string &error) {
  std::string type = media_type(content_type);
  if (type == "multipart/form-data") {
    std::string boundary;
    if (!multipart_boundary(content_type, boundary)) {
      error = "multipart/form-data without a boundary";
      return false;
    }
    return parse_multipart(body, boundary, out, error);
  }
  if (type == "application/x-www-form-urlencoded") {
    parse_urlencoded(body, out);
    return true;
  }
  error = fmt::format("unsupported Content-Type '{}'", content_type);
  return false;
}

} // namespace projectm_pod
