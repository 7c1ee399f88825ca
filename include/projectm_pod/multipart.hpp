/**
 * @file multipart.hpp
 * @brief HTML form body parsing (multipart/form-data, urlencoded)
 */

#ifndef PROJECTM_POD_MULTIPART_HPP
#define PROJECTM_POD_MULTIPART_HPP

#include <string>
#include <string_view>
#include <vector>

namespace projectm_pod {

/**
 * @struct FormPart
 * @brief One form field or uploaded file.
 */
struct FormPart {
  std::string name;
  std::string filename; //< Set for file parts
  std::string content_type;
  std::string data;
  bool is_file = false;
};

/**
 * @struct FormData
 * @brief Parsed form, parts in body order.
 */
struct FormData {
  std::vector<FormPart> parts;

  /// First part with this name, or nullptr
  const FormPart *find(const std::string &name) const;

  /// Text value of a non-file field ("" when absent)
  std::string value(const std::string &name) const;
};

/**
 * @brief Extract the boundary parameter of a multipart Content-Type.
 */
bool multipart_boundary(const std::string &content_type,
                        std::string &boundary);

/**
 * @brief Parse a multipart/form-data body.
 * @return false on malformed framing (error is filled)
 */
bool parse_multipart(std::string_view body, const std::string &boundary,
                     FormData &out, std::string &error);

/**
 * @brief Parse an application/x-www-form-urlencoded body.
 */
void parse_urlencoded(std::string_view body, FormData &out);

/**
 * @brief Dispatch on Content-Type to one of the parsers above.
 * @return false for malformed bodies and unsupported content types
 */
bool parse_form(const std::string &content_type, std::string_view body,
                FormData &out, std::string &error);

} // namespace projectm_pod

#endif // PROJECTM_POD_MULTIPART_HPP
