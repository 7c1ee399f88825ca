/**
 * @file uploader.hpp
 * @brief Hand-off of rendered videos to external storage
 */

#ifndef PROJECTM_POD_UPLOADER_HPP
#define PROJECTM_POD_UPLOADER_HPP

#include <filesystem>
#include <string>

#include "http_client.hpp"

namespace projectm_pod {

/**
 * @struct UploadResult
 * @brief Reference to the stored object, or why storing failed.
 */
struct UploadResult {
  bool ok = false;
  std::string reference; //< URL of the stored object
  std::string error;
};

/**
 * @class Uploader
 * @brief Storage collaborator. Failures are recoverable for the job.
 */
class Uploader {
public:
  virtual ~Uploader() = default;

  /**
   * @param file Local file to store
   * @param object_name Name to store it under (unique per job)
   */
  virtual UploadResult upload(const std::filesystem::path &file,
                              const std::string &object_name) = 0;
};

/**
 * @class HttpPutUploader
 * @brief PUTs the file to <endpoint>/<object_name>.
 * @note An empty endpoint makes every upload fail, which sends the job down
 *       the inline base64 path.
 */
class HttpPutUploader : public Uploader {
public:
  HttpPutUploader(HttpClient &client, std::string endpoint);

  UploadResult upload(const std::filesystem::path &file,
                      const std::string &object_name) override;

  /// URL an object is stored under
  std::string object_url(const std::string &object_name) const;

private:
  HttpClient &client_;
  std::string endpoint_;
};

} // namespace projectm_pod

#endif // PROJECTM_POD_UPLOADER_HPP
