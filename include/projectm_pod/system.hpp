/**
 * @file system.hpp
 * @brief System utilities: scoped job directories, file and text helpers
 *
 * @details Provides:
 *
 *          - TempDirectory: exclusively-owned per-job working directory
 *
 *          - Whole-file read/write helpers
 *
 *          - Text helpers for logging (tails, time formatting)
 *
 * @note TempDirectory removes its tree in the destructor, so every exit path
 *       of a job (normal return, early error return, exception) cleans up.
 */

#ifndef PROJECTM_POD_SYSTEM_HPP
#define PROJECTM_POD_SYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace projectm_pod {

// **---- Scoped Working Directory ----**

/**
 * @class TempDirectory
 * @brief RAII wrapper around a mkdtemp() directory.
 * @note Supports move semantics but not copy.
 */
class TempDirectory {
public:
  /**
   * @brief Create a fresh directory under the system temp root.
   * @param prefix Name prefix (e.g. "runpod_projectm_")
   * @note Check valid() after construction; error() explains a failure.
   */
  explicit TempDirectory(const std::string &prefix);
  ~TempDirectory();

  /// Disable copy
  TempDirectory(const TempDirectory &) = delete;
  TempDirectory &operator=(const TempDirectory &) = delete;

  /// Enable move
  TempDirectory(TempDirectory &&other) noexcept;
  TempDirectory &operator=(TempDirectory &&other) noexcept;

  const std::filesystem::path &path() const { return path_; }
  bool valid() const { return !path_.empty(); }
  const std::string &error() const { return error_; }

  /// Remove the tree now (idempotent).
  void remove();

private:
  std::filesystem::path path_;
  std::string error_;
};

// **---- File Helpers ----**

/**
 * @brief Read a whole file into memory.
 * @return true on success, false on failure (error is filled)
 */
bool read_file(const std::filesystem::path &path, std::string &out,
               std::string &error);

/**
 * @brief Write bytes to a file, truncating it.
 * @return true on success, false on failure (error is filled)
 */
bool write_file(const std::filesystem::path &path, std::string_view data,
                std::string &error);

/**
 * @brief Size in MB (1024*1024) rounded to two decimals.
 */
double size_mb(std::uintmax_t bytes);

// **---- Text Utilities ----**

/**
 * @brief Keep the last max_chars characters, prefixed with "..." when cut.
 */
std::string tail_text(const std::string &text, size_t max_chars);

/**
 * @brief Lowercase ASCII copy.
 */
std::string to_lower(std::string_view text);

/**
 * @brief Trim ASCII whitespace from both ends.
 */
std::string trim(std::string_view text);

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace projectm_pod

#endif // PROJECTM_POD_SYSTEM_HPP
