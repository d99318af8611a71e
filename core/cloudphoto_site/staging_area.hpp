// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_STAGING_AREA_HPP
#define CLOUDPHOTO_STAGING_AREA_HPP

#include <stdexcept>
#include <string>

namespace cloudphoto {
namespace site {

/**
 * Raised when the staging directory cannot be created or written
 */
class StagingError : public std::runtime_error {
public:
  explicit StagingError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Local working directory for one site generation run.
 *
 * The directory has a fixed path and is created on construction if absent.
 * Content left by an earlier run is overwritten, never read. When
 * remove_on_exit is set the directory is removed on destruction.
 *
 * Layout:
 *   <root>/photos/<album>/<filename>   downloaded photos
 *   <root>/pages/<name>                rendered HTML
 */
class StagingArea {
public:
  /**
   * @throws StagingError if the directory cannot be created
   */
  explicit StagingArea(const std::string& root, bool remove_on_exit = false);
  ~StagingArea();

  StagingArea(const StagingArea&) = delete;
  StagingArea& operator=(const StagingArea&) = delete;

  /**
   * Download sink for one photo. Creates the album subdirectory.
   * @throws StagingError if the subdirectory cannot be created
   */
  std::string photoPath(const std::string& album, const std::string& filename);

  /**
   * Write rendered markup and return the file path.
   * @throws StagingError on any write failure
   */
  std::string writePage(const std::string& name, const std::string& markup);

  /**
   * Remove the whole staging directory. Safe to call more than once.
   * @return false if removal failed
   */
  bool clear();

  const std::string& root() const {
    return root_;
  }

private:
  std::string root_;
  bool remove_on_exit_;
};

}  // namespace site
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_STAGING_AREA_HPP
