// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_ALBUM_REPOSITORY_HPP
#define CLOUDPHOTO_ALBUM_REPOSITORY_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace cloudphoto {
namespace album {

/**
 * Album/photo view over a flat object store.
 *
 * Albums are never stored explicitly: an album exists while at least one
 * object lives under "<album>/". The repository does not own the store.
 */
class AlbumRepository {
public:
  /**
   * Outcome kinds of repository operations
   */
  enum class Status {
    Ok,
    StoreUnavailable,      // Transport/auth failure talking to the store
    PathNotFound,          // Local source directory missing
    AlbumNotFound,         // Delete target has no objects
    PartialDeleteFailure,  // Some objects under the prefix could not be removed
    InvalidAlbumName,      // Empty name or name containing '/'
  };

  /**
   * Result of upload and delete
   */
  struct Result {
    Status status;
    size_t object_count;  // Objects uploaded or deleted before the operation ended
    std::string message;

    Result()
        : status(Status::Ok)
        , object_count(0) {}

    bool ok() const {
      return status == Status::Ok;
    }
  };

  struct AlbumList {
    Status status = Status::Ok;
    std::vector<std::string> albums;  // Sorted, duplicate-free
    std::string message;
  };

  struct PhotoList {
    Status status = Status::Ok;
    std::vector<std::string> photos;  // Filenames in store listing order
    std::string message;
  };

  explicit AlbumRepository(store::IObjectStore& store);

  AlbumRepository(const AlbumRepository&) = delete;
  AlbumRepository& operator=(const AlbumRepository&) = delete;

  /**
   * List album names, sorted lexicographically.
   * An empty bucket yields an empty list with Status::Ok.
   */
  AlbumList listAlbums();

  /**
   * List the image files stored directly under an album's prefix.
   * A missing album yields an empty list with Status::Ok.
   */
  PhotoList listPhotos(const std::string& album);

  /**
   * Upload every .jpg/.jpeg regular file directly inside source_dir as
   * "<album>/<filename>". Subdirectories and other files are skipped.
   * Existing objects are overwritten, so re-running is idempotent.
   * The first failed upload aborts the operation.
   */
  Result uploadAlbum(const std::string& album, const std::string& source_dir);

  /**
   * Delete every object under "<album>/".
   * Returns AlbumNotFound without deleting anything when the prefix is empty,
   * PartialDeleteFailure when any delete fails. Removed objects stay removed.
   */
  Result deleteAlbum(const std::string& album);

  store::IObjectStore& store() {
    return store_;
  }

  static const char* statusName(Status status);

private:
  store::IObjectStore& store_;
};

}  // namespace album
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_ALBUM_REPOSITORY_HPP
