// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "album_repository.hpp"

#include <algorithm>
#include <filesystem>

#include "album_keys.hpp"

#define CLOUDPHOTO_LOG_COMPONENT "album_repository"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace album {

namespace fs = std::filesystem;

using ::cloudphoto::logging::kv;

AlbumRepository::AlbumRepository(store::IObjectStore& store)
    : store_(store) {}

AlbumRepository::AlbumList AlbumRepository::listAlbums() {
  AlbumList result;

  auto listing = store_.listObjects("", std::string(1, KEY_DELIMITER));
  if (!listing.status.success) {
    result.status = Status::StoreUnavailable;
    result.message = listing.status.error_message;
    CLOUDPHOTO_LOG_ERROR("Album listing failed" << kv("error", result.message));
    return result;
  }

  result.albums = deriveAlbums(listing.common_prefixes);
  CLOUDPHOTO_LOG_DEBUG("Listed albums" << kv("count", result.albums.size()));
  return result;
}

AlbumRepository::PhotoList AlbumRepository::listPhotos(const std::string& album) {
  PhotoList result;
  if (!isValidAlbumName(album)) {
    result.status = Status::InvalidAlbumName;
    result.message = "Invalid album name: '" + album + "'";
    return result;
  }

  auto listing = store_.listObjects(albumPrefix(album), std::string(1, KEY_DELIMITER));
  if (!listing.status.success) {
    result.status = Status::StoreUnavailable;
    result.message = listing.status.error_message;
    CLOUDPHOTO_LOG_ERROR(
      "Photo listing failed" << kv("album", album) << kv("error", result.message)
    );
    return result;
  }

  for (const auto& key : listing.keys) {
    std::string filename = photoFilename(key);
    if (isImageFile(filename)) {
      result.photos.push_back(filename);
    }
  }
  return result;
}

AlbumRepository::Result AlbumRepository::uploadAlbum(
  const std::string& album, const std::string& source_dir
) {
  Result result;
  if (!isValidAlbumName(album)) {
    result.status = Status::InvalidAlbumName;
    result.message = "Invalid album name: '" + album + "'";
    return result;
  }
  if (isReservedAlbumName(album)) {
    result.status = Status::InvalidAlbumName;
    result.message = "Album name '" + album + "' is reserved for the site " + albumPageKey(album);
    return result;
  }

  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    result.status = Status::PathNotFound;
    result.message = "Photo album path not found: " + source_dir;
    CLOUDPHOTO_LOG_WARN(result.message);
    return result;
  }

  std::vector<fs::path> photos;
  fs::directory_iterator it(source_dir, ec);
  if (ec) {
    result.status = Status::PathNotFound;
    result.message = "Cannot read photo album path " + source_dir + ": " + ec.message();
    CLOUDPHOTO_LOG_WARN(result.message);
    return result;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    if (isImageFile(it->path().filename().string())) {
      photos.push_back(it->path());
    }
  }
  if (ec) {
    result.status = Status::PathNotFound;
    result.message = "Failed to scan photo album path " + source_dir + ": " + ec.message();
    CLOUDPHOTO_LOG_WARN(result.message);
    return result;
  }
  std::sort(photos.begin(), photos.end());

  auto bucket_status = store_.ensureBucketExists();
  if (!bucket_status.success) {
    result.status = Status::StoreUnavailable;
    result.message = "Bucket " + store_.bucket() + " unavailable: " + bucket_status.error_message;
    return result;
  }

  for (const auto& photo : photos) {
    std::string key = photoKey(album, photo.filename().string());
    auto put = store_.putObject(key, photo.string());
    if (!put.success) {
      result.status = Status::StoreUnavailable;
      result.message = "Failed to upload " + key + ": " + put.error_message;
      CLOUDPHOTO_LOG_ERROR(
        "Album upload aborted" << kv("key", key) << kv("uploaded", result.object_count)
      );
      return result;
    }
    ++result.object_count;
    CLOUDPHOTO_LOG_INFO("Uploaded photo" << kv("key", key));
  }

  if (photos.empty()) {
    CLOUDPHOTO_LOG_WARN("No photos found" << kv("path", source_dir));
  }
  CLOUDPHOTO_LOG_INFO(
    "Album uploaded" << kv("album", album) << kv("photos", result.object_count)
  );
  return result;
}

AlbumRepository::Result AlbumRepository::deleteAlbum(const std::string& album) {
  Result result;
  if (!isValidAlbumName(album)) {
    result.status = Status::InvalidAlbumName;
    result.message = "Invalid album name: '" + album + "'";
    return result;
  }

  // No delimiter: nested keys under the prefix belong to the album too
  auto listing = store_.listObjects(albumPrefix(album), "");
  if (!listing.status.success) {
    result.status = Status::StoreUnavailable;
    result.message = listing.status.error_message;
    CLOUDPHOTO_LOG_ERROR("Album listing failed" << kv("album", album) << kv("error", result.message));
    return result;
  }

  if (listing.keys.empty()) {
    result.status = Status::AlbumNotFound;
    result.message = "Photo album not found: " + album;
    return result;
  }

  size_t failed = 0;
  std::string first_error;
  for (const auto& key : listing.keys) {
    auto deleted = store_.deleteObject(key);
    if (deleted.success) {
      ++result.object_count;
    } else {
      if (failed == 0) {
        first_error = key + ": " + deleted.error_message;
      }
      ++failed;
    }
  }

  if (failed > 0) {
    result.status = Status::PartialDeleteFailure;
    result.message = "Deleted " + std::to_string(result.object_count) + " of " +
                     std::to_string(listing.keys.size()) + " objects of album " + album +
                     " (first failure: " + first_error + ")";
    CLOUDPHOTO_LOG_ERROR(
      "Album delete incomplete" << kv("album", album) << kv("deleted", result.object_count)
                                << kv("failed", failed)
    );
    return result;
  }

  result.message = "Photo album deleted: " + album;
  CLOUDPHOTO_LOG_INFO("Album deleted" << kv("album", album) << kv("objects", result.object_count));
  return result;
}

const char* AlbumRepository::statusName(Status status) {
  switch (status) {
    case Status::Ok:
      return "Ok";
    case Status::StoreUnavailable:
      return "StoreUnavailable";
    case Status::PathNotFound:
      return "PathNotFound";
    case Status::AlbumNotFound:
      return "AlbumNotFound";
    case Status::PartialDeleteFailure:
      return "PartialDeleteFailure";
    case Status::InvalidAlbumName:
      return "InvalidAlbumName";
  }
  return "Unknown";
}

}  // namespace album
}  // namespace cloudphoto
