// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "album_keys.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace cloudphoto {
namespace album {

std::vector<std::string> deriveAlbums(const std::vector<std::string>& keyspace) {
  std::set<std::string> albums;
  for (const auto& entry : keyspace) {
    auto pos = entry.find(KEY_DELIMITER);
    if (pos == std::string::npos || pos == 0) {
      continue;
    }
    albums.insert(entry.substr(0, pos));
  }
  return std::vector<std::string>(albums.begin(), albums.end());
}

bool isImageFile(const std::string& filename) {
  auto dot = filename.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return false;
  }

  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return ext == "jpg" || ext == "jpeg";
}

bool isValidAlbumName(const std::string& album) {
  return !album.empty() && album.find(KEY_DELIMITER) == std::string::npos;
}

bool isReservedAlbumName(const std::string& album) {
  std::string page = albumPageKey(album);
  return page == INDEX_DOCUMENT || page == ERROR_DOCUMENT;
}

std::string albumPrefix(const std::string& album) {
  return album + KEY_DELIMITER;
}

std::string photoKey(const std::string& album, const std::string& filename) {
  return albumPrefix(album) + filename;
}

std::string albumPageKey(const std::string& album) {
  return album + ".html";
}

std::string photoFilename(const std::string& key) {
  auto pos = key.find_last_of(KEY_DELIMITER);
  if (pos == std::string::npos) {
    return key;
  }
  return key.substr(pos + 1);
}

}  // namespace album
}  // namespace cloudphoto
