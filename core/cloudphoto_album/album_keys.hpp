// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_ALBUM_KEYS_HPP
#define CLOUDPHOTO_ALBUM_KEYS_HPP

#include <string>
#include <vector>

namespace cloudphoto {
namespace album {

// Object key layout shared with the store:
//   "<album>/<filename>"  photo
//   "<album>.html"        rendered album page
//   "index.html"          site index
//   "error.html"          site error page
constexpr char KEY_DELIMITER = '/';
constexpr const char* INDEX_DOCUMENT = "index.html";
constexpr const char* ERROR_DOCUMENT = "error.html";

/**
 * Derive the sorted, duplicate-free album names from a key listing.
 *
 * Accepts both full keys ("a/1.jpg") and common prefixes ("a/"); the album is
 * the first path segment. Entries without a delimiter (top-level pages such as
 * "index.html") and entries with an empty first segment contribute nothing.
 */
std::vector<std::string> deriveAlbums(const std::vector<std::string>& keyspace);

/**
 * True for filenames with a .jpg or .jpeg extension (case-insensitive)
 */
bool isImageFile(const std::string& filename);

/**
 * Album names are used verbatim as key prefixes, so they must be non-empty
 * and free of the key delimiter.
 */
bool isValidAlbumName(const std::string& album);

/**
 * True when the album's page key would overwrite the site index or error page
 */
bool isReservedAlbumName(const std::string& album);

std::string albumPrefix(const std::string& album);

std::string photoKey(const std::string& album, const std::string& filename);

std::string albumPageKey(const std::string& album);

/**
 * Filename part of a photo key ("a/1.jpg" -> "1.jpg")
 */
std::string photoFilename(const std::string& key);

}  // namespace album
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_ALBUM_KEYS_HPP
