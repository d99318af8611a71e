// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_PAGE_RENDERER_HPP
#define CLOUDPHOTO_PAGE_RENDERER_HPP

#include <string>
#include <vector>

namespace cloudphoto {
namespace site {

/**
 * One photo on an album page
 */
struct PhotoRef {
  std::string name;  // Display name (the filename)
  std::string src;   // Site-relative URL, already percent-encoded
};

/**
 * One entry of the index page
 */
struct AlbumLink {
  std::string name;  // Album name
  std::string url;   // Public URL of the album page
};

// All render functions are pure: same inputs, same markup. Every text input is
// HTML-escaped; URLs are escaped for attribute context only.

std::string renderAlbumPage(const std::string& title, const std::vector<PhotoRef>& photos);

std::string renderIndexPage(const std::string& title, const std::vector<AlbumLink>& albums);

std::string renderErrorPage(const std::string& title);

/**
 * Escape &, <, >, " and ' for HTML text and attribute values
 */
std::string escapeHtml(const std::string& text);

/**
 * Percent-encode everything except RFC 3986 unreserved characters
 */
std::string encodeUrlSegment(const std::string& segment);

/**
 * Site-relative reference to a photo object: "<album>/<filename>", encoded
 */
std::string photoSrc(const std::string& album, const std::string& filename);

/**
 * Public URL of an album page: "<website_url>/<album>.html", encoded
 */
std::string albumPageUrl(const std::string& website_url, const std::string& album);

}  // namespace site
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_PAGE_RENDERER_HPP
