// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "site_generator.hpp"

#include "album_keys.hpp"
#include "page_renderer.hpp"

#define CLOUDPHOTO_LOG_COMPONENT "site_generator"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace site {

using ::cloudphoto::logging::kv;

SiteGenerator::SiteGenerator(
  store::IObjectStore& store, album::AlbumRepository& repository, StagingArea& staging,
  const SiteConfig& config, const std::string& website_url
)
    : store_(store)
    , repository_(repository)
    , staging_(staging)
    , config_(config)
    , website_url_(website_url) {}

SiteGenerator::GenerateResult SiteGenerator::generate() {
  GenerateResult result;

  auto albums = repository_.listAlbums();
  if (albums.status != album::AlbumRepository::Status::Ok) {
    result.status = Status::StoreUnavailable;
    result.message = "Failed to list albums: " + albums.message;
    return result;
  }
  for (const auto& name : albums.albums) {
    if (album::isReservedAlbumName(name)) {
      result.status = Status::RenderFailure;
      result.message = "Album '" + name + "' collides with site page " + album::albumPageKey(name);
      CLOUDPHOTO_LOG_ERROR(result.message);
      return result;
    }
  }
  CLOUDPHOTO_LOG_INFO("Generating site" << kv("albums", albums.albums.size()));

  for (const auto& name : albums.albums) {
    if (!generateAlbumPage(name, result)) {
      return result;
    }
    ++result.album_count;
  }

  std::vector<AlbumLink> links;
  links.reserve(albums.albums.size());
  for (const auto& name : albums.albums) {
    links.push_back({name, albumPageUrl(website_url_, name)});
  }

  if (!publishPage(album::INDEX_DOCUMENT, renderIndexPage(config_.title, links), result)) {
    return result;
  }
  if (!publishPage(album::ERROR_DOCUMENT, renderErrorPage(config_.title), result)) {
    return result;
  }

  CLOUDPHOTO_LOG_INFO(
    "Site generated" << kv("albums", result.album_count) << kv("photos", result.photo_count)
                     << kv("pages", result.uploaded_pages.size())
  );
  return result;
}

bool SiteGenerator::generateAlbumPage(const std::string& name, GenerateResult& result) {
  CLOUDPHOTO_LOG_SCOPED_CONTEXT("mksite", name);

  auto photos = repository_.listPhotos(name);
  if (photos.status != album::AlbumRepository::Status::Ok) {
    result.status = Status::StoreUnavailable;
    result.message = "Failed to list photos of album " + name + ": " + photos.message;
    return false;
  }

  std::vector<PhotoRef> refs;
  refs.reserve(photos.photos.size());
  for (const auto& filename : photos.photos) {
    std::string key = album::photoKey(name, filename);
    std::string local_path;
    try {
      local_path = staging_.photoPath(name, filename);
    } catch (const StagingError& e) {
      result.status = Status::RenderFailure;
      result.message = e.what();
      return false;
    }

    auto downloaded = store_.getObject(key, local_path);
    if (!downloaded.success) {
      result.status = Status::StoreUnavailable;
      result.message = "Failed to download " + key + ": " + downloaded.error_message;
      return false;
    }
    refs.push_back({filename, photoSrc(name, filename)});
    ++result.photo_count;
  }

  if (refs.empty()) {
    CLOUDPHOTO_LOG_WARN("Album has no photos, rendering empty page" << kv("album", name));
  }

  return publishPage(album::albumPageKey(name), renderAlbumPage(name, refs), result);
}

bool SiteGenerator::publishPage(
  const std::string& key, const std::string& markup, GenerateResult& result
) {
  std::string local_path;
  try {
    local_path = staging_.writePage(key, markup);
  } catch (const StagingError& e) {
    result.status = Status::RenderFailure;
    result.message = "Failed to render " + key + ": " + e.what();
    CLOUDPHOTO_LOG_ERROR("Render failed" << kv("page", key) << kv("error", e.what()));
    return false;
  }

  auto uploaded = store_.putObject(key, local_path);
  if (!uploaded.success) {
    result.status = Status::StoreUnavailable;
    result.message = "Failed to upload " + key + ": " + uploaded.error_message;
    return false;
  }

  result.uploaded_pages.push_back(key);
  CLOUDPHOTO_LOG_DEBUG("Page uploaded" << kv("key", key));
  return true;
}

const char* SiteGenerator::statusName(Status status) {
  switch (status) {
    case Status::Ok:
      return "Ok";
    case Status::StoreUnavailable:
      return "StoreUnavailable";
    case Status::RenderFailure:
      return "RenderFailure";
  }
  return "Unknown";
}

}  // namespace site
}  // namespace cloudphoto
