// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_SITE_GENERATOR_HPP
#define CLOUDPHOTO_SITE_GENERATOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "album_repository.hpp"
#include "object_store.hpp"
#include "site_config.hpp"
#include "staging_area.hpp"

namespace cloudphoto {
namespace site {

/**
 * Regenerates the whole static site from the current bucket contents.
 *
 * A run goes through: enumerate albums, then for each album download its
 * photos, render and upload "<album>.html", then render and upload
 * "index.html" and "error.html". The first failure ends the run; pages
 * uploaded before it stay in the bucket.
 */
class SiteGenerator {
public:
  enum class Status {
    Ok,
    StoreUnavailable,  // Listing, download or upload failed
    RenderFailure,     // Page could not be rendered or written to staging
  };

  struct GenerateResult {
    Status status = Status::Ok;
    std::vector<std::string> uploaded_pages;  // Keys in upload order
    size_t album_count = 0;
    size_t photo_count = 0;
    std::string message;

    bool ok() const {
      return status == Status::Ok;
    }
  };

  /**
   * @param website_url Public site URL used for index links
   */
  SiteGenerator(
    store::IObjectStore& store, album::AlbumRepository& repository, StagingArea& staging,
    const SiteConfig& config, const std::string& website_url
  );

  SiteGenerator(const SiteGenerator&) = delete;
  SiteGenerator& operator=(const SiteGenerator&) = delete;

  GenerateResult generate();

  static const char* statusName(Status status);

private:
  bool generateAlbumPage(const std::string& album, GenerateResult& result);
  bool publishPage(const std::string& key, const std::string& markup, GenerateResult& result);

  store::IObjectStore& store_;
  album::AlbumRepository& repository_;
  StagingArea& staging_;
  SiteConfig config_;
  std::string website_url_;
};

}  // namespace site
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_SITE_GENERATOR_HPP
