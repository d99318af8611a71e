// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_SITE_CONFIG_HPP
#define CLOUDPHOTO_SITE_CONFIG_HPP

#include <string>

namespace cloudphoto {
namespace site {

/**
 * Static site settings
 */
struct SiteConfig {
  // Website host is "<bucket>.<website_domain>"
  std::string website_domain = "website.yandexcloud.net";
  std::string staging_dir = "/tmp/cloudphoto_site";
  std::string title = "Photo archive";
  bool keep_staging = true;  // Leave downloaded photos and pages after the run
};

}  // namespace site
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_SITE_CONFIG_HPP
