// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "publisher.hpp"

#include "album_keys.hpp"

#define CLOUDPHOTO_LOG_COMPONENT "publisher"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace site {

using ::cloudphoto::logging::kv;

std::string websiteUrl(const std::string& bucket, const std::string& website_domain) {
  return "https://" + bucket + "." + website_domain;
}

Publisher::Publisher(store::IObjectStore& store, const std::string& website_domain)
    : store_(store)
    , website_domain_(website_domain) {}

Publisher::PublishResult Publisher::publish() {
  PublishResult result;

  auto configured = store_.configureStaticWebsite(album::INDEX_DOCUMENT, album::ERROR_DOCUMENT);
  if (!configured.success) {
    result.status = Status::StoreUnavailable;
    result.message = "Failed to configure website for bucket " + store_.bucket() + ": " +
                     configured.error_message;
    return result;
  }

  result.url = url();
  CLOUDPHOTO_LOG_INFO("Site published" << kv("url", result.url));
  return result;
}

std::string Publisher::url() const {
  return websiteUrl(store_.bucket(), website_domain_);
}

}  // namespace site
}  // namespace cloudphoto
