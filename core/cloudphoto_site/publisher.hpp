// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_PUBLISHER_HPP
#define CLOUDPHOTO_PUBLISHER_HPP

#include <string>

#include "object_store.hpp"

namespace cloudphoto {
namespace site {

/**
 * Public website URL of a bucket: "https://<bucket>.<website_domain>"
 */
std::string websiteUrl(const std::string& bucket, const std::string& website_domain);

/**
 * Turns the bucket into a static website serving index.html.
 * Repeated publishing only reapplies the same configuration.
 */
class Publisher {
public:
  enum class Status { Ok, StoreUnavailable };

  struct PublishResult {
    Status status = Status::Ok;
    std::string url;  // Set on success
    std::string message;
  };

  Publisher(store::IObjectStore& store, const std::string& website_domain);

  PublishResult publish();

  std::string url() const;

private:
  store::IObjectStore& store_;
  std::string website_domain_;
};

}  // namespace site
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_PUBLISHER_HPP
