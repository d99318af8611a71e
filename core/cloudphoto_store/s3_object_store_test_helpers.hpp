// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_S3_OBJECT_STORE_TEST_HELPERS_HPP
#define CLOUDPHOTO_S3_OBJECT_STORE_TEST_HELPERS_HPP

// This header is for testing only - exposes internal helpers of
// s3_object_store.cpp that do not need a live store

#include <cstddef>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace cloudphoto {
namespace store {

/**
 * Content type sent with an upload, chosen from the key's extension
 */
std::string contentTypeForKey(const std::string& key);

/**
 * Strip a trailing '/' from an endpoint URL
 */
std::string normalizeEndpoint(const std::string& endpoint_url);

/**
 * Whether a CreateBucket error code means the bucket is already usable
 */
bool isBucketAlreadyPresentError(const std::string& error_code);

/**
 * One response of a paginated ListObjectsV2 call
 */
struct ListingPage {
  StoreResult status = StoreResult::Success();
  std::vector<std::string> keys;
  std::vector<std::string> common_prefixes;
  bool is_truncated = false;
  std::string next_token;
};

/**
 * Drain a paginated listing.
 *
 * fetch(token) returns the page starting at token; the first call gets an
 * empty token. Stops after a page that is not truncated or carries no
 * continuation token. A failed page discards everything collected so far.
 *
 * @param page_count Number of pages fetched, including a failed one
 */
template<typename FetchPage>
ListObjectsResult collectListing(FetchPage fetch, size_t& page_count) {
  ListObjectsResult result{StoreResult::Success(), {}, {}};
  page_count = 0;

  std::string token;
  while (true) {
    ListingPage page = fetch(token);
    ++page_count;
    if (!page.status.success) {
      return {page.status, {}, {}};
    }

    result.keys.insert(result.keys.end(), page.keys.begin(), page.keys.end());
    result.common_prefixes.insert(
      result.common_prefixes.end(), page.common_prefixes.begin(), page.common_prefixes.end()
    );

    if (!page.is_truncated || page.next_token.empty()) {
      return result;
    }
    token = page.next_token;
  }
}

}  // namespace store
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_S3_OBJECT_STORE_TEST_HELPERS_HPP
