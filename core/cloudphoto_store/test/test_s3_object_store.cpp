// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the S3 object store helpers and the in-memory fake that the
 * repository and site tests rely on. None of these talk to a live store.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "in_memory_object_store.hpp"
#include "s3_object_store.hpp"
#include "s3_object_store_test_helpers.hpp"

namespace fs = std::filesystem;

using namespace cloudphoto::store;
using namespace cloudphoto::store::test;

// =============================================================================
// Content type
// =============================================================================

TEST(ContentTypeTest, HtmlPages) {
  EXPECT_EQ(contentTypeForKey("index.html"), "text/html; charset=utf-8");
  EXPECT_EQ(contentTypeForKey("vacation.HTML"), "text/html; charset=utf-8");
}

TEST(ContentTypeTest, Photos) {
  EXPECT_EQ(contentTypeForKey("vacation/sunset.jpg"), "image/jpeg");
  EXPECT_EQ(contentTypeForKey("vacation/beach.JPEG"), "image/jpeg");
}

TEST(ContentTypeTest, UnknownOrMissingExtension) {
  EXPECT_EQ(contentTypeForKey("vacation/README"), "application/octet-stream");
  EXPECT_EQ(contentTypeForKey("v1.2/README"), "application/octet-stream");
  EXPECT_EQ(contentTypeForKey("notes.txt"), "application/octet-stream");
}

// =============================================================================
// Endpoint / error classification
// =============================================================================

TEST(EndpointTest, StripsTrailingSlashes) {
  EXPECT_EQ(normalizeEndpoint("https://storage.yandexcloud.net/"), "https://storage.yandexcloud.net");
  EXPECT_EQ(normalizeEndpoint("http://localhost:9000//"), "http://localhost:9000");
  EXPECT_EQ(normalizeEndpoint(""), "");
}

TEST(ErrorClassificationTest, BucketAlreadyPresent) {
  EXPECT_TRUE(isBucketAlreadyPresentError("BucketAlreadyOwnedByYou"));
  EXPECT_TRUE(isBucketAlreadyPresentError("BucketAlreadyExists"));
  EXPECT_FALSE(isBucketAlreadyPresentError("AccessDenied"));
}

TEST(ErrorClassificationTest, RetryableCodes) {
  EXPECT_TRUE(S3ObjectStore::isRetryableError("SlowDown"));
  EXPECT_TRUE(S3ObjectStore::isRetryableError("NetworkingError"));
  EXPECT_FALSE(S3ObjectStore::isRetryableError("AccessDenied"));
  EXPECT_FALSE(S3ObjectStore::isRetryableError("NoSuchBucket"));
}

TEST(StoreConfigTest, Defaults) {
  StoreConfig config;
  EXPECT_EQ(config.endpoint_url, "https://storage.yandexcloud.net");
  EXPECT_EQ(config.region, "ru-central1");
  EXPECT_EQ(config.executor_thread_count, 1);
  EXPECT_EQ(config.max_sdk_retries, 0);
}

// =============================================================================
// Listing pagination
// =============================================================================

namespace {

ListingPage makePage(
  std::vector<std::string> keys, std::vector<std::string> prefixes, const std::string& next
) {
  ListingPage page;
  page.keys = std::move(keys);
  page.common_prefixes = std::move(prefixes);
  page.is_truncated = !next.empty();
  page.next_token = next;
  return page;
}

}  // namespace

TEST(ListingPaginationTest, FollowsContinuationTokens) {
  std::vector<std::string> tokens_seen;
  auto fetch = [&tokens_seen](const std::string& token) {
    tokens_seen.push_back(token);
    if (token.empty()) {
      return makePage({"a.html"}, {"a/"}, "t1");
    }
    if (token == "t1") {
      return makePage({"b.html"}, {"b/"}, "t2");
    }
    return makePage({"index.html"}, {"c/"}, "");
  };

  size_t pages = 0;
  auto result = collectListing(fetch, pages);

  ASSERT_TRUE(result.status.success);
  EXPECT_EQ(pages, 3u);
  EXPECT_EQ(tokens_seen, (std::vector<std::string>{"", "t1", "t2"}));
  EXPECT_EQ(result.keys, (std::vector<std::string>{"a.html", "b.html", "index.html"}));
  EXPECT_EQ(result.common_prefixes, (std::vector<std::string>{"a/", "b/", "c/"}));
}

TEST(ListingPaginationTest, SinglePage) {
  size_t pages = 0;
  auto result = collectListing(
    [](const std::string&) {
      return makePage({"a/1.jpg"}, {}, "");
    },
    pages
  );

  ASSERT_TRUE(result.status.success);
  EXPECT_EQ(pages, 1u);
  EXPECT_EQ(result.keys.size(), 1u);
}

TEST(ListingPaginationTest, TruncatedWithoutTokenStops) {
  size_t pages = 0;
  auto result = collectListing(
    [](const std::string&) {
      ListingPage page = makePage({"a/1.jpg"}, {}, "");
      page.is_truncated = true;
      return page;
    },
    pages
  );

  ASSERT_TRUE(result.status.success);
  EXPECT_EQ(pages, 1u);
}

TEST(ListingPaginationTest, FailedPageDropsPartialResults) {
  auto fetch = [](const std::string& token) {
    if (token.empty()) {
      return makePage({"a/1.jpg", "a/2.jpg"}, {}, "t1");
    }
    ListingPage failed;
    failed.status = StoreResult::Failure("Access Denied", "AccessDenied");
    return failed;
  };

  size_t pages = 0;
  auto result = collectListing(fetch, pages);

  EXPECT_FALSE(result.status.success);
  EXPECT_EQ(result.status.error_code, "AccessDenied");
  EXPECT_EQ(pages, 2u);
  EXPECT_TRUE(result.keys.empty());
  EXPECT_TRUE(result.common_prefixes.empty());
}

// =============================================================================
// In-memory fake listing semantics
// =============================================================================

TEST(InMemoryObjectStoreTest, DelimiterGroupsCommonPrefixes) {
  InMemoryObjectStore store;
  store.seed("b/2.jpg");
  store.seed("a/1.jpg");
  store.seed("a/2.jpg");
  store.seed("index.html");

  auto listing = store.listObjects("", "/");
  ASSERT_TRUE(listing.status.success);
  EXPECT_EQ(listing.common_prefixes, (std::vector<std::string>{"a/", "b/"}));
  EXPECT_EQ(listing.keys, (std::vector<std::string>{"index.html"}));
}

TEST(InMemoryObjectStoreTest, PrefixWithoutDelimiterIsRecursive) {
  InMemoryObjectStore store;
  store.seed("a/1.jpg");
  store.seed("a/sub/2.jpg");
  store.seed("ab/3.jpg");

  auto listing = store.listObjects("a/", "");
  EXPECT_EQ(listing.keys, (std::vector<std::string>{"a/1.jpg", "a/sub/2.jpg"}));
  EXPECT_TRUE(listing.common_prefixes.empty());
}

TEST(InMemoryObjectStoreTest, PutReadsLocalFileAndOverwrites) {
  fs::path file = fs::temp_directory_path() /
                  ("cloudphoto_store_put_" +
                   std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  {
    std::ofstream out(file);
    out << "first";
  }

  InMemoryObjectStore store;
  ASSERT_TRUE(store.putObject("a/1.jpg", file.string()).success);
  {
    std::ofstream out(file, std::ios::trunc);
    out << "second";
  }
  ASSERT_TRUE(store.putObject("a/1.jpg", file.string()).success);

  EXPECT_EQ(store.objects.size(), 1u);
  EXPECT_EQ(store.objects["a/1.jpg"], "second");
  fs::remove(file);
}

TEST(InMemoryObjectStoreTest, OfflineFailsEveryCall) {
  InMemoryObjectStore store;
  store.offline = true;
  EXPECT_FALSE(store.listObjects("", "/").status.success);
  EXPECT_FALSE(store.deleteObject("a/1.jpg").success);
  EXPECT_FALSE(store.ensureBucketExists().success);
  EXPECT_EQ(store.listObjects("", "/").status.error_code, "NetworkingError");
}
