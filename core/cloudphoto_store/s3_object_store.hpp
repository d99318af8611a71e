// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_S3_OBJECT_STORE_HPP
#define CLOUDPHOTO_S3_OBJECT_STORE_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "object_store.hpp"

namespace cloudphoto {
namespace store {

/**
 * S3 connection settings
 */
struct StoreConfig {
  std::string endpoint_url = "https://storage.yandexcloud.net";
  std::string bucket;
  std::string region = "ru-central1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // Transfers run one at a time; the TransferManager still splits large
  // files into multipart uploads of this size.
  uint64_t part_size = 8 * 1024 * 1024;
  int executor_thread_count = 1;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 60000;

  // Failures are surfaced to the operator, never retried by default
  int max_sdk_retries = 0;
};

/**
 * IObjectStore backed by the AWS SDK for C++.
 *
 * Works with AWS S3 and S3-compatible storage (Yandex Object Storage, MinIO).
 * Custom endpoints use path-style addressing. Files are uploaded through the
 * SDK TransferManager; listings follow ListObjectsV2 continuation tokens.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const StoreConfig& config);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  ListObjectsResult listObjects(const std::string& prefix, const std::string& delimiter) override;
  StoreResult putObject(const std::string& key, const std::string& local_path) override;
  StoreResult getObject(const std::string& key, const std::string& local_path) override;
  StoreResult deleteObject(const std::string& key) override;
  StoreResult ensureBucketExists() override;
  StoreResult configureStaticWebsite(
    const std::string& index_document, const std::string& error_document
  ) override;

  const std::string& bucket() const override;

  /**
   * Check if an error code is transient
   */
  static bool isRetryableError(const std::string& error_code);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace store
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_S3_OBJECT_STORE_HPP
