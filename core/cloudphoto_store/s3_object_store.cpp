// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/ErrorDocument.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/IndexDocument.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutBucketWebsiteRequest.h>
#include <aws/s3/model/WebsiteConfiguration.h>
#include <aws/transfer/TransferHandle.h>
#include <aws/transfer/TransferManager.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <set>

#include "s3_object_store_test_helpers.hpp"

#define CLOUDPHOTO_LOG_COMPONENT "s3_store"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace store {

using ::cloudphoto::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI must bracket every SDK object in the process.
// A reference-counted singleton ties that lifetime to live S3ObjectStores.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

std::string contentTypeForKey(const std::string& key) {
  auto dot = key.find_last_of('.');
  auto slash = key.find_last_of('/');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return "application/octet-stream";
  }

  std::string ext = key.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  if (ext == "html" || ext == "htm") {
    return "text/html; charset=utf-8";
  } else if (ext == "jpg" || ext == "jpeg") {
    return "image/jpeg";
  } else if (ext == "css") {
    return "text/css";
  } else if (ext == "json") {
    return "application/json";
  }
  return "application/octet-stream";
}

std::string normalizeEndpoint(const std::string& endpoint_url) {
  std::string endpoint = endpoint_url;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

bool isBucketAlreadyPresentError(const std::string& error_code) {
  return error_code == "BucketAlreadyOwnedByYou" || error_code == "BucketAlreadyExists";
}

namespace {

template<typename ErrorT>
StoreResult failureFrom(const ErrorT& error, const std::string& operation) {
  std::string code = error.GetExceptionName();
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = operation + " failed (HTTP " +
              std::to_string(static_cast<int>(error.GetResponseCode())) + ")";
  }
  bool retryable = S3ObjectStore::isRetryableError(code) || error.ShouldRetry();
  return StoreResult::Failure(message, code, retryable);
}

StoreResult failureFromTransfer(
  const std::shared_ptr<Aws::Transfer::TransferHandle>& handle, const std::string& operation
) {
  auto error = handle->GetLastError();
  std::string code = error.GetExceptionName();
  if (code.empty()) {
    switch (handle->GetStatus()) {
      case Aws::Transfer::TransferStatus::CANCELED:
        code = "TransferCanceled";
        break;
      case Aws::Transfer::TransferStatus::ABORTED:
        code = "TransferAborted";
        break;
      default:
        code = "TransferFailed";
        break;
    }
  }
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = operation + " failed with transfer status " +
              std::to_string(static_cast<int>(handle->GetStatus()));
  }
  return StoreResult::Failure(
    message, code, S3ObjectStore::isRetryableError(code) || error.ShouldRetry()
  );
}

}  // namespace

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  StoreConfig config;
  std::shared_ptr<Aws::S3::S3Client> client;
  std::shared_ptr<Aws::Utils::Threading::PooledThreadExecutor> executor;
  std::shared_ptr<Aws::Transfer::TransferManager> transfer_manager;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must go before release(), which may call Aws::ShutdownAPI()
    transfer_manager.reset();
    client.reset();
    executor.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    std::string endpoint = normalizeEndpoint(config.endpoint_url);
    if (!endpoint.empty()) {
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "CloudphotoRetryStrategy", config.max_sdk_retries
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Virtual-hosted addressing for AWS itself, path style for custom endpoints
    bool use_virtual_addressing = endpoint.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );

    executor = Aws::MakeShared<Aws::Utils::Threading::PooledThreadExecutor>(
      "CloudphotoExecutor", std::max(1, config.executor_thread_count)
    );

    Aws::Transfer::TransferManagerConfiguration transfer_config(executor.get());
    transfer_config.s3Client = client;

    constexpr uint64_t MIN_PART_SIZE = 5 * 1024 * 1024;
    uint64_t part_size = config.part_size;
    if (part_size < MIN_PART_SIZE) {
      CLOUDPHOTO_LOG_WARN(
        "part_size below S3 minimum, using 5MB" << kv("part_size", config.part_size)
      );
      part_size = MIN_PART_SIZE;
    }
    transfer_config.bufferSize = part_size;

    transfer_manager = Aws::Transfer::TransferManager::Create(transfer_config);
  }
};

S3ObjectStore::S3ObjectStore(const StoreConfig& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
}

S3ObjectStore::~S3ObjectStore() = default;

ListObjectsResult S3ObjectStore::listObjects(
  const std::string& prefix, const std::string& delimiter
) {
  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(impl_->config.bucket);
  if (!prefix.empty()) {
    request.SetPrefix(prefix);
  }
  if (!delimiter.empty()) {
    request.SetDelimiter(delimiter);
  }

  auto fetch = [this, &request](const std::string& token) {
    ListingPage page;
    if (!token.empty()) {
      request.SetContinuationToken(token);
    }
    auto outcome = impl_->client->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
      page.status = failureFrom(outcome.GetError(), "ListObjectsV2");
      return page;
    }

    const auto& listed = outcome.GetResult();
    for (const auto& object : listed.GetContents()) {
      page.keys.emplace_back(object.GetKey());
    }
    for (const auto& common_prefix : listed.GetCommonPrefixes()) {
      page.common_prefixes.emplace_back(common_prefix.GetPrefix());
    }
    page.is_truncated = listed.GetIsTruncated();
    page.next_token = listed.GetNextContinuationToken();
    return page;
  };

  size_t pages = 0;
  ListObjectsResult result = collectListing(fetch, pages);
  if (!result.status.success) {
    CLOUDPHOTO_LOG_ERROR(
      "Listing failed" << kv("prefix", prefix) << kv("error", result.status.error_message)
                       << kv("code", result.status.error_code) << kv("page", pages)
    );
    return result;
  }

  CLOUDPHOTO_LOG_DEBUG(
    "Listed objects" << kv("prefix", prefix) << kv("keys", result.keys.size())
                     << kv("common_prefixes", result.common_prefixes.size())
                     << kv("pages", pages)
  );
  return result;
}

StoreResult S3ObjectStore::putObject(const std::string& key, const std::string& local_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(local_path, ec)) {
    return StoreResult::Failure("Cannot open local file: " + local_path, "FileNotFound", false);
  }

  auto upload_handle = impl_->transfer_manager->UploadFile(
    local_path.c_str(),
    impl_->config.bucket.c_str(),
    key.c_str(),
    contentTypeForKey(key).c_str(),
    Aws::Map<Aws::String, Aws::String>()
  );
  upload_handle->WaitUntilFinished();

  if (upload_handle->GetStatus() != Aws::Transfer::TransferStatus::COMPLETED) {
    auto result = failureFromTransfer(upload_handle, "Upload");
    CLOUDPHOTO_LOG_ERROR(
      "Upload failed" << kv("key", key) << kv("error", result.error_message)
                      << kv("code", result.error_code)
    );
    return result;
  }

  CLOUDPHOTO_LOG_DEBUG(
    "Uploaded object" << kv("key", key)
                      << kv("bytes", upload_handle->GetBytesTransferred())
  );
  return StoreResult::Success();
}

StoreResult S3ObjectStore::getObject(const std::string& key, const std::string& local_path) {
  auto download_handle = impl_->transfer_manager->DownloadFile(
    impl_->config.bucket.c_str(), key.c_str(), local_path.c_str()
  );
  download_handle->WaitUntilFinished();

  if (download_handle->GetStatus() != Aws::Transfer::TransferStatus::COMPLETED) {
    auto result = failureFromTransfer(download_handle, "Download");
    CLOUDPHOTO_LOG_ERROR(
      "Download failed" << kv("key", key) << kv("error", result.error_message)
                        << kv("code", result.error_code)
    );
    return result;
  }

  CLOUDPHOTO_LOG_DEBUG("Downloaded object" << kv("key", key) << kv("path", local_path));
  return StoreResult::Success();
}

StoreResult S3ObjectStore::deleteObject(const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    if (outcome.GetError().GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY) {
      return StoreResult::Success();
    }
    auto result = failureFrom(outcome.GetError(), "DeleteObject");
    CLOUDPHOTO_LOG_ERROR(
      "Delete failed" << kv("key", key) << kv("error", result.error_message)
                      << kv("code", result.error_code)
    );
    return result;
  }

  CLOUDPHOTO_LOG_DEBUG("Deleted object" << kv("key", key));
  return StoreResult::Success();
}

StoreResult S3ObjectStore::ensureBucketExists() {
  Aws::S3::Model::HeadBucketRequest head;
  head.SetBucket(impl_->config.bucket);
  auto head_outcome = impl_->client->HeadBucket(head);
  if (head_outcome.IsSuccess()) {
    return StoreResult::Success();
  }
  if (head_outcome.GetError().GetResponseCode() != Aws::Http::HttpResponseCode::NOT_FOUND) {
    auto result = failureFrom(head_outcome.GetError(), "HeadBucket");
    CLOUDPHOTO_LOG_ERROR(
      "Bucket check failed" << kv("bucket", impl_->config.bucket)
                            << kv("error", result.error_message)
    );
    return result;
  }

  Aws::S3::Model::CreateBucketRequest create;
  create.SetBucket(impl_->config.bucket);
  // us-east-1 and custom endpoints take no location constraint
  if (impl_->config.endpoint_url.empty() && impl_->config.region != "us-east-1") {
    Aws::S3::Model::CreateBucketConfiguration bucket_config;
    bucket_config.SetLocationConstraint(
      Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(
        impl_->config.region
      )
    );
    create.SetCreateBucketConfiguration(bucket_config);
  }

  auto outcome = impl_->client->CreateBucket(create);
  if (!outcome.IsSuccess()) {
    if (isBucketAlreadyPresentError(outcome.GetError().GetExceptionName())) {
      return StoreResult::Success();
    }
    auto result = failureFrom(outcome.GetError(), "CreateBucket");
    CLOUDPHOTO_LOG_ERROR(
      "Bucket creation failed" << kv("bucket", impl_->config.bucket)
                               << kv("error", result.error_message)
    );
    return result;
  }

  CLOUDPHOTO_LOG_INFO("Created bucket" << kv("bucket", impl_->config.bucket));
  return StoreResult::Success();
}

StoreResult S3ObjectStore::configureStaticWebsite(
  const std::string& index_document, const std::string& error_document
) {
  Aws::S3::Model::WebsiteConfiguration website;
  website.SetIndexDocument(Aws::S3::Model::IndexDocument().WithSuffix(index_document));
  if (!error_document.empty()) {
    website.SetErrorDocument(Aws::S3::Model::ErrorDocument().WithKey(error_document));
  }

  Aws::S3::Model::PutBucketWebsiteRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetWebsiteConfiguration(website);

  auto outcome = impl_->client->PutBucketWebsite(request);
  if (!outcome.IsSuccess()) {
    auto result = failureFrom(outcome.GetError(), "PutBucketWebsite");
    CLOUDPHOTO_LOG_ERROR(
      "Website configuration failed" << kv("bucket", impl_->config.bucket)
                                     << kv("error", result.error_message)
    );
    return result;
  }

  CLOUDPHOTO_LOG_INFO(
    "Website enabled" << kv("bucket", impl_->config.bucket) << kv("index", index_document)
  );
  return StoreResult::Success();
}

bool S3ObjectStore::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> retryable = {
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "RequestTimeTooSkewed",
    "ConnectionReset",
    "ConnectionTimeout",
    "NetworkingError",
    "Throttling",
  };
  return retryable.count(error_code) > 0;
}

const std::string& S3ObjectStore::bucket() const {
  return impl_->config.bucket;
}

}  // namespace store
}  // namespace cloudphoto
