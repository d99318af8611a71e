// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_OBJECT_STORE_HPP
#define CLOUDPHOTO_OBJECT_STORE_HPP

#include <string>
#include <vector>

namespace cloudphoto {
namespace store {

/**
 * Result of a single object store call
 */
struct StoreResult {
  bool success;
  std::string error_message;  // Error message if failed
  std::string error_code;     // Store error code (e.g. "NoSuchBucket", "NetworkingError")
  bool is_retryable;          // True for transient errors

  static StoreResult Success() {
    return {true, "", "", false};
  }

  static StoreResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, message, code, retryable};
  }
};

/**
 * Result of a listing call.
 * With a delimiter, keys holds objects directly under the prefix and
 * common_prefixes holds one entry per distinct next path segment
 * (e.g. "vacation/"). Both are in store listing order.
 */
struct ListObjectsResult {
  StoreResult status;
  std::vector<std::string> keys;
  std::vector<std::string> common_prefixes;
};

/**
 * Capability interface over a remote key/object store.
 *
 * An implementation is bound to one bucket at construction. Implementations
 * must follow listing pagination themselves; callers always receive the full
 * listing.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * List objects whose key starts with prefix.
   * @param prefix Key prefix filter ("" for the whole bucket)
   * @param delimiter Grouping delimiter ("" for a flat recursive listing)
   */
  virtual ListObjectsResult listObjects(const std::string& prefix, const std::string& delimiter) = 0;

  /**
   * Upload a local file. An existing object with the same key is replaced.
   */
  virtual StoreResult putObject(const std::string& key, const std::string& local_path) = 0;

  /**
   * Download an object into a local file, replacing the file if present.
   */
  virtual StoreResult getObject(const std::string& key, const std::string& local_path) = 0;

  /**
   * Delete an object. Deleting a missing key succeeds.
   */
  virtual StoreResult deleteObject(const std::string& key) = 0;

  /**
   * Create the bucket if it does not exist yet.
   */
  virtual StoreResult ensureBucketExists() = 0;

  /**
   * Enable static website serving on the bucket.
   */
  virtual StoreResult configureStaticWebsite(
    const std::string& index_document, const std::string& error_document
  ) = 0;

  virtual const std::string& bucket() const = 0;
};

}  // namespace store
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_OBJECT_STORE_HPP
