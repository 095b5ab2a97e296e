// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_OBJECT_STORE_INTERFACES_HPP
#define S3EDIT_OBJECT_STORE_INTERFACES_HPP

#include <string>
#include <vector>

#include "patch_error.hpp"
#include "patch_types.hpp"

namespace s3edit {
namespace patch {

/**
 * Interface for the object store operations the patcher needs
 * Allows mocking the store for testing
 *
 * Implementations must be safe to call from several threads at once;
 * each modify call works on its own upload id.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Fetch object metadata
   * @return ObjectInfo, or OBJECT_NOT_FOUND if the key does not exist
   */
  virtual StoreResult<ObjectInfo> headObject(
    const std::string& bucket, const std::string& key
  ) = 0;

  /**
   * Open a multipart upload session
   * @return Upload id, or MISSING_UPLOAD_ID if the response carried none
   */
  virtual StoreResult<std::string> createMultipartUpload(
    const std::string& bucket, const std::string& key
  ) = 0;

  /**
   * Upload one part from memory
   * @param body Part bytes, consumed by the call
   * @return Part ETag, or MISSING_PART_TAG
   */
  virtual StoreResult<std::string> uploadPart(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, Bytes body
  ) = 0;

  /**
   * Copy one part server-side from an existing object
   * @param range Inclusive source byte range
   * @return Part ETag, or MISSING_PART_TAG
   */
  virtual StoreResult<std::string> uploadPartCopy(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, const std::string& source_bucket, const std::string& source_key,
    const ByteRange& range
  ) = 0;

  /**
   * Assemble the uploaded parts into the object
   */
  virtual StoreStatus completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<CompletedPart>& parts
  ) = 0;

  /**
   * Discard an unfinished upload and the parts stored for it
   */
  virtual StoreStatus abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) = 0;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_OBJECT_STORE_INTERFACES_HPP
