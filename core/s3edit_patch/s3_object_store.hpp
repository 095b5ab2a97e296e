// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_S3_OBJECT_STORE_HPP
#define S3EDIT_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>
#include <vector>

#include "object_store_interfaces.hpp"
#include "store_config.hpp"

namespace s3edit {
namespace patch {

/**
 * IObjectStore over the AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible stores (MinIO, Ceph RGW, ...). A
 * custom endpoint switches to path-style addressing. SDK-internal retries
 * are disabled; every error is returned to the caller as is.
 *
 * Thread-safe: the SDK client may be shared by concurrent modify calls.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  // Non-copyable, non-movable
  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  StoreResult<ObjectInfo> headObject(const std::string& bucket, const std::string& key) override;

  StoreResult<std::string> createMultipartUpload(
    const std::string& bucket, const std::string& key
  ) override;

  StoreResult<std::string> uploadPart(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, Bytes body
  ) override;

  StoreResult<std::string> uploadPartCopy(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, const std::string& source_bucket, const std::string& source_key,
    const ByteRange& range
  ) override;

  StoreStatus completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<CompletedPart>& parts
  ) override;

  StoreStatus abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) override;

  const std::string& endpoint() const;
  const std::string& region() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_S3_OBJECT_STORE_HPP
