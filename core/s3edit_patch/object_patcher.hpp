// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_OBJECT_PATCHER_HPP
#define S3EDIT_OBJECT_PATCHER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "object_store_interfaces.hpp"
#include "patch_error.hpp"
#include "patch_types.hpp"
#include "segment_planner.hpp"

namespace s3edit {
namespace patch {

/**
 * Limits applied to every modify call
 */
struct PatchOptions {
  uint64_t max_part_size = kDefaultMaxPartSize;    // Largest part the store accepts
  uint32_t max_part_count = kDefaultMaxPartCount;  // Most parts per upload
  uint32_t max_concurrent_parts = 1;               // 1 = strictly sequential parts
};

/**
 * Rewrites a byte range of an existing object in place
 *
 * modify() runs as one chain of store calls:
 * 1. HeadObject for the current length
 * 2. Edit window check, plan capped at max_part_count (no store mutation yet)
 * 3. CreateMultipartUpload
 * 4. One UploadPart / UploadPartCopy per segment
 * 5. CompleteMultipartUpload
 *
 * Any failure after step 3 aborts the multipart upload. Readers see either
 * the old object or the complete new one.
 *
 * Thread-safe: concurrent modify calls share the store and never share an
 * upload session.
 */
class ObjectPatcher {
public:
  ObjectPatcher(std::shared_ptr<IObjectStore> store, std::string bucket, PatchOptions options = {});

  /**
   * Replace edit.payload.size() bytes of key starting at edit.offset
   *
   * @param key Object key (must exist)
   * @param edit Edit request; its payload is consumed
   * @return Success, or the first error encountered
   */
  PatchResult modify(const std::string& key, EditRequest edit);

  /**
   * Fetch bucket, key and current length of an object
   */
  StoreResult<ObjectDescriptor> describe(const std::string& key);

  const std::string& bucket() const {
    return bucket_;
  }

  const PatchOptions& options() const {
    return options_;
  }

private:
  std::shared_ptr<IObjectStore> store_;
  std::string bucket_;
  PatchOptions options_;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_OBJECT_PATCHER_HPP
