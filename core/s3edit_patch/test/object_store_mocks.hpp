// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_OBJECT_STORE_MOCKS_HPP
#define S3EDIT_OBJECT_STORE_MOCKS_HPP

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "object_store_interfaces.hpp"

namespace s3edit {
namespace patch {
namespace test {

/**
 * Mock implementation of IObjectStore for testing
 */
class MockObjectStore : public IObjectStore {
public:
  MOCK_METHOD(
    StoreResult<ObjectInfo>, headObject, (const std::string& bucket, const std::string& key),
    (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, createMultipartUpload,
    (const std::string& bucket, const std::string& key), (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, uploadPart,
    (const std::string& bucket, const std::string& key, const std::string& upload_id,
     int part_number, Bytes body),
    (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, uploadPartCopy,
    (const std::string& bucket, const std::string& key, const std::string& upload_id,
     int part_number, const std::string& source_bucket, const std::string& source_key,
     const ByteRange& range),
    (override)
  );
  MOCK_METHOD(
    StoreStatus, completeMultipartUpload,
    (const std::string& bucket, const std::string& key, const std::string& upload_id,
     const std::vector<CompletedPart>& parts),
    (override)
  );
  MOCK_METHOD(
    StoreStatus, abortMultipartUpload,
    (const std::string& bucket, const std::string& key, const std::string& upload_id),
    (override)
  );
};

}  // namespace test
}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_OBJECT_STORE_MOCKS_HPP
