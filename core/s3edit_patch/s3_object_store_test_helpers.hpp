// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_S3_OBJECT_STORE_TEST_HELPERS_HPP
#define S3EDIT_S3_OBJECT_STORE_TEST_HELPERS_HPP

// This header is for testing only - exposes internal helpers of
// s3_object_store.cpp that do not need a live endpoint

#include <string>

#include "patch_error.hpp"

namespace s3edit {
namespace patch {

/**
 * Build the x-amz-copy-source value "<bucket>/<url-encoded key>".
 * Path separators in the key are kept.
 */
std::string makeCopySource(const std::string& bucket, const std::string& key);

/**
 * Map a failed SDK call to a PatchError
 *
 * @param http_status HTTP response code (0 when no response was received)
 * @param code Store error code / exception name
 * @param message Store error message
 * @param sdk_retryable SDK's own retry verdict
 * @param not_found_is_missing_object Map 404 / NoSuchKey to OBJECT_NOT_FOUND
 * @param context Operation and key, prefixed to the message
 */
PatchError classifyStoreError(
  int http_status, const std::string& code, const std::string& message, bool sdk_retryable,
  bool not_found_is_missing_object, const std::string& context
);

/**
 * Strip one pair of surrounding double quotes from an ETag
 */
std::string unquoteEtag(const std::string& etag);

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_S3_OBJECT_STORE_TEST_HELPERS_HPP
