// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_PATCH_ERROR_HPP
#define S3EDIT_PATCH_ERROR_HPP

#include <string>
#include <utility>

namespace s3edit {
namespace patch {

/**
 * Classification of a failed patch or store call
 */
enum class PatchErrorKind {
  NONE,
  CONFIG_LOAD,           // Env var missing, config file unreadable or malformed
  INVALID_CONFIG,        // Settings that cannot drive a plan (e.g. max part size 0)
  OBJECT_NOT_FOUND,      // Target object does not exist
  INVALID_EDIT_WINDOW,   // offset + length exceeds the object length
  MISSING_UPLOAD_ID,     // CreateMultipartUpload response had no upload id
  MISSING_PART_TAG,      // Part response had no ETag
  STORE_REQUEST_FAILED,  // Transport or service error from the store
  TOO_MANY_PARTS         // Plan exceeds the store's part count ceiling
};

std::string patchErrorKindToString(PatchErrorKind kind);

/**
 * Error value carried by every failed result
 */
struct PatchError {
  PatchErrorKind kind = PatchErrorKind::NONE;
  std::string message;
  std::string store_code;     // Store error code (e.g. "NoSuchKey"), empty if not from the store
  bool is_retryable = false;  // True for transient store errors

  PatchError() = default;
  PatchError(
    PatchErrorKind k, std::string msg, std::string code = "", bool retryable = false
  )
      : kind(k)
      , message(std::move(msg))
      , store_code(std::move(code))
      , is_retryable(retryable) {}

  /**
   * "<kind>: <message>" plus the store code when there is one
   */
  std::string describe() const;
};

/**
 * Check if a store error code is transient
 *
 * @param error_code S3/HTTP error code
 * @return true if a caller may retry the request
 */
bool isRetryableErrorCode(const std::string& error_code);

/**
 * Outcome of a store call that yields a value
 */
template <typename T>
struct StoreResult {
  bool success = false;
  T value{};
  PatchError error;

  static StoreResult Success(T v) {
    StoreResult r;
    r.success = true;
    r.value = std::move(v);
    return r;
  }

  static StoreResult Failure(PatchError e) {
    StoreResult r;
    r.error = std::move(e);
    return r;
  }
};

/**
 * Outcome of a store call or patch operation with no value
 */
struct StoreStatus {
  bool success = false;
  PatchError error;

  static StoreStatus Success() {
    StoreStatus s;
    s.success = true;
    return s;
  }

  static StoreStatus Failure(PatchError e) {
    StoreStatus s;
    s.error = std::move(e);
    return s;
  }
};

/**
 * Result of ObjectPatcher::modify
 */
using PatchResult = StoreStatus;

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_PATCH_ERROR_HPP
