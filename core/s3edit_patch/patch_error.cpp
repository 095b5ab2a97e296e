// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "patch_error.hpp"

#include <set>

namespace s3edit {
namespace patch {

std::string patchErrorKindToString(PatchErrorKind kind) {
  switch (kind) {
    case PatchErrorKind::NONE:
      return "None";
    case PatchErrorKind::CONFIG_LOAD:
      return "ConfigLoad";
    case PatchErrorKind::INVALID_CONFIG:
      return "InvalidConfig";
    case PatchErrorKind::OBJECT_NOT_FOUND:
      return "ObjectNotFound";
    case PatchErrorKind::INVALID_EDIT_WINDOW:
      return "InvalidEditWindow";
    case PatchErrorKind::MISSING_UPLOAD_ID:
      return "MissingUploadId";
    case PatchErrorKind::MISSING_PART_TAG:
      return "MissingPartTag";
    case PatchErrorKind::STORE_REQUEST_FAILED:
      return "StoreRequestFailed";
    case PatchErrorKind::TOO_MANY_PARTS:
      return "TooManyParts";
    default:
      return "Unknown";
  }
}

std::string PatchError::describe() const {
  std::string text = patchErrorKindToString(kind) + ": " + message;
  if (!store_code.empty()) {
    text += " (code: " + store_code + ")";
  }
  return text;
}

bool isRetryableErrorCode(const std::string& error_code) {
  static const std::set<std::string> retryable = {// S3/HTTP errors
                                                  "RequestTimeout",
                                                  "ServiceUnavailable",
                                                  "InternalError",
                                                  "SlowDown",
                                                  "RequestTimeTooSkewed",
                                                  "OperationAborted",

                                                  // Network errors
                                                  "ConnectionReset",
                                                  "ConnectionTimeout",
                                                  "ConnectionRefused",
                                                  "NetworkingError",

                                                  // MinIO-specific
                                                  "XMinioServerNotInitialized",

                                                  // Generic
                                                  "Throttling",
                                                  "ThrottlingException",
                                                  "TransientError"};
  return retryable.count(error_code) > 0;
}

}  // namespace patch
}  // namespace s3edit
