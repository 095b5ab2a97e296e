// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_session.hpp"

#include <utility>

#define S3EDIT_LOG_COMPONENT "multipart_session"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

StoreResult<std::unique_ptr<MultipartSession>> MultipartSession::open(
  IObjectStore& store, const std::string& bucket, const std::string& key
) {
  using Result = StoreResult<std::unique_ptr<MultipartSession>>;

  auto created = store.createMultipartUpload(bucket, key);
  if (!created.success) {
    return Result::Failure(std::move(created.error));
  }
  if (created.value.empty()) {
    return Result::Failure({PatchErrorKind::MISSING_UPLOAD_ID, key + ": store returned no upload id"});
  }

  S3EDIT_LOG_DEBUG("multipart upload created" << kv("key", key) << kv("upload_id", created.value));
  return Result::Success(std::unique_ptr<MultipartSession>(
    new MultipartSession(store, bucket, key, std::move(created.value))
  ));
}

MultipartSession::MultipartSession(
  IObjectStore& store, std::string bucket, std::string key, std::string upload_id
)
    : store_(store)
    , bucket_(std::move(bucket))
    , key_(std::move(key))
    , upload_id_(std::move(upload_id)) {}

MultipartSession::~MultipartSession() {
  if (!finished_) {
    // Result is logged by abort(); a destructor has nobody to report to
    abort();
  }
}

StoreStatus MultipartSession::abort() {
  if (finished_) {
    return StoreStatus::Success();
  }
  finished_ = true;

  S3EDIT_LOG_WARN("aborting multipart upload" << kv("key", key_) << kv("upload_id", upload_id_));
  auto status = store_.abortMultipartUpload(bucket_, key_, upload_id_);
  if (!status.success) {
    S3EDIT_LOG_ERROR(
      "abort failed, upload left for lifecycle cleanup" << kv("key", key_)
                                                        << kv("upload_id", upload_id_)
                                                        << kv("error", status.error.describe())
    );
  }
  return status;
}

}  // namespace patch
}  // namespace s3edit
