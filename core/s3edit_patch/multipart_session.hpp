// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_MULTIPART_SESSION_HPP
#define S3EDIT_MULTIPART_SESSION_HPP

#include <memory>
#include <string>

#include "object_store_interfaces.hpp"
#include "patch_error.hpp"

namespace s3edit {
namespace patch {

/**
 * Owns one open multipart upload
 *
 * The destructor aborts the upload unless markCompleted() was called, so
 * every early return after open() releases the parts already stored.
 *
 * Usage:
 *   auto opened = MultipartSession::open(store, bucket, key);
 *   if (!opened.success) return ...;
 *   auto& session = *opened.value;
 *   ... upload parts under session.uploadId() ...
 *   if (completed) session.markCompleted();
 */
class MultipartSession {
public:
  /**
   * Create a multipart upload for bucket/key
   */
  static StoreResult<std::unique_ptr<MultipartSession>> open(
    IObjectStore& store, const std::string& bucket, const std::string& key
  );

  ~MultipartSession();

  // Non-copyable, non-movable
  MultipartSession(const MultipartSession&) = delete;
  MultipartSession& operator=(const MultipartSession&) = delete;
  MultipartSession(MultipartSession&&) = delete;
  MultipartSession& operator=(MultipartSession&&) = delete;

  const std::string& uploadId() const {
    return upload_id_;
  }

  /**
   * Completion succeeded; the destructor will leave the upload alone
   */
  void markCompleted() {
    finished_ = true;
  }

  /**
   * Abort now. Further calls and the destructor do nothing.
   */
  StoreStatus abort();

  bool finished() const {
    return finished_;
  }

private:
  MultipartSession(IObjectStore& store, std::string bucket, std::string key, std::string upload_id);

  IObjectStore& store_;
  std::string bucket_;
  std::string key_;
  std::string upload_id_;
  bool finished_ = false;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_MULTIPART_SESSION_HPP
