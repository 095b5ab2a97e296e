// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_patcher.hpp"

#include <utility>
#include <vector>

#include "completion_assembler.hpp"
#include "multipart_session.hpp"
#include "upload_executor.hpp"

#define S3EDIT_LOG_COMPONENT "object_patcher"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

ObjectPatcher::ObjectPatcher(
  std::shared_ptr<IObjectStore> store, std::string bucket, PatchOptions options
)
    : store_(std::move(store))
    , bucket_(std::move(bucket))
    , options_(options) {}

StoreResult<ObjectDescriptor> ObjectPatcher::describe(const std::string& key) {
  using Result = StoreResult<ObjectDescriptor>;

  auto head = store_->headObject(bucket_, key);
  if (!head.success) {
    return Result::Failure(std::move(head.error));
  }

  ObjectDescriptor object;
  object.bucket = bucket_;
  object.key = key;
  object.total_length = head.value.content_length;
  object.etag = head.value.etag;
  return Result::Success(std::move(object));
}

PatchResult ObjectPatcher::modify(const std::string& key, EditRequest edit) {
  auto described = describe(key);
  if (!described.success) {
    S3EDIT_LOG_ERROR("head failed" << kv("key", key) << kv("error", described.error.describe()));
    return PatchResult::Failure(std::move(described.error));
  }
  const ObjectDescriptor& object = described.value;

  const uint64_t offset = edit.offset;
  const uint64_t length = edit.length();
  if (!editWindowFits(object.total_length, offset, length)) {
    return PatchResult::Failure(
      {PatchErrorKind::INVALID_EDIT_WINDOW,
       key + ": edit at " + std::to_string(offset) + " of " + std::to_string(length) +
         " bytes exceeds object length " + std::to_string(object.total_length)}
    );
  }

  auto planned = planSegments(
    object.total_length, options_.max_part_size, std::move(edit), options_.max_part_count
  );
  if (!planned.success) {
    S3EDIT_LOG_ERROR("plan rejected" << kv("key", key) << kv("error", planned.error.describe()));
    return PatchResult::Failure(std::move(planned.error));
  }
  std::vector<Segment>& segments = planned.value;

  S3EDIT_LOG_INFO(
    "modify" << kv("key", key) << kv("length", object.total_length) << kv("offset", offset)
             << kv("bytes", length) << kv("parts", segments.size())
  );

  auto opened = MultipartSession::open(*store_, object.bucket, object.key);
  if (!opened.success) {
    S3EDIT_LOG_ERROR("create upload failed" << kv("key", key) << kv("error", opened.error.describe()));
    return PatchResult::Failure(std::move(opened.error));
  }
  MultipartSession& session = *opened.value;
  S3EDIT_LOG_SCOPED_CONTEXT(object.key, session.uploadId());

  ExecutorOptions executor_options;
  executor_options.max_concurrent_parts = options_.max_concurrent_parts;
  UploadExecutor executor(*store_, executor_options);

  auto executed = executor.execute(object, session.uploadId(), std::move(segments));
  if (!executed.success) {
    return PatchResult::Failure(std::move(executed.error));
  }

  CompletionAssembler assembler(*store_);
  auto completed = assembler.complete(object, session.uploadId(), executed.value);
  if (!completed.success) {
    return completed;
  }

  session.markCompleted();
  S3EDIT_LOG_INFO("modify done" << kv("key", key));
  return PatchResult::Success();
}

}  // namespace patch
}  // namespace s3edit
