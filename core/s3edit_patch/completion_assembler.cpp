// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "completion_assembler.hpp"

#define S3EDIT_LOG_COMPONENT "completion_assembler"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

std::vector<CompletedPart> assembleCompletedParts(const std::vector<PartResult>& results) {
  std::vector<CompletedPart> parts;
  parts.reserve(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    parts.push_back({static_cast<int>(i) + 1, results[i].tag});
  }
  return parts;
}

StoreStatus CompletionAssembler::complete(
  const ObjectDescriptor& object, const std::string& upload_id,
  const std::vector<PartResult>& results
) {
  auto parts = assembleCompletedParts(results);
  S3EDIT_LOG_INFO("complete multipart upload" << kv("parts", parts.size()));

  auto status = store_.completeMultipartUpload(object.bucket, object.key, upload_id, parts);
  if (!status.success) {
    S3EDIT_LOG_ERROR("complete failed" << kv("error", status.error.describe()));
  }
  return status;
}

}  // namespace patch
}  // namespace s3edit
