// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_UPLOAD_EXECUTOR_HPP
#define S3EDIT_UPLOAD_EXECUTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "object_store_interfaces.hpp"
#include "patch_error.hpp"
#include "patch_types.hpp"

namespace s3edit {
namespace patch {

/**
 * Configuration for part execution
 */
struct ExecutorOptions {
  // 1 issues parts strictly in order, each awaited before the next.
  // N > 1 runs N workers over the segment list.
  uint32_t max_concurrent_parts = 1;
};

/**
 * Issues one store call per planned segment
 *
 * Part numbers are 1..N in segment order. COPY segments become
 * UploadPartCopy calls reading the same range of the same object; UPLOAD
 * segments become UploadPart calls whose body is moved out of the segment.
 *
 * The first failing part stops the run. In concurrent mode, parts already in
 * flight finish, no new part is started, and the failure with the lowest part
 * number is reported. The executor never aborts the upload session; that is
 * the owner's job (see MultipartSession).
 */
class UploadExecutor {
public:
  explicit UploadExecutor(IObjectStore& store, ExecutorOptions options = {});

  /**
   * Run every segment
   *
   * @param object Target object (also the copy source)
   * @param upload_id Open multipart upload
   * @param segments Plan from planSegments(); consumed
   * @return One PartResult per segment, ordered by part number
   */
  StoreResult<std::vector<PartResult>> execute(
    const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment> segments
  );

  const ExecutorOptions& options() const {
    return options_;
  }

private:
  StoreResult<std::string> runSegment(
    const ObjectDescriptor& object, const std::string& upload_id, int part_number,
    Segment& segment
  );

  StoreResult<std::vector<PartResult>> executeSequential(
    const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment>& segments
  );

  StoreResult<std::vector<PartResult>> executeConcurrent(
    const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment>& segments,
    size_t worker_count
  );

  IObjectStore& store_;
  ExecutorOptions options_;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_UPLOAD_EXECUTOR_HPP
