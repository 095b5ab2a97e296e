// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_executor.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <mutex>
#include <system_error>
#include <thread>

#include "upload_executor_test_helpers.hpp"

#define S3EDIT_LOG_COMPONENT "upload_executor"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

std::vector<std::thread> startWorkersImpl(
  size_t count, const std::function<std::thread(size_t)>& spawn
) {
  std::vector<std::thread> workers;
  workers.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    try {
      workers.push_back(spawn(i));
    } catch (const std::system_error& e) {
      S3EDIT_LOG_WARN(
        "part worker not started" << kv("worker", i) << kv("running", workers.size())
                                  << kv("error", e.what())
      );
      break;
    }
  }
  return workers;
}

UploadExecutor::UploadExecutor(IObjectStore& store, ExecutorOptions options)
    : store_(store)
    , options_(options) {
  if (options_.max_concurrent_parts == 0) {
    options_.max_concurrent_parts = 1;
  }
}

StoreResult<std::vector<PartResult>> UploadExecutor::execute(
  const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment> segments
) {
  size_t workers = std::min<size_t>(options_.max_concurrent_parts, segments.size());
  if (workers <= 1) {
    return executeSequential(object, upload_id, segments);
  }
  return executeConcurrent(object, upload_id, segments, workers);
}

StoreResult<std::string> UploadExecutor::runSegment(
  const ObjectDescriptor& object, const std::string& upload_id, int part_number, Segment& segment
) {
  if (segment.kind == SegmentKind::UPLOAD) {
    S3EDIT_LOG_INFO(
      "upload part" << kv("part", part_number) << kv("offset", segment.start)
                    << kv("bytes", segment.length())
    );
    return store_.uploadPart(
      object.bucket, object.key, upload_id, part_number, std::move(segment.bytes)
    );
  }

  ByteRange range{segment.start, segment.end - 1};
  S3EDIT_LOG_INFO("copy part" << kv("part", part_number) << kv("range", range.toHeader()));
  return store_.uploadPartCopy(
    object.bucket, object.key, upload_id, part_number, object.bucket, object.key, range
  );
}

StoreResult<std::vector<PartResult>> UploadExecutor::executeSequential(
  const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment>& segments
) {
  using Result = StoreResult<std::vector<PartResult>>;

  std::vector<PartResult> results;
  results.reserve(segments.size());

  int part_number = 1;
  for (auto& segment : segments) {
    auto outcome = runSegment(object, upload_id, part_number, segment);
    if (!outcome.success) {
      S3EDIT_LOG_ERROR(
        "part failed" << kv("part", part_number) << kv("error", outcome.error.describe())
      );
      return Result::Failure(std::move(outcome.error));
    }
    results.push_back({part_number, std::move(outcome.value)});
    ++part_number;
  }

  return Result::Success(std::move(results));
}

StoreResult<std::vector<PartResult>> UploadExecutor::executeConcurrent(
  const ObjectDescriptor& object, const std::string& upload_id, std::vector<Segment>& segments,
  size_t worker_count
) {
  using Result = StoreResult<std::vector<PartResult>>;

  const size_t count = segments.size();
  // Indexed by part number - 1, so arrival order does not matter
  std::vector<PartResult> results(count);

  std::atomic<size_t> next_index{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  PatchError first_error;
  size_t first_error_index = std::numeric_limits<size_t>::max();

  auto worker_loop = [&](size_t worker_id) {
    S3EDIT_LOG_SCOPED_CONTEXT(object.key, upload_id);
    S3EDIT_LOG_DEBUG("part worker started" << kv("worker", worker_id));

    while (!failed.load()) {
      size_t index = next_index.fetch_add(1);
      if (index >= count) {
        break;
      }

      int part_number = static_cast<int>(index) + 1;
      auto outcome = runSegment(object, upload_id, part_number, segments[index]);
      if (!outcome.success) {
        S3EDIT_LOG_ERROR(
          "part failed" << kv("part", part_number) << kv("error", outcome.error.describe())
        );
        std::lock_guard<std::mutex> lock(error_mutex);
        if (index < first_error_index) {
          first_error_index = index;
          first_error = std::move(outcome.error);
        }
        failed = true;
        break;
      }
      results[index] = {part_number, std::move(outcome.value)};
    }
  };

  // Running workers drain the whole queue, so fewer threads than asked
  // still upload every part
  auto workers = startWorkersImpl(worker_count, [&](size_t i) {
    return std::thread(worker_loop, i);
  });
  if (workers.empty()) {
    return executeSequential(object, upload_id, segments);
  }
  for (auto& worker : workers) {
    worker.join();
  }

  if (failed.load()) {
    return Result::Failure(std::move(first_error));
  }
  return Result::Success(std::move(results));
}

}  // namespace patch
}  // namespace s3edit
