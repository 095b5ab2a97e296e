// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_SEGMENT_PLANNER_HPP
#define S3EDIT_SEGMENT_PLANNER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "patch_error.hpp"
#include "patch_types.hpp"

namespace s3edit {
namespace patch {

// 1GB
constexpr uint64_t kDefaultMaxPartSize = 1024ULL * 1024 * 1024;
// S3 limit on parts per multipart upload
constexpr uint32_t kDefaultMaxPartCount = 10000;

/**
 * Check that [offset, offset + length) lies inside an object of total_length
 * bytes. Overflow of offset + length counts as outside.
 */
bool editWindowFits(uint64_t total_length, uint64_t offset, uint64_t length);

/**
 * Split an object of total_length bytes into the ordered parts of the
 * rewritten object, without payload bytes.
 *
 * Unmodified spans become COPY segments ending on multiples of
 * max_part_size (so at most max_part_size bytes). A COPY segment that would
 * cross the edit offset is cut short there, so the edit always starts on a
 * part boundary. The edit window becomes one UPLOAD
 * segment, or consecutive UPLOAD segments of at most max_part_size bytes when
 * it is longer than that. A zero-length edit yields a copy-only plan.
 *
 * UPLOAD segments in the result have empty bytes.
 *
 * Planning stops with TOO_MANY_PARTS as soon as the plan would need more
 * than max_part_count parts, before the rest of the plan is built.
 *
 * @return Segments covering exactly [0, total_length); INVALID_EDIT_WINDOW
 *         when the edit does not fit, INVALID_CONFIG when max_part_size is 0
 */
StoreResult<std::vector<Segment>> planLayout(
  uint64_t total_length, uint64_t max_part_size, uint64_t offset, uint64_t length,
  uint32_t max_part_count = kDefaultMaxPartCount
);

/**
 * planLayout() for an edit, with the payload moved into the UPLOAD
 * segments. A payload that fits one part is moved without copying.
 */
StoreResult<std::vector<Segment>> planSegments(
  uint64_t total_length, uint64_t max_part_size, EditRequest edit,
  uint32_t max_part_count = kDefaultMaxPartCount
);

/**
 * One line per segment: "<part> <kind> [start, end) <length>"
 */
std::string describePlan(const std::vector<Segment>& segments);

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_SEGMENT_PLANNER_HPP
