// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "segment_planner.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>

namespace s3edit {
namespace patch {

bool editWindowFits(uint64_t total_length, uint64_t offset, uint64_t length) {
  return offset <= total_length && length <= total_length - offset;
}

StoreResult<std::vector<Segment>> planLayout(
  uint64_t total_length, uint64_t max_part_size, uint64_t offset, uint64_t length,
  uint32_t max_part_count
) {
  using Result = StoreResult<std::vector<Segment>>;

  if (max_part_size == 0) {
    return Result::Failure({PatchErrorKind::INVALID_CONFIG, "max part size must be positive"});
  }
  if (!editWindowFits(total_length, offset, length)) {
    return Result::Failure(
      {PatchErrorKind::INVALID_EDIT_WINDOW,
       "edit at " + std::to_string(offset) + " of " + std::to_string(length) +
         " bytes exceeds object length " + std::to_string(total_length)}
    );
  }

  const bool has_edit = length > 0;
  const uint64_t edit_end = offset + length;
  std::vector<Segment> segments;
  uint64_t cursor = 0;

  while (cursor < total_length) {
    if (segments.size() >= max_part_count) {
      return Result::Failure(
        {PatchErrorKind::TOO_MANY_PARTS,
         std::to_string(total_length) + " bytes in parts of at most " +
           std::to_string(max_part_size) + " bytes need more than " +
           std::to_string(max_part_count) + " parts"}
      );
    }
    if (has_edit && cursor >= offset && cursor < edit_end) {
      Segment segment;
      segment.kind = SegmentKind::UPLOAD;
      segment.start = cursor;
      segment.end = cursor + std::min(max_part_size, edit_end - cursor);
      segments.push_back(std::move(segment));
      cursor = segments.back().end;
      continue;
    }

    // Copies end on multiples of max_part_size, so the spans after an edit
    // fall back onto the same part grid as the spans before it
    uint64_t to_boundary = max_part_size - cursor % max_part_size;
    uint64_t end = cursor + std::min(to_boundary, total_length - cursor);
    if (has_edit && offset > cursor && offset < end) {
      end = offset;
    }
    segments.push_back(Segment::copy(cursor, end));
    cursor = end;
  }

  return Result::Success(std::move(segments));
}

StoreResult<std::vector<Segment>> planSegments(
  uint64_t total_length, uint64_t max_part_size, EditRequest edit, uint32_t max_part_count
) {
  const uint64_t offset = edit.offset;
  auto layout = planLayout(total_length, max_part_size, offset, edit.length(), max_part_count);
  if (!layout.success) {
    return layout;
  }

  std::vector<Segment>& segments = layout.value;
  bool single_upload = edit.length() <= max_part_size;
  for (auto& segment : segments) {
    if (segment.kind != SegmentKind::UPLOAD) {
      continue;
    }
    if (single_upload) {
      segment.bytes = std::move(edit.payload);
      continue;
    }
    auto first = edit.payload.begin() + static_cast<std::ptrdiff_t>(segment.start - offset);
    segment.bytes.assign(first, first + static_cast<std::ptrdiff_t>(segment.length()));
  }

  return layout;
}

std::string describePlan(const std::vector<Segment>& segments) {
  std::ostringstream oss;
  int part_number = 1;
  for (const auto& segment : segments) {
    oss << part_number++ << " " << segmentKindToString(segment.kind) << " [" << segment.start
        << ", " << segment.end << ") " << segment.length() << "\n";
  }
  return oss.str();
}

}  // namespace patch
}  // namespace s3edit
