// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_PATCH_TYPES_HPP
#define S3EDIT_PATCH_TYPES_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace s3edit {
namespace patch {

using Bytes = std::vector<uint8_t>;

/**
 * Replace payload.size() bytes of an object starting at offset
 */
struct EditRequest {
  uint64_t offset = 0;
  Bytes payload;

  EditRequest() = default;
  EditRequest(uint64_t off, Bytes data)
      : offset(off)
      , payload(std::move(data)) {}

  uint64_t length() const {
    return static_cast<uint64_t>(payload.size());
  }
};

/**
 * Target object, fetched once per modify call
 */
struct ObjectDescriptor {
  std::string bucket;
  std::string key;
  uint64_t total_length = 0;
  std::string etag;  // Informational; not used as a copy precondition
};

/**
 * Metadata returned by IObjectStore::headObject
 */
struct ObjectInfo {
  uint64_t content_length = 0;
  std::string etag;
};

enum class SegmentKind {
  COPY,   // Bytes taken unchanged from the existing object at the same offsets
  UPLOAD  // Caller-supplied replacement bytes
};

inline const char* segmentKindToString(SegmentKind kind) {
  return kind == SegmentKind::COPY ? "copy" : "upload";
}

/**
 * One part of the rewritten object, covering [start, end)
 *
 * COPY segments read the same range from the source object. UPLOAD
 * segments own their bytes; bytes.size() == end - start.
 */
struct Segment {
  SegmentKind kind = SegmentKind::COPY;
  uint64_t start = 0;
  uint64_t end = 0;
  Bytes bytes;

  static Segment copy(uint64_t start, uint64_t end) {
    Segment s;
    s.kind = SegmentKind::COPY;
    s.start = start;
    s.end = end;
    return s;
  }

  static Segment upload(uint64_t start, Bytes data) {
    Segment s;
    s.kind = SegmentKind::UPLOAD;
    s.start = start;
    s.end = start + data.size();
    s.bytes = std::move(data);
    return s;
  }

  uint64_t length() const {
    return end - start;
  }
};

/**
 * Inclusive byte range in "bytes=first-last" form
 */
struct ByteRange {
  uint64_t first = 0;
  uint64_t last = 0;

  std::string toHeader() const {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
  }
};

/**
 * Store-assigned tag for one uploaded or copied part
 */
struct PartResult {
  int part_number = 0;
  std::string tag;
};

/**
 * Entry of the complete-multipart-upload request
 */
struct CompletedPart {
  int part_number = 0;
  std::string tag;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_PATCH_TYPES_HPP
