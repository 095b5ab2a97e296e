// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the segment planner
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "segment_planner.hpp"
#include "test_helpers.hpp"

using namespace s3edit::patch;
using namespace s3edit::patch::test;

namespace {

// Asserts the segments tile [0, total) with no gaps, overlaps or empty parts
void expectCovers(const std::vector<Segment>& segments, uint64_t total) {
  uint64_t cursor = 0;
  for (const auto& segment : segments) {
    EXPECT_EQ(segment.start, cursor);
    EXPECT_GT(segment.end, segment.start);
    cursor = segment.end;
  }
  EXPECT_EQ(cursor, total);
}

std::vector<Segment> plan(uint64_t total, uint64_t max_part_size, uint64_t offset, size_t length) {
  auto result = planSegments(total, max_part_size, EditRequest(offset, makePatternBytes(length)));
  EXPECT_TRUE(result.success) << result.error.describe();
  return result.value;
}

size_t countUploads(const std::vector<Segment>& segments) {
  size_t count = 0;
  for (const auto& segment : segments) {
    if (segment.kind == SegmentKind::UPLOAD) {
      ++count;
    }
  }
  return count;
}

}  // namespace

// =============================================================================
// Edit Window Tests
// =============================================================================

TEST(EditWindowTest, InsideObject) {
  EXPECT_TRUE(editWindowFits(100, 0, 100));
  EXPECT_TRUE(editWindowFits(100, 99, 1));
  EXPECT_TRUE(editWindowFits(100, 100, 0));
}

TEST(EditWindowTest, PastEnd) {
  EXPECT_FALSE(editWindowFits(100, 99, 2));
  EXPECT_FALSE(editWindowFits(100, 101, 0));
  EXPECT_FALSE(editWindowFits(0, 0, 1));
}

TEST(EditWindowTest, OffsetPlusLengthOverflows) {
  const uint64_t max = std::numeric_limits<uint64_t>::max();
  EXPECT_FALSE(editWindowFits(100, 50, max));
  EXPECT_FALSE(editWindowFits(max, max, 1));
}

// =============================================================================
// Plan Layout Tests
// =============================================================================

TEST(SegmentPlannerTest, ThreeGigabyteObjectSmallEdit) {
  const uint64_t max_part_size = 1073741824;
  auto result = planLayout(3000000000ULL, max_part_size, 1500000000ULL, 10);
  ASSERT_TRUE(result.success);
  const auto& segments = result.value;

  ASSERT_EQ(segments.size(), 5u);

  EXPECT_EQ(segments[0].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[0].start, 0u);
  EXPECT_EQ(segments[0].end, 1073741824u);

  EXPECT_EQ(segments[1].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[1].start, 1073741824u);
  EXPECT_EQ(segments[1].end, 1500000000u);

  EXPECT_EQ(segments[2].kind, SegmentKind::UPLOAD);
  EXPECT_EQ(segments[2].start, 1500000000u);
  EXPECT_EQ(segments[2].end, 1500000010u);

  EXPECT_EQ(segments[3].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[3].start, 1500000010u);
  EXPECT_EQ(segments[3].end, 2147483648u);

  EXPECT_EQ(segments[4].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[4].start, 2147483648u);
  EXPECT_EQ(segments[4].end, 3000000000u);
}

TEST(SegmentPlannerTest, EditCoversWholeObject) {
  auto segments = plan(5, 1024, 0, 5);

  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].kind, SegmentKind::UPLOAD);
  EXPECT_EQ(segments[0].start, 0u);
  EXPECT_EQ(segments[0].end, 5u);
  EXPECT_EQ(segments[0].bytes, makePatternBytes(5));
}

TEST(SegmentPlannerTest, EditEndsOnPartBoundaryAtObjectEnd) {
  // Object is exactly two parts; edit is the tail of the second one
  auto segments = plan(200, 100, 150, 50);

  ASSERT_EQ(segments.size(), 3u);
  expectCovers(segments, 200);
  EXPECT_EQ(segments[0].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[1].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[1].start, 100u);
  EXPECT_EQ(segments[1].end, 150u);
  EXPECT_EQ(segments.back().kind, SegmentKind::UPLOAD);
  EXPECT_EQ(segments.back().end, 200u);
}

TEST(SegmentPlannerTest, EditStartsOnPartBoundary) {
  auto segments = plan(300, 100, 100, 10);

  ASSERT_EQ(segments.size(), 4u);
  expectCovers(segments, 300);
  EXPECT_EQ(segments[0].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[0].end, 100u);
  EXPECT_EQ(segments[1].kind, SegmentKind::UPLOAD);
  EXPECT_EQ(segments[2].start, 110u);
  EXPECT_EQ(segments[2].end, 200u);
  EXPECT_EQ(segments[3].start, 200u);
  EXPECT_EQ(segments[3].end, 300u);
}

TEST(SegmentPlannerTest, EditAtObjectStart) {
  auto segments = plan(250, 100, 0, 30);

  expectCovers(segments, 250);
  EXPECT_EQ(segments[0].kind, SegmentKind::UPLOAD);
  EXPECT_EQ(segments[0].end, 30u);
  EXPECT_EQ(segments[1].kind, SegmentKind::COPY);
  EXPECT_EQ(segments[1].end, 100u);
}

TEST(SegmentPlannerTest, CoverageAndCeilingAcrossOffsets) {
  const uint64_t total = 1000;
  const uint64_t max_part_size = 128;
  for (uint64_t offset = 0; offset < total; offset += 37) {
    for (size_t length : {1u, 5u, 128u}) {
      if (offset + length > total) {
        continue;
      }
      auto segments = plan(total, max_part_size, offset, length);
      SCOPED_TRACE("offset=" + std::to_string(offset) + " length=" + std::to_string(length));

      expectCovers(segments, total);
      ASSERT_EQ(countUploads(segments), 1u);
      for (const auto& segment : segments) {
        EXPECT_LE(segment.length(), max_part_size);
        if (segment.kind == SegmentKind::UPLOAD) {
          EXPECT_EQ(segment.start, offset);
          EXPECT_EQ(segment.end, offset + length);
          EXPECT_EQ(segment.bytes.size(), length);
        } else {
          // Copies never overlap the edit window
          EXPECT_TRUE(segment.end <= offset || segment.start >= offset + length);
          EXPECT_TRUE(segment.bytes.empty());
        }
      }
    }
  }
}

TEST(SegmentPlannerTest, CopiesAfterEditReturnToPartGrid) {
  auto segments = plan(1000, 100, 250, 20);

  expectCovers(segments, 1000);
  for (const auto& segment : segments) {
    if (segment.kind == SegmentKind::COPY && segment.start >= 270) {
      EXPECT_TRUE(segment.end % 100 == 0 || segment.end == 1000);
    }
  }
}

TEST(SegmentPlannerTest, OversizedEditIsSplit) {
  auto payload = makePatternBytes(250);
  auto result = planSegments(400, 100, EditRequest(50, payload));
  ASSERT_TRUE(result.success);
  const auto& segments = result.value;

  expectCovers(segments, 400);
  ASSERT_EQ(countUploads(segments), 3u);

  // copy [0,50), upload [50,150) [150,250) [250,300), copy [300,400)
  ASSERT_EQ(segments.size(), 5u);
  EXPECT_EQ(segments[1].length(), 100u);
  EXPECT_EQ(segments[2].length(), 100u);
  EXPECT_EQ(segments[3].length(), 50u);

  Bytes rejoined;
  for (const auto& segment : segments) {
    if (segment.kind == SegmentKind::UPLOAD) {
      EXPECT_LE(segment.bytes.size(), 100u);
      rejoined.insert(rejoined.end(), segment.bytes.begin(), segment.bytes.end());
    }
  }
  EXPECT_EQ(rejoined, payload);
}

TEST(SegmentPlannerTest, EmptyPayloadCopiesEverything) {
  auto segments = plan(250, 100, 120, 0);

  ASSERT_EQ(segments.size(), 3u);
  expectCovers(segments, 250);
  EXPECT_EQ(countUploads(segments), 0u);
}

TEST(SegmentPlannerTest, EmptyObjectEmptyEdit) {
  auto segments = plan(0, 100, 0, 0);
  EXPECT_TRUE(segments.empty());
}

TEST(SegmentPlannerTest, RejectsEditPastEnd) {
  auto result = planSegments(10, 100, EditRequest(8, makePatternBytes(3)));
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::INVALID_EDIT_WINDOW);
}

TEST(SegmentPlannerTest, RejectsZeroMaxPartSize) {
  auto result = planLayout(10, 0, 0, 1);
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::INVALID_CONFIG);
}

TEST(SegmentPlannerTest, LayoutLeavesUploadBytesEmpty) {
  auto result = planLayout(300, 100, 120, 10);
  ASSERT_TRUE(result.success);
  for (const auto& segment : result.value) {
    EXPECT_TRUE(segment.bytes.empty());
  }
}

// =============================================================================
// Part Count and Description Tests
// =============================================================================

TEST(SegmentPlannerTest, PartCountWithinLimit) {
  auto result = planSegments(1000, 100, EditRequest(0, makePatternBytes(1)), 11);
  ASSERT_TRUE(result.success) << result.error.describe();
  EXPECT_EQ(result.value.size(), 11u);
}

TEST(SegmentPlannerTest, PartCountOverLimit) {
  auto result = planSegments(1000, 100, EditRequest(0, makePatternBytes(1)), 10);
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::TOO_MANY_PARTS);
  EXPECT_TRUE(result.value.empty());
}

TEST(SegmentPlannerTest, PartCountStopsHugeLayoutEarly) {
  // One-byte parts over a terabyte would need 10^12 segments
  auto result = planLayout(1000000000000ULL, 1, 0, 0, kDefaultMaxPartCount);
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::TOO_MANY_PARTS);
  EXPECT_NE(result.error.message.find("10000"), std::string::npos);
}

TEST(SegmentPlannerTest, PartCountExactlyAtDefaultLimit) {
  auto result = planLayout(10000, 1, 0, 0);
  ASSERT_TRUE(result.success) << result.error.describe();
  EXPECT_EQ(result.value.size(), static_cast<size_t>(kDefaultMaxPartCount));

  auto over = planLayout(10001, 1, 0, 0);
  ASSERT_FALSE(over.success);
  EXPECT_EQ(over.error.kind, PatchErrorKind::TOO_MANY_PARTS);
}

TEST(SegmentPlannerTest, DescribePlan) {
  auto result = planLayout(30, 10, 12, 3);
  ASSERT_TRUE(result.success);

  EXPECT_EQ(
    describePlan(result.value),
    "1 copy [0, 10) 10\n"
    "2 copy [10, 12) 2\n"
    "3 upload [12, 15) 3\n"
    "4 copy [15, 20) 5\n"
    "5 copy [20, 30) 10\n"
  );
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
