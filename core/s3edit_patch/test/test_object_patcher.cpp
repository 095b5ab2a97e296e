// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ObjectPatcher
 *
 * The round-trip tests run against the in-memory store; the call-order and
 * cleanup tests use GoogleMock.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "object_patcher.hpp"
#include "object_store_mocks.hpp"
#include "test_helpers.hpp"

using namespace s3edit::patch;
using namespace s3edit::patch::test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

Bytes applyEdit(Bytes original, uint64_t offset, const Bytes& payload) {
  std::copy(payload.begin(), payload.end(), original.begin() + static_cast<std::ptrdiff_t>(offset));
  return original;
}

StoreResult<ObjectInfo> headOf(uint64_t length) {
  ObjectInfo info;
  info.content_length = length;
  info.etag = "abc";
  return StoreResult<ObjectInfo>::Success(info);
}

}  // namespace

// =============================================================================
// Round Trip Tests
// =============================================================================

class ObjectPatcherRoundTripTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<FakeObjectStore>();
    original_ = makePatternBytes(1000);
    store_->putObject("plots", "plot.bin", original_);
  }

  ObjectPatcher makePatcher(uint64_t max_part_size, uint32_t concurrency = 1) {
    PatchOptions options;
    options.max_part_size = max_part_size;
    options.max_concurrent_parts = concurrency;
    return ObjectPatcher(store_, "plots", options);
  }

  std::shared_ptr<FakeObjectStore> store_;
  Bytes original_;
};

TEST_F(ObjectPatcherRoundTripTest, EditInTheMiddle) {
  auto patcher = makePatcher(128);
  Bytes payload(10, 0xEE);

  auto result = patcher.modify("plot.bin", EditRequest(500, payload));

  ASSERT_TRUE(result.success) << result.error.describe();
  EXPECT_EQ(store_->object("plots", "plot.bin"), applyEdit(original_, 500, payload));
  EXPECT_EQ(store_->upload_calls.load(), 1);
  EXPECT_EQ(store_->complete_calls.load(), 1);
  EXPECT_EQ(store_->abort_calls.load(), 0);
  EXPECT_EQ(store_->openUploads(), 0u);
}

TEST_F(ObjectPatcherRoundTripTest, EditAtStartAndEnd) {
  auto patcher = makePatcher(256);
  Bytes head(3, 0x11);
  Bytes tail(7, 0x22);

  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(0, head)).success);
  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(993, tail)).success);

  Bytes expected = applyEdit(applyEdit(original_, 0, head), 993, tail);
  EXPECT_EQ(store_->object("plots", "plot.bin"), expected);
}

TEST_F(ObjectPatcherRoundTripTest, WholeObjectReplaced) {
  auto patcher = makePatcher(4096);
  Bytes payload(1000, 0x5A);

  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(0, payload)).success);
  EXPECT_EQ(store_->object("plots", "plot.bin"), payload);
  EXPECT_EQ(store_->copy_calls.load(), 0);
}

TEST_F(ObjectPatcherRoundTripTest, OversizedEditSplitAcrossParts) {
  auto patcher = makePatcher(64);
  Bytes payload(300, 0x77);

  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(100, payload)).success);
  EXPECT_EQ(store_->object("plots", "plot.bin"), applyEdit(original_, 100, payload));
  EXPECT_EQ(store_->upload_calls.load(), 5);
}

TEST_F(ObjectPatcherRoundTripTest, EmptyPayloadLeavesContent) {
  auto patcher = makePatcher(128);

  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(400, Bytes())).success);
  EXPECT_EQ(store_->object("plots", "plot.bin"), original_);
  EXPECT_EQ(store_->upload_calls.load(), 0);
}

TEST_F(ObjectPatcherRoundTripTest, ConcurrentPartsSameResult) {
  auto patcher = makePatcher(64, 4);
  Bytes payload(90, 0x42);

  ASSERT_TRUE(patcher.modify("plot.bin", EditRequest(333, payload)).success);
  EXPECT_EQ(store_->object("plots", "plot.bin"), applyEdit(original_, 333, payload));
}

TEST_F(ObjectPatcherRoundTripTest, ConcurrentModifyCallsOnDifferentKeys) {
  store_->putObject("plots", "other.bin", original_);
  auto patcher = makePatcher(100);
  Bytes first(20, 0x01);
  Bytes second(20, 0x02);

  PatchResult first_result;
  PatchResult second_result;
  std::thread t1([&] { first_result = patcher.modify("plot.bin", EditRequest(10, first)); });
  std::thread t2([&] { second_result = patcher.modify("other.bin", EditRequest(900, second)); });
  t1.join();
  t2.join();

  ASSERT_TRUE(first_result.success);
  ASSERT_TRUE(second_result.success);
  EXPECT_EQ(store_->object("plots", "plot.bin"), applyEdit(original_, 10, first));
  EXPECT_EQ(store_->object("plots", "other.bin"), applyEdit(original_, 900, second));
}

TEST_F(ObjectPatcherRoundTripTest, DescribeReportsLengthAndTag) {
  auto patcher = makePatcher(128);
  auto described = patcher.describe("plot.bin");

  ASSERT_TRUE(described.success);
  EXPECT_EQ(described.value.bucket, "plots");
  EXPECT_EQ(described.value.key, "plot.bin");
  EXPECT_EQ(described.value.total_length, 1000u);
  EXPECT_FALSE(described.value.etag.empty());
}

// =============================================================================
// Failure and Cleanup Tests
// =============================================================================

TEST_F(ObjectPatcherRoundTripTest, MissingObject) {
  auto patcher = makePatcher(128);
  auto result = patcher.modify("absent.bin", EditRequest(0, Bytes(1, 0)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::OBJECT_NOT_FOUND);
  EXPECT_EQ(store_->create_calls.load(), 0);
}

TEST_F(ObjectPatcherRoundTripTest, EditPastEndRejectedWithoutMutation) {
  auto patcher = makePatcher(128);
  auto result = patcher.modify("plot.bin", EditRequest(995, Bytes(6, 0)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::INVALID_EDIT_WINDOW);
  EXPECT_EQ(store_->create_calls.load(), 0);
  EXPECT_EQ(store_->upload_calls.load(), 0);
  EXPECT_EQ(store_->copy_calls.load(), 0);
  EXPECT_EQ(store_->complete_calls.load(), 0);
  EXPECT_EQ(store_->object("plots", "plot.bin"), original_);
}

TEST_F(ObjectPatcherRoundTripTest, PartFailureAbortsAndKeepsOriginal) {
  auto patcher = makePatcher(128);
  store_->fail_part_number = 3;

  auto result = patcher.modify("plot.bin", EditRequest(500, Bytes(10, 0xEE)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::STORE_REQUEST_FAILED);
  EXPECT_EQ(store_->abort_calls.load(), 1);
  EXPECT_EQ(store_->complete_calls.load(), 0);
  EXPECT_EQ(store_->openUploads(), 0u);
  EXPECT_EQ(store_->object("plots", "plot.bin"), original_);
}

TEST_F(ObjectPatcherRoundTripTest, CompleteFailureAborts) {
  auto patcher = makePatcher(128);
  store_->fail_complete = true;

  auto result = patcher.modify("plot.bin", EditRequest(500, Bytes(10, 0xEE)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(store_->abort_calls.load(), 1);
  EXPECT_EQ(store_->openUploads(), 0u);
  EXPECT_EQ(store_->object("plots", "plot.bin"), original_);
}

TEST_F(ObjectPatcherRoundTripTest, CreateFailureNeedsNoAbort) {
  auto patcher = makePatcher(128);
  store_->fail_create = true;

  auto result = patcher.modify("plot.bin", EditRequest(500, Bytes(10, 0xEE)));

  ASSERT_FALSE(result.success);
  EXPECT_TRUE(result.error.is_retryable);
  EXPECT_EQ(store_->abort_calls.load(), 0);
}

TEST_F(ObjectPatcherRoundTripTest, TooManyPartsRejectedBeforeCreate) {
  PatchOptions options;
  options.max_part_size = 10;
  options.max_part_count = 50;
  ObjectPatcher patcher(store_, "plots", options);

  auto result = patcher.modify("plot.bin", EditRequest(0, Bytes(1, 0)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::TOO_MANY_PARTS);
  EXPECT_EQ(store_->create_calls.load(), 0);
}

// =============================================================================
// Call Sequence Tests (mocked store)
// =============================================================================

class ObjectPatcherMockedTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<NiceMock<MockObjectStore>>();
  }

  std::shared_ptr<NiceMock<MockObjectStore>> store_;
};

TEST_F(ObjectPatcherMockedTest, MissingUploadIdFailsWithoutParts) {
  EXPECT_CALL(*store_, headObject("plots", "a.bin")).WillOnce(Return(headOf(100)));
  EXPECT_CALL(*store_, createMultipartUpload("plots", "a.bin"))
    .WillOnce(Return(StoreResult<std::string>::Success("")));
  EXPECT_CALL(*store_, uploadPart(_, _, _, _, _)).Times(0);
  EXPECT_CALL(*store_, uploadPartCopy(_, _, _, _, _, _, _)).Times(0);
  EXPECT_CALL(*store_, abortMultipartUpload(_, _, _)).Times(0);

  ObjectPatcher patcher(store_, "plots");
  auto result = patcher.modify("a.bin", EditRequest(10, Bytes(5, 1)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::MISSING_UPLOAD_ID);
}

TEST_F(ObjectPatcherMockedTest, MissingPartTagAbortsUpload) {
  EXPECT_CALL(*store_, headObject(_, _)).WillOnce(Return(headOf(100)));
  EXPECT_CALL(*store_, createMultipartUpload(_, _))
    .WillOnce(Return(StoreResult<std::string>::Success("u-9")));
  EXPECT_CALL(*store_, uploadPartCopy(_, _, "u-9", 1, "plots", "a.bin", RangeIs(0, 9)))
    .WillOnce(Return(StoreResult<std::string>::Failure(
      {PatchErrorKind::MISSING_PART_TAG, "UploadPartCopy returned no ETag"}
    )));
  EXPECT_CALL(*store_, uploadPart(_, _, _, _, _)).Times(0);
  EXPECT_CALL(*store_, completeMultipartUpload(_, _, _, _)).Times(0);
  EXPECT_CALL(*store_, abortMultipartUpload("plots", "a.bin", "u-9"))
    .WillOnce(Return(StoreStatus::Success()));

  ObjectPatcher patcher(store_, "plots");
  auto result = patcher.modify("a.bin", EditRequest(10, Bytes(5, 1)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::MISSING_PART_TAG);
}

TEST_F(ObjectPatcherMockedTest, HeadFailureStopsEarly) {
  EXPECT_CALL(*store_, headObject(_, _))
    .WillOnce(Return(StoreResult<ObjectInfo>::Failure(
      {PatchErrorKind::STORE_REQUEST_FAILED, "timeout", "RequestTimeout", true}
    )));
  EXPECT_CALL(*store_, createMultipartUpload(_, _)).Times(0);

  ObjectPatcher patcher(store_, "plots");
  auto result = patcher.modify("a.bin", EditRequest(0, Bytes(1, 1)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.store_code, "RequestTimeout");
}

TEST_F(ObjectPatcherMockedTest, TinyPartsOnHugeObjectRejectedBeforeCreate) {
  EXPECT_CALL(*store_, headObject(_, _)).WillOnce(Return(headOf(1000000000000ULL)));
  EXPECT_CALL(*store_, createMultipartUpload(_, _)).Times(0);
  EXPECT_CALL(*store_, abortMultipartUpload(_, _, _)).Times(0);

  PatchOptions options;
  options.max_part_size = 1;
  ObjectPatcher patcher(store_, "plots", options);
  auto result = patcher.modify("a.bin", EditRequest(0, Bytes(1, 1)));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error.kind, PatchErrorKind::TOO_MANY_PARTS);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
