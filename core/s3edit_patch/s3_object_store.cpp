// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/UploadPartCopyRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdlib>
#include <mutex>

#include "s3_object_store_test_helpers.hpp"

#define S3EDIT_LOG_COMPONENT "s3_object_store"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

namespace {

constexpr const char* kAllocationTag = "s3edit";

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every SDK object. Stores share one
// reference-counted initialization.

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ == 0) {
      options_ = Aws::SDKOptions();
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0) {
      Aws::ShutdownAPI(options_);
    }
  }

private:
  AwsSdkManager() = default;

  std::mutex mutex_;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

bool startsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

template <typename Outcome>
PatchError toPatchError(
  const Outcome& outcome, bool not_found_is_missing_object, const std::string& context
) {
  const auto& error = outcome.GetError();
  bool missing_key = error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
                     error.GetErrorType() == Aws::S3::S3Errors::RESOURCE_NOT_FOUND;
  int http_status = missing_key ? 404 : static_cast<int>(error.GetResponseCode());
  return classifyStoreError(
    http_status, error.GetExceptionName(), error.GetMessage(), error.ShouldRetry(),
    not_found_is_missing_object, context
  );
}

}  // namespace

// =============================================================================
// Helpers exposed through s3_object_store_test_helpers.hpp
// =============================================================================

std::string makeCopySource(const std::string& bucket, const std::string& key) {
  std::string source = bucket;
  size_t start = 0;
  while (start <= key.size()) {
    size_t slash = key.find('/', start);
    size_t stop = slash == std::string::npos ? key.size() : slash;
    source += '/';
    source += Aws::Utils::StringUtils::URLEncode(key.substr(start, stop - start).c_str());
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return source;
}

PatchError classifyStoreError(
  int http_status, const std::string& code, const std::string& message, bool sdk_retryable,
  bool not_found_is_missing_object, const std::string& context
) {
  if (not_found_is_missing_object && (http_status == 404 || code == "NoSuchKey")) {
    return PatchError(PatchErrorKind::OBJECT_NOT_FOUND, context + ": object does not exist", code);
  }

  std::string text = context + ": ";
  text += message.empty() ? "request failed with HTTP " + std::to_string(http_status) : message;
  bool retryable = isRetryableErrorCode(code) || sdk_retryable;
  return PatchError(PatchErrorKind::STORE_REQUEST_FAILED, text, code, retryable);
}

std::string unquoteEtag(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must go before the SDK itself may be shut down
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    std::string endpoint = config.endpoint;
    if (!endpoint.empty() && endpoint.back() == '/') {
      endpoint.pop_back();
    }
    if (startsWith(endpoint, "http://")) {
      client_config.scheme = Aws::Http::Scheme::HTTP;
    } else {
      client_config.scheme = Aws::Http::Scheme::HTTPS;
    }
    if (!endpoint.empty()) {
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    // No SDK retries: every failure surfaces to the modify caller
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      kAllocationTag, 0
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (MinIO, ...) need path-style addressing
    bool use_virtual_addressing = config.endpoint.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (!impl_->config.hasStaticCredentials()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
}

S3ObjectStore::~S3ObjectStore() = default;

StoreResult<ObjectInfo> S3ObjectStore::headObject(
  const std::string& bucket, const std::string& key
) {
  using Result = StoreResult<ObjectInfo>;

  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    return Result::Failure(toPatchError(outcome, true, "HeadObject " + key));
  }

  const auto& head = outcome.GetResult();
  ObjectInfo info;
  info.content_length = static_cast<uint64_t>(head.GetContentLength());
  info.etag = unquoteEtag(head.GetETag());
  return Result::Success(std::move(info));
}

StoreResult<std::string> S3ObjectStore::createMultipartUpload(
  const std::string& bucket, const std::string& key
) {
  using Result = StoreResult<std::string>;

  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return Result::Failure(toPatchError(outcome, false, "CreateMultipartUpload " + key));
  }

  std::string upload_id = outcome.GetResult().GetUploadId();
  if (upload_id.empty()) {
    return Result::Failure(
      {PatchErrorKind::MISSING_UPLOAD_ID, key + ": CreateMultipartUpload returned no upload id"}
    );
  }
  return Result::Success(std::move(upload_id));
}

StoreResult<std::string> S3ObjectStore::uploadPart(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  int part_number, Bytes body
) {
  using Result = StoreResult<std::string>;

  // The request reads straight from body; both live until the call returns
  Aws::Utils::Stream::PreallocatedStreamBuf stream_buf(body.data(), body.size());
  auto stream = Aws::MakeShared<Aws::IOStream>(kAllocationTag, &stream_buf);

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(body.size()));
  request.SetBody(stream);

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return Result::Failure(
      toPatchError(outcome, false, "UploadPart " + key + " part " + std::to_string(part_number))
    );
  }

  std::string etag = outcome.GetResult().GetETag();
  if (etag.empty()) {
    return Result::Failure(
      {PatchErrorKind::MISSING_PART_TAG,
       key + ": UploadPart returned no ETag for part " + std::to_string(part_number)}
    );
  }
  return Result::Success(std::move(etag));
}

StoreResult<std::string> S3ObjectStore::uploadPartCopy(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  int part_number, const std::string& source_bucket, const std::string& source_key,
  const ByteRange& range
) {
  using Result = StoreResult<std::string>;

  Aws::S3::Model::UploadPartCopyRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetCopySource(makeCopySource(source_bucket, source_key));
  request.SetCopySourceRange(range.toHeader());

  auto outcome = impl_->client->UploadPartCopy(request);
  if (!outcome.IsSuccess()) {
    return Result::Failure(toPatchError(
      outcome, false, "UploadPartCopy " + key + " part " + std::to_string(part_number)
    ));
  }

  std::string etag = outcome.GetResult().GetCopyPartResult().GetETag();
  if (etag.empty()) {
    return Result::Failure(
      {PatchErrorKind::MISSING_PART_TAG,
       key + ": UploadPartCopy returned no ETag for part " + std::to_string(part_number)}
    );
  }
  return Result::Success(std::move(etag));
}

StoreStatus S3ObjectStore::completeMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload upload;
  for (const auto& part : parts) {
    upload.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.part_number).WithETag(part.tag)
    );
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(std::move(upload));

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StoreStatus::Failure(toPatchError(outcome, false, "CompleteMultipartUpload " + key));
  }
  return StoreStatus::Success();
}

StoreStatus S3ObjectStore::abortMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StoreStatus::Failure(toPatchError(outcome, false, "AbortMultipartUpload " + key));
  }
  S3EDIT_LOG_DEBUG("multipart upload aborted" << kv("key", key) << kv("upload_id", upload_id));
  return StoreStatus::Success();
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint;
}

const std::string& S3ObjectStore::region() const {
  return impl_->config.region;
}

}  // namespace patch
}  // namespace s3edit
