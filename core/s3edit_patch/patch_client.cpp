// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "patch_client.hpp"

#include <utility>

#include "s3_object_store.hpp"

#define S3EDIT_LOG_COMPONENT "patch_client"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

using ::s3edit::logging::kv;

PatchClientRegistry::PatchClientRegistry(ConfigLoader loader, StoreFactory factory)
    : loader_(std::move(loader))
    , factory_(std::move(factory)) {
  if (!loader_) {
    loader_ = &loadS3ConfigFromEnv;
  }
  if (!factory_) {
    factory_ = [](const S3Config& config) -> std::shared_ptr<IObjectStore> {
      return std::make_shared<S3ObjectStore>(config);
    };
  }
}

PatchClientRegistry& PatchClientRegistry::instance() {
  static PatchClientRegistry registry;
  return registry;
}

StoreResult<std::shared_ptr<ObjectPatcher>> PatchClientRegistry::get() {
  using Result = StoreResult<std::shared_ptr<ObjectPatcher>>;

  std::lock_guard<std::mutex> lock(mutex_);
  if (patcher_) {
    return Result::Success(patcher_);
  }

  auto loaded = loader_();
  if (!loaded.success) {
    S3EDIT_LOG_ERROR("client init failed" << kv("error", loaded.error.describe()));
    return Result::Failure(std::move(loaded.error));
  }
  const S3Config& config = loaded.value;

  auto store = factory_(config);
  if (!store) {
    return Result::Failure({PatchErrorKind::CONFIG_LOAD, "store factory returned no client"});
  }

  patcher_ = std::make_shared<ObjectPatcher>(std::move(store), config.bucket, config.patchOptions());
  S3EDIT_LOG_INFO(
    "client initialized" << kv("endpoint", config.endpoint) << kv("bucket", config.bucket)
                         << kv("region", config.region)
  );
  return Result::Success(patcher_);
}

bool PatchClientRegistry::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return patcher_ != nullptr;
}

PatchResult modify(const std::string& key, EditRequest edit) {
  auto client = PatchClientRegistry::instance().get();
  if (!client.success) {
    return PatchResult::Failure(std::move(client.error));
  }
  return client.value->modify(key, std::move(edit));
}

}  // namespace patch
}  // namespace s3edit
