// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_PATCH_CLIENT_HPP
#define S3EDIT_PATCH_CLIENT_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "object_patcher.hpp"
#include "object_store_interfaces.hpp"
#include "patch_error.hpp"
#include "store_config.hpp"

namespace s3edit {
namespace patch {

using ConfigLoader = std::function<StoreResult<S3Config>()>;
using StoreFactory = std::function<std::shared_ptr<IObjectStore>(const S3Config&)>;

/**
 * Builds the store client at most once and hands out the shared patcher
 *
 * The first successful load wins and is kept for the lifetime of the
 * registry. A failed load is not cached: the next get() tries again.
 * Concurrent first callers block until the winner finishes.
 */
class PatchClientRegistry {
public:
  /**
   * @param loader Source of the configuration (default: $S3_STORE_CONFIG)
   * @param factory Builds the store from the config (default: S3ObjectStore)
   */
  explicit PatchClientRegistry(ConfigLoader loader = {}, StoreFactory factory = {});

  // Non-copyable, non-movable
  PatchClientRegistry(const PatchClientRegistry&) = delete;
  PatchClientRegistry& operator=(const PatchClientRegistry&) = delete;
  PatchClientRegistry(PatchClientRegistry&&) = delete;
  PatchClientRegistry& operator=(PatchClientRegistry&&) = delete;

  /**
   * Process-wide registry used by modify()
   */
  static PatchClientRegistry& instance();

  /**
   * Patcher bound to the configured bucket, initialized on first use
   */
  StoreResult<std::shared_ptr<ObjectPatcher>> get();

  bool initialized() const;

private:
  ConfigLoader loader_;
  StoreFactory factory_;

  mutable std::mutex mutex_;
  std::shared_ptr<ObjectPatcher> patcher_;
};

/**
 * Replace edit.payload.size() bytes of key at edit.offset in the bucket
 * named by $S3_STORE_CONFIG
 */
PatchResult modify(const std::string& key, EditRequest edit);

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_PATCH_CLIENT_HPP
