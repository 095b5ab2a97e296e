// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_STORE_CONFIG_HPP
#define S3EDIT_STORE_CONFIG_HPP

#include <cstdint>
#include <string>

#include "object_patcher.hpp"
#include "patch_error.hpp"

namespace s3edit {
namespace patch {

// Environment variable holding the path of the JSON config file
constexpr const char* kConfigPathEnv = "S3_STORE_CONFIG";

/**
 * S3 configuration options
 *
 * Example file:
 *   {
 *     "endpoint": "http://127.0.0.1:9000",
 *     "bucket": "plots",
 *     "region": "us-east-1",
 *     "access_key": "minioadmin",
 *     "secret_key": "minioadmin"
 *   }
 */
struct S3Config {
  std::string endpoint;  // e.g. "http://127.0.0.1:9000"; empty means AWS S3
  std::string bucket;
  std::string region;

  // Both or neither. When empty, AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
  // are read from the environment.
  std::string access_key;
  std::string secret_key;

  bool verify_ssl = true;
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // 5 minutes for large parts

  uint64_t max_part_size = kDefaultMaxPartSize;
  uint32_t max_part_count = kDefaultMaxPartCount;
  uint32_t max_concurrent_parts = 1;

  bool hasStaticCredentials() const {
    return !access_key.empty() && !secret_key.empty();
  }

  PatchOptions patchOptions() const;
};

/**
 * Parse and validate a JSON config document
 * @return S3Config, or CONFIG_LOAD naming the offending field
 */
StoreResult<S3Config> parseS3Config(const std::string& json_text);

/**
 * Read and parse a JSON config file
 */
StoreResult<S3Config> loadS3ConfigFromFile(const std::string& path);

/**
 * Read the config file named by $S3_STORE_CONFIG
 */
StoreResult<S3Config> loadS3ConfigFromEnv();

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_STORE_CONFIG_HPP
