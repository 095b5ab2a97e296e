// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "store_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#define S3EDIT_LOG_COMPONENT "store_config"
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace patch {

namespace {

using Result = StoreResult<S3Config>;

PatchError configError(const std::string& message) {
  return PatchError(PatchErrorKind::CONFIG_LOAD, message);
}

bool readRequiredString(
  const nlohmann::json& doc, const char* name, std::string& out, PatchError& error
) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    error = configError(std::string("missing required field '") + name + "'");
    return false;
  }
  if (!it->is_string()) {
    error = configError(std::string("field '") + name + "' must be a string");
    return false;
  }
  out = it->get<std::string>();
  return true;
}

// Absent and null both leave out untouched
template <typename T>
bool readOptional(const nlohmann::json& doc, const char* name, T& out, PatchError& error) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return true;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    error = configError(std::string("field '") + name + "' has wrong type: " + e.what());
    return false;
  }
  return true;
}

// Accepts only JSON integers in [1, max of T]; floats and out-of-range
// values are rejected instead of converted
template <typename T>
bool readPositive(const nlohmann::json& doc, const char* name, T& out, PatchError& error) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    error = configError(std::string("field '") + name + "' must be an integer");
    return false;
  }
  // nlohmann stores non-negative integers as unsigned
  if (!it->is_number_unsigned() || it->get<uint64_t>() == 0) {
    error = configError(std::string("field '") + name + "' must be positive");
    return false;
  }
  const uint64_t value = it->get<uint64_t>();
  if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    error = configError(
      std::string("field '") + name + "' is out of range: " + std::to_string(value) + " > " +
      std::to_string(std::numeric_limits<T>::max())
    );
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

}  // namespace

PatchOptions S3Config::patchOptions() const {
  PatchOptions options;
  options.max_part_size = max_part_size;
  options.max_part_count = max_part_count;
  options.max_concurrent_parts = max_concurrent_parts;
  return options;
}

StoreResult<S3Config> parseS3Config(const std::string& json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    return Result::Failure(configError(std::string("malformed JSON: ") + e.what()));
  }
  if (!doc.is_object()) {
    return Result::Failure(configError("config must be a JSON object"));
  }

  S3Config config;
  PatchError error;

  if (!readRequiredString(doc, "endpoint", config.endpoint, error) ||
      !readRequiredString(doc, "bucket", config.bucket, error) ||
      !readRequiredString(doc, "region", config.region, error) ||
      !readOptional(doc, "access_key", config.access_key, error) ||
      !readOptional(doc, "secret_key", config.secret_key, error) ||
      !readOptional(doc, "verify_ssl", config.verify_ssl, error) ||
      !readPositive(doc, "connect_timeout_ms", config.connect_timeout_ms, error) ||
      !readPositive(doc, "request_timeout_ms", config.request_timeout_ms, error) ||
      !readPositive(doc, "max_part_size", config.max_part_size, error) ||
      !readPositive(doc, "max_part_count", config.max_part_count, error) ||
      !readPositive(doc, "max_concurrent_parts", config.max_concurrent_parts, error)) {
    return Result::Failure(std::move(error));
  }

  if (config.bucket.empty()) {
    return Result::Failure(configError("field 'bucket' must not be empty"));
  }
  if (config.access_key.empty() != config.secret_key.empty()) {
    return Result::Failure(configError("'access_key' and 'secret_key' must be set together"));
  }

  return Result::Success(std::move(config));
}

StoreResult<S3Config> loadS3ConfigFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.good()) {
    return Result::Failure(configError("config file not found or not readable: " + path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto result = parseS3Config(buffer.str());
  if (!result.success) {
    result.error.message = path + ": " + result.error.message;
    return result;
  }

  S3EDIT_LOG_DEBUG(
    "config loaded" << ::s3edit::logging::kv("path", path)
                    << ::s3edit::logging::kv("bucket", result.value.bucket)
  );
  return result;
}

StoreResult<S3Config> loadS3ConfigFromEnv() {
  const char* path = std::getenv(kConfigPathEnv);
  if (path == nullptr || path[0] == '\0') {
    return Result::Failure(
      configError(std::string("environment variable ") + kConfigPathEnv + " is not set")
    );
  }
  return loadS3ConfigFromFile(path);
}

}  // namespace patch
}  // namespace s3edit
