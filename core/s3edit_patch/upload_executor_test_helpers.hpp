// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_UPLOAD_EXECUTOR_TEST_HELPERS_HPP
#define S3EDIT_UPLOAD_EXECUTOR_TEST_HELPERS_HPP

// This header is for testing only - exposes internal helpers of
// upload_executor.cpp

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace s3edit {
namespace patch {

/**
 * Start up to count part workers
 *
 * Stops at the first spawn that throws std::system_error and returns the
 * threads already running; the caller joins them. An empty result means no
 * worker could be started.
 *
 * @param count Number of workers wanted
 * @param spawn Starts worker i
 */
std::vector<std::thread> startWorkersImpl(
  size_t count, const std::function<std::thread(size_t)>& spawn
);

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_UPLOAD_EXECUTOR_TEST_HELPERS_HPP
