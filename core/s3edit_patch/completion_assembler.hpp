// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_COMPLETION_ASSEMBLER_HPP
#define S3EDIT_COMPLETION_ASSEMBLER_HPP

#include <string>
#include <vector>

#include "object_store_interfaces.hpp"
#include "patch_types.hpp"

namespace s3edit {
namespace patch {

/**
 * Build the completion list from ordered part results.
 * Entry i gets part number i + 1 regardless of the number recorded in
 * results[i].
 */
std::vector<CompletedPart> assembleCompletedParts(const std::vector<PartResult>& results);

/**
 * Turns collected part tags into the complete-multipart-upload call
 */
class CompletionAssembler {
public:
  explicit CompletionAssembler(IObjectStore& store)
      : store_(store) {}

  StoreStatus complete(
    const ObjectDescriptor& object, const std::string& upload_id,
    const std::vector<PartResult>& results
  );

private:
  IObjectStore& store_;
};

}  // namespace patch
}  // namespace s3edit

#endif  // S3EDIT_COMPLETION_ASSEMBLER_HPP
