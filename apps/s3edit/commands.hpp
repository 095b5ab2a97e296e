// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_APP_COMMANDS_HPP
#define S3EDIT_APP_COMMANDS_HPP

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "patch_client.hpp"

namespace s3edit {
namespace app {

/**
 * Parse a non-negative decimal integer; rejects signs, spaces and overflow
 */
bool parse_u64(const std::string& text, uint64_t& out);

/**
 * Command handler for the s3edit CLI
 */
class Commands {
public:
  /**
   * @param registry Source of the store client (the process-wide one in main)
   */
  Commands(patch::PatchClientRegistry& registry, std::ostream& out, std::ostream& err);

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse argv and dispatch
   * @return Process exit code
   */
  int execute(int argc, char* argv[]);

  /**
   * patch <key> <offset> <file>
   */
  int patch_file(const std::string& key, uint64_t offset, const std::string& path);

  /**
   * fill <key> <offset> <length> <byte>
   */
  int fill(const std::string& key, uint64_t offset, uint64_t length, uint8_t value);

  /**
   * plan <total_length> <offset> <length> [max_part_size]
   */
  int plan(uint64_t total_length, uint64_t offset, uint64_t length, uint64_t max_part_size);

  /**
   * head <key>
   */
  int head(const std::string& key);

  bool verbose() const {
    return verbose_;
  }

private:
  int run_modify(const std::string& key, patch::EditRequest edit);
  void print_usage();

  patch::PatchClientRegistry& registry_;
  std::ostream& out_;
  std::ostream& err_;
  bool verbose_ = false;
};

}  // namespace app
}  // namespace s3edit

#endif  // S3EDIT_APP_COMMANDS_HPP
