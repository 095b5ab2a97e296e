// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>

#include "segment_planner.hpp"

#define S3EDIT_LOG_COMPONENT "s3edit_cli"
#include <s3edit_log_init.hpp>
#include <s3edit_log_macros.hpp>

namespace s3edit {
namespace app {

bool parse_u64(const std::string& text, uint64_t& out) {
  if (text.empty() || text.size() > 20) {
    return false;
  }
  uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

Commands::Commands(patch::PatchClientRegistry& registry, std::ostream& out, std::ostream& err)
    : registry_(registry)
    , out_(out)
    , err_(err) {}

void Commands::print_usage() {
  out_ << "Usage: s3edit <command> [options] [args]\n"
       << "\n"
       << "Rewrite a byte range of an existing S3 object in place.\n"
       << "The store is configured by the JSON file named in $" << patch::kConfigPathEnv << ".\n"
       << "\n"
       << "Commands:\n"
       << "  patch <key> <offset> <file>          Write the file's bytes at offset\n"
       << "  fill <key> <offset> <length> <byte>  Write length copies of byte (0-255)\n"
       << "  plan <total> <offset> <length> [max_part_size]\n"
       << "                                       Print the part plan, no store access\n"
       << "  head <key>                           Print object length and ETag\n"
       << "  help                                 Show this help message\n"
       << "\n"
       << "Options:\n"
       << "  -v, --verbose    Debug logging\n";
}

int Commands::execute(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else {
      args.push_back(arg);
    }
  }

  if (verbose_) {
    logging::LoggingConfig config;
    config.console_level = logging::severity_level::debug;
    logging::reconfigure_logging(config);
  }

  if (args.empty() || args[0] == "help" || args[0] == "-h" || args[0] == "--help") {
    print_usage();
    return 0;
  }

  const std::string& command = args[0];
  uint64_t offset = 0;
  uint64_t length = 0;

  if (command == "patch" && args.size() == 4) {
    if (!parse_u64(args[2], offset)) {
      err_ << "Error: invalid offset '" << args[2] << "'" << std::endl;
      return 1;
    }
    return patch_file(args[1], offset, args[3]);
  } else if (command == "fill" && args.size() == 5) {
    uint64_t value = 0;
    if (!parse_u64(args[2], offset) || !parse_u64(args[3], length) || !parse_u64(args[4], value) ||
        value > 255) {
      err_ << "Error: fill expects <key> <offset> <length> <byte 0-255>" << std::endl;
      return 1;
    }
    return fill(args[1], offset, length, static_cast<uint8_t>(value));
  } else if (command == "plan" && (args.size() == 4 || args.size() == 5)) {
    uint64_t total = 0;
    uint64_t max_part_size = patch::kDefaultMaxPartSize;
    if (!parse_u64(args[1], total) || !parse_u64(args[2], offset) ||
        !parse_u64(args[3], length) || (args.size() == 5 && !parse_u64(args[4], max_part_size))) {
      err_ << "Error: plan expects non-negative integers" << std::endl;
      return 1;
    }
    return plan(total, offset, length, max_part_size);
  } else if (command == "head" && args.size() == 2) {
    return head(args[1]);
  }

  err_ << "Error: unknown command or wrong arguments '" << command << "'" << std::endl;
  print_usage();
  return 1;
}

int Commands::run_modify(const std::string& key, patch::EditRequest edit) {
  auto client = registry_.get();
  if (!client.success) {
    err_ << "Error: " << client.error.describe() << std::endl;
    return 1;
  }

  auto result = client.value->modify(key, std::move(edit));
  if (!result.success) {
    err_ << "Error: " << result.error.describe() << std::endl;
    return 1;
  }
  out_ << "Patched " << key << std::endl;
  return 0;
}

int Commands::patch_file(const std::string& key, uint64_t offset, const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    err_ << "Error: cannot open " << path << std::endl;
    return 1;
  }
  patch::Bytes payload((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    err_ << "Error: failed reading " << path << std::endl;
    return 1;
  }

  S3EDIT_LOG_DEBUG("payload read" << logging::kv("path", path) << logging::kv("bytes", payload.size()));
  return run_modify(key, patch::EditRequest(offset, std::move(payload)));
}

int Commands::fill(const std::string& key, uint64_t offset, uint64_t length, uint8_t value) {
  patch::Bytes payload(static_cast<size_t>(length), value);
  return run_modify(key, patch::EditRequest(offset, std::move(payload)));
}

int Commands::plan(uint64_t total_length, uint64_t offset, uint64_t length, uint64_t max_part_size) {
  auto planned =
    patch::planLayout(total_length, max_part_size, offset, length, patch::kDefaultMaxPartCount);
  if (!planned.success) {
    err_ << "Error: " << planned.error.describe() << std::endl;
    return 1;
  }

  out_ << patch::describePlan(planned.value);
  out_ << planned.value.size() << " parts" << std::endl;
  return 0;
}

int Commands::head(const std::string& key) {
  auto client = registry_.get();
  if (!client.success) {
    err_ << "Error: " << client.error.describe() << std::endl;
    return 1;
  }

  auto described = client.value->describe(key);
  if (!described.success) {
    err_ << "Error: " << described.error.describe() << std::endl;
    return 1;
  }
  const auto& object = described.value;
  out_ << object.bucket << "/" << object.key << " " << object.total_length << " bytes etag "
       << object.etag << std::endl;
  return 0;
}

}  // namespace app
}  // namespace s3edit
