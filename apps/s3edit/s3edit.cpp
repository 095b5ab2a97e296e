// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// s3edit - rewrite a byte range of an S3 object in place

#include <exception>
#include <iostream>

#include "commands.hpp"

#include <s3edit_log_init.hpp>

/**
 * Main entry point for s3edit
 */
int main(int argc, char* argv[]) {
  s3edit::logging::init_logging_default();

  int exit_code = 1;
  try {
    s3edit::app::Commands commands(
      s3edit::patch::PatchClientRegistry::instance(), std::cout, std::cerr
    );
    exit_code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "Error: Unknown exception occurred" << std::endl;
  }

  s3edit::logging::shutdown_logging();
  return exit_code;
}
