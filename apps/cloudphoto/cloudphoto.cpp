// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// cloudphoto - Photo album manager for S3-compatible object storage
// Stores albums as key prefixes and publishes them as a static website

#include <exception>
#include <iostream>

#include "commands.hpp"

/**
 * Main entry point for cloudphoto
 */
int main(int argc, char* argv[]) {
  try {
    // Logging started by a command stops when commands goes out of scope
    cloudphoto::config::Commands commands;
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
