// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "staging_area.hpp"

#include <filesystem>
#include <fstream>

#define CLOUDPHOTO_LOG_COMPONENT "staging_area"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace site {

namespace fs = std::filesystem;

using ::cloudphoto::logging::kv;

namespace {

void createDirectories(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw StagingError("Cannot create staging directory " + dir.string() + ": " + ec.message());
  }
}

}  // namespace

StagingArea::StagingArea(const std::string& root, bool remove_on_exit)
    : root_(root)
    , remove_on_exit_(remove_on_exit) {
  createDirectories(fs::path(root_) / "photos");
  createDirectories(fs::path(root_) / "pages");
  CLOUDPHOTO_LOG_DEBUG("Staging area ready" << kv("root", root_));
}

StagingArea::~StagingArea() {
  if (remove_on_exit_) {
    clear();
  }
}

bool StagingArea::clear() {
  std::error_code ec;
  fs::remove_all(root_, ec);
  if (ec) {
    CLOUDPHOTO_LOG_WARN(
      "Could not remove staging area" << kv("root", root_) << kv("error", ec.message())
    );
    return false;
  }
  return true;
}

std::string StagingArea::photoPath(const std::string& album, const std::string& filename) {
  fs::path album_dir = fs::path(root_) / "photos" / album;
  createDirectories(album_dir);
  return (album_dir / filename).string();
}

std::string StagingArea::writePage(const std::string& name, const std::string& markup) {
  fs::path path = fs::path(root_) / "pages" / name;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw StagingError("Cannot open " + path.string() + " for writing");
  }
  out << markup;
  out.close();
  if (out.fail()) {
    throw StagingError("Failed to write " + path.string());
  }
  return path.string();
}

}  // namespace site
}  // namespace cloudphoto
