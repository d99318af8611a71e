// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include "album_repository.hpp"
#include "publisher.hpp"
#include "s3_object_store.hpp"
#include "site_generator.hpp"
#include "staging_area.hpp"

#define CLOUDPHOTO_LOG_COMPONENT "cloudphoto"
#include <cloudphoto_log_init.hpp>
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace config {

namespace fs = std::filesystem;

using ::cloudphoto::logging::kv;

namespace {

std::shared_ptr<store::IObjectStore> make_s3_store(const store::StoreConfig& config) {
  return std::make_shared<store::S3ObjectStore>(config);
}

}  // namespace

Commands::Commands()
    : Commands(std::cout, std::cerr, std::cin, make_s3_store) {}

Commands::Commands(
  std::ostream& out, std::ostream& err, std::istream& in, StoreFactory store_factory
)
    : out_(out)
    , err_(err)
    , in_(in)
    , store_factory_(std::move(store_factory))
    , verbose_(false) {}

int Commands::list() {
  auto store = open_store();
  album::AlbumRepository repository(*store);

  auto result = repository.listAlbums();
  if (result.status != album::AlbumRepository::Status::Ok) {
    CLOUDPHOTO_LOG_ERROR(
      "Failed to list albums" << kv("bucket", store->bucket()) << kv("error", result.message)
    );
    return 0;
  }

  if (result.albums.empty()) {
    out_ << "Photo albums not found" << std::endl;
    return 0;
  }
  for (const auto& name : result.albums) {
    out_ << name << std::endl;
  }
  return 0;
}

int Commands::upload(const std::string& album, const std::string& path) {
  CLOUDPHOTO_LOG_SCOPED_CONTEXT("upload", album);

  auto store = open_store();
  album::AlbumRepository repository(*store);

  auto result = repository.uploadAlbum(album, path);
  switch (result.status) {
    case album::AlbumRepository::Status::Ok:
      if (verbose_) {
        out_ << "Uploaded " << result.object_count << " photos to album " << album << std::endl;
      }
      return 0;
    case album::AlbumRepository::Status::PathNotFound:
      out_ << "Warning: " << result.message << std::endl;
      return 1;
    default:
      err_ << "Error: " << result.message << std::endl;
      return 1;
  }
}

int Commands::remove(const std::string& album) {
  CLOUDPHOTO_LOG_SCOPED_CONTEXT("delete", album);

  auto store = open_store();
  album::AlbumRepository repository(*store);

  auto result = repository.deleteAlbum(album);
  switch (result.status) {
    case album::AlbumRepository::Status::Ok:
      out_ << result.message << std::endl;
      return 0;
    case album::AlbumRepository::Status::AlbumNotFound:
      out_ << "Warning: " << result.message << std::endl;
      return 0;
    default:
      err_ << "Error: " << result.message << std::endl;
      return 1;
  }
}

int Commands::mksite() {
  auto store = open_store();
  album::AlbumRepository repository(*store);
  site::Publisher publisher(*store, config_.site.website_domain);

  std::unique_ptr<site::StagingArea> staging;
  try {
    staging = std::make_unique<site::StagingArea>(
      config_.site.staging_dir, !config_.site.keep_staging
    );
  } catch (const site::StagingError& e) {
    err_ << "Error: " << e.what() << std::endl;
    return 1;
  }

  site::SiteGenerator generator(*store, repository, *staging, config_.site, publisher.url());
  auto generated = generator.generate();
  if (!generated.ok()) {
    CLOUDPHOTO_LOG_ERROR(
      "Site generation failed" << kv("status", site::SiteGenerator::statusName(generated.status))
                               << kv("error", generated.message)
    );
    err_ << "Error: " << generated.message << std::endl;
    return 1;
  }

  auto published = publisher.publish();
  if (published.status != site::Publisher::Status::Ok) {
    err_ << "Error: " << published.message << std::endl;
    return 1;
  }

  out_ << published.url << std::endl;
  return 0;
}

int Commands::init() {
  std::string path = config_path();

  std::error_code ec;
  if (fs::exists(path, ec)) {
    ConfigParser parser;
    if (!parser.load_from_file(path, config_)) {
      err_ << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }

  config_.storage.bucket = prompt("Bucket name", config_.storage.bucket);
  config_.storage.access_key = prompt("Access key id", config_.storage.access_key);
  config_.storage.secret_key = prompt("Secret access key", config_.storage.secret_key, true);

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    err_ << "Error: " << error_msg << std::endl;
    return 1;
  }

  ConfigParser parser;
  if (!parser.save_to_file(path, config_)) {
    err_ << "Error: " << parser.get_last_error() << std::endl;
    return 1;
  }
  out_ << "Configuration saved to " << path << std::endl;

  auto store = open_store();
  auto bucket = store->ensureBucketExists();
  if (!bucket.success) {
    err_ << "Error: Bucket " << config_.storage.bucket
         << " is not available: " << bucket.error_message << std::endl;
    return 1;
  }
  CLOUDPHOTO_LOG_INFO("Bucket ready" << kv("bucket", config_.storage.bucket));
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::vector<std::string> positional;
  std::string album;
  std::string path = ".";
  bool help = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (arg == "--help" || arg == "-h") {
      help = true;
    } else if (arg == "--config" || arg == "--album" || arg == "--path") {
      if (i + 1 >= argc) {
        err_ << "Error: " << arg << " requires a value" << std::endl;
        return 1;
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        config_path_ = value;
      } else if (arg == "--album") {
        album = value;
      } else {
        path = value;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      err_ << "Error: Unknown option '" << arg << "'" << std::endl;
      print_usage();
      return 1;
    } else {
      positional.push_back(arg);
    }
  }

  std::string command = positional.empty() ? "" : positional[0];
  if (help || command.empty() || command == "help") {
    print_usage();
    return 0;
  }

  if (command == "init") {
    setup_logging();
    return init();
  }

  if (command != "list" && command != "upload" && command != "delete" && command != "mksite") {
    err_ << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }

  // delete takes the album as positional argument, --album is accepted too
  if (command == "delete" && album.empty() && positional.size() > 1) {
    album = positional[1];
  }
  if ((command == "upload" || command == "delete") && album.empty()) {
    err_ << "Error: " << command << " requires an album name" << std::endl;
    print_usage();
    return 1;
  }

  if (!load_config()) {
    // list reports problems but never fails the process
    return command == "list" ? 0 : 1;
  }
  setup_logging();
  CLOUDPHOTO_LOG_DEBUG(
    "Running command" << kv("command", command) << kv("bucket", config_.storage.bucket)
  );

  if (command == "list") {
    return list();
  } else if (command == "upload") {
    return upload(album, path);
  } else if (command == "delete") {
    return remove(album);
  } else {
    return mksite();
  }
}

std::string Commands::config_path() const {
  return config_path_.empty() ? default_config_path() : expand_home(config_path_);
}

bool Commands::load_config() {
  std::string path = config_path();
  ConfigParser parser;
  if (!parser.load_from_file(path, config_)) {
    err_ << "Error: " << parser.get_last_error() << std::endl;
    err_ << "Run 'cloudphoto init' to create a configuration." << std::endl;
    return false;
  }

  apply_credential_env_fallbacks(config_.storage);

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    err_ << "Error: Invalid configuration " << path << ": " << error_msg << std::endl;
    return false;
  }
  return true;
}

void Commands::setup_logging() {
  if (logging_session_) {
    return;
  }
  logging_session_ = std::make_unique<logging::LoggingSession>(
    logging::resolve_logging_config(config_.logging, verbose_)
  );
}

std::shared_ptr<store::IObjectStore> Commands::open_store() {
  return store_factory_(config_.storage);
}

std::string Commands::prompt(
  const std::string& label, const std::string& current, bool secret
) {
  out_ << label;
  if (!current.empty()) {
    out_ << " [" << (secret ? std::string("****") : current) << "]";
  }
  out_ << ": " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer) || answer.empty()) {
    return current;
  }
  return answer;
}

void Commands::print_usage() {
  out_ << "Usage: cloudphoto [--config PATH] [--verbose] <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  list                                List photo albums\n"
       << "  upload --album NAME [--path DIR]    Upload .jpg/.jpeg files of DIR (default: .)\n"
       << "  delete ALBUM                        Delete a photo album\n"
       << "  mksite                              Generate and publish the photo website\n"
       << "  init                                Configure bucket and credentials\n"
       << "  help                                Show this message\n"
       << "\n"
       << "Options:\n"
       << "  --config PATH   Configuration file (default: " << default_config_path() << ")\n"
       << "  --verbose, -v   Log progress to the console\n";
  out_.flush();
}

}  // namespace config
}  // namespace cloudphoto
