// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#define CLOUDPHOTO_LOG_COMPONENT "config_parser"
#include <cloudphoto_log_macros.hpp>

namespace cloudphoto {
namespace config {

namespace fs = std::filesystem;

using ::cloudphoto::logging::kv;

std::string default_config_path() {
  const char* env_path = std::getenv("CLOUDPHOTO_CONFIG");
  if (env_path && env_path[0] != '\0') {
    return env_path;
  }
  return expand_home("~/.config/cloudphoto/cloudphotorc.yaml");
}

std::string expand_home(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path;  // ~user is not supported
  }
  const char* home = std::getenv("HOME");
  if (!home || home[0] == '\0') {
    return path;
  }
  return std::string(home) + path.substr(1);
}

void apply_credential_env_fallbacks(store::StoreConfig& storage) {
  if (storage.access_key.empty()) {
    const char* access_key = std::getenv("AWS_ACCESS_KEY_ID");
    if (access_key) {
      storage.access_key = access_key;
    }
  }
  if (storage.secret_key.empty()) {
    const char* secret_key = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (secret_key) {
      storage.secret_key = secret_key;
    }
  }
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, CloudphotoConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, CloudphotoConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["storage"] && !parse_storage(node["storage"], config.storage)) {
      return false;
    }
    if (node["site"] && !parse_site(node["site"], config.site)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::save_to_file(const std::string& path, const CloudphotoConfig& config) {
  try {
    YAML::Node node;

    // Storage
    node["storage"]["bucket"] = config.storage.bucket;
    node["storage"]["endpoint_url"] = config.storage.endpoint_url;
    node["storage"]["region"] = config.storage.region;
    node["storage"]["access_key"] = config.storage.access_key;
    node["storage"]["secret_key"] = config.storage.secret_key;

    // Site
    node["site"]["website_domain"] = config.site.website_domain;
    node["site"]["staging_dir"] = config.site.staging_dir;
    node["site"]["title"] = config.site.title;
    node["site"]["keep_staging"] = config.site.keep_staging;

    // Logging
    node["logging"]["console"]["level"] = logging::severity_name(config.logging.console_level);
    node["logging"]["console"]["colors"] = config.logging.console_colors;
    node["logging"]["file"]["enabled"] = config.logging.file_enabled;
    node["logging"]["file"]["level"] = logging::severity_name(config.logging.file_level);
    node["logging"]["file"]["directory"] = config.logging.file_config.directory;
    node["logging"]["file"]["format"] = config.logging.file_config.format_json ? "json" : "text";

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent);
    }

    std::ofstream file(path);
    if (!file) {
      last_error_ = "Cannot open config file for writing: " + path;
      return false;
    }
    file << node << "\n";
    if (!file.good()) {
      last_error_ = "Failed to write config file: " + path;
      return false;
    }
    fs::permissions(
      path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace
    );
    return true;
  } catch (const std::exception& e) {
    last_error_ = "Failed to save config: " + std::string(e.what());
    CLOUDPHOTO_LOG_ERROR("Failed to save config" << kv("error", e.what()));
    return false;
  }
}

bool ConfigParser::validate(const CloudphotoConfig& config, std::string& error_msg) {
  if (config.storage.bucket.empty()) {
    error_msg = "storage.bucket is required";
    return false;
  }
  if (config.storage.access_key.empty()) {
    error_msg = "storage.access_key is required (or set AWS_ACCESS_KEY_ID)";
    return false;
  }
  if (config.storage.secret_key.empty()) {
    error_msg = "storage.secret_key is required (or set AWS_SECRET_ACCESS_KEY)";
    return false;
  }
  if (config.storage.endpoint_url.empty()) {
    error_msg = "storage.endpoint_url must not be empty";
    return false;
  }
  if (config.site.website_domain.empty()) {
    error_msg = "site.website_domain must not be empty";
    return false;
  }
  if (config.site.staging_dir.empty()) {
    error_msg = "site.staging_dir must not be empty";
    return false;
  }
  return true;
}

bool ConfigParser::parse_storage(const YAML::Node& node, store::StoreConfig& storage) {
  if (node["bucket"]) {
    storage.bucket = node["bucket"].as<std::string>();
  }
  if (node["endpoint_url"]) {
    storage.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    storage.region = node["region"].as<std::string>();
  }
  if (node["access_key"]) {
    storage.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    storage.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["verify_ssl"]) {
    storage.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["part_size_mb"]) {
    storage.part_size = node["part_size_mb"].as<uint64_t>() * 1024 * 1024;
  }
  if (node["max_retries"]) {
    storage.max_sdk_retries = node["max_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_site(const YAML::Node& node, site::SiteConfig& site) {
  if (node["website_domain"]) {
    site.website_domain = node["website_domain"].as<std::string>();
  }
  if (node["staging_dir"]) {
    site.staging_dir = expand_home(node["staging_dir"].as<std::string>());
  }
  if (node["title"]) {
    site.title = node["title"].as<std::string>();
  }
  if (node["keep_staging"]) {
    site.keep_staging = node["keep_staging"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  // Console sink
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["level"]) {
      std::string level = console["level"].as<std::string>();
      auto parsed = logging::parse_severity_level(level);
      if (!parsed) {
        last_error_ = "Invalid logging.console.level: " + level;
        return false;
      }
      logging.console_level = *parsed;
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
  }

  // File sink
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      std::string level = file["level"].as<std::string>();
      auto parsed = logging::parse_severity_level(level);
      if (!parsed) {
        last_error_ = "Invalid logging.file.level: " + level;
        return false;
      }
      logging.file_level = *parsed;
    }
    if (file["directory"]) {
      logging.file_config.directory = expand_home(file["directory"].as<std::string>());
    }
    if (file["format"]) {
      std::string format = file["format"].as<std::string>();
      if (format != "json" && format != "text") {
        last_error_ = "Invalid logging.file.format: " + format + " (expected json or text)";
        return false;
      }
      logging.file_config.format_json = (format == "json");
    }
    if (file["rotation_size_mb"]) {
      logging.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.file_config.max_files = file["max_files"].as<int>();
    }
  }
  return true;
}

}  // namespace config
}  // namespace cloudphoto
