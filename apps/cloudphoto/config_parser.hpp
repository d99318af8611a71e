// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_CONFIG_PARSER_HPP
#define CLOUDPHOTO_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include <cloudphoto_log_init.hpp>

#include "s3_object_store.hpp"
#include "site_config.hpp"

namespace cloudphoto {
namespace config {

/**
 * Complete configuration of the cloudphoto tool
 */
struct CloudphotoConfig {
  store::StoreConfig storage;
  site::SiteConfig site;
  logging::LoggingConfig logging;
};

/**
 * Configuration file path: $CLOUDPHOTO_CONFIG if set, otherwise
 * ~/.config/cloudphoto/cloudphotorc.yaml
 */
std::string default_config_path();

/**
 * Expand a leading "~" to $HOME
 */
std::string expand_home(const std::string& path);

/**
 * Fill empty credentials from AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
 */
void apply_credential_env_fallbacks(store::StoreConfig& storage);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, CloudphotoConfig& config);

  /**
   * Load configuration from YAML string. Keys absent from the document keep
   * the values already in config.
   */
  bool load_from_string(const std::string& yaml_content, CloudphotoConfig& config);

  /**
   * Save configuration to YAML file, creating parent directories
   */
  bool save_to_file(const std::string& path, const CloudphotoConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const CloudphotoConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_storage(const YAML::Node& node, store::StoreConfig& storage);
  bool parse_site(const YAML::Node& node, site::SiteConfig& site);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace config
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_CONFIG_PARSER_HPP
