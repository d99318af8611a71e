// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_COMMANDS_HPP
#define CLOUDPHOTO_COMMANDS_HPP

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

#include "config_parser.hpp"
#include "object_store.hpp"

namespace cloudphoto {
namespace config {

/**
 * Command handler for the cloudphoto CLI
 */
class Commands {
public:
  /**
   * Creates the object store once the configuration is loaded
   */
  using StoreFactory =
    std::function<std::shared_ptr<store::IObjectStore>(const store::StoreConfig& config)>;

  Commands();
  Commands(std::ostream& out, std::ostream& err, std::istream& in, StoreFactory store_factory);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  /**
   * Use a configuration file other than the default one
   */
  void set_config_path(const std::string& path) {
    config_path_ = path;
  }

  /**
   * Execute list command. Always returns 0.
   */
  int list();

  /**
   * Execute upload command
   */
  int upload(const std::string& album, const std::string& path);

  /**
   * Execute delete command
   */
  int remove(const std::string& album);

  /**
   * Execute mksite command
   */
  int mksite();

  /**
   * Execute init command: prompt for bucket and credentials, save the
   * configuration and make sure the bucket exists.
   */
  int init();

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

private:
  std::ostream& out_;
  std::ostream& err_;
  std::istream& in_;
  StoreFactory store_factory_;
  std::string config_path_;
  bool verbose_;
  CloudphotoConfig config_;
  std::unique_ptr<logging::LoggingSession> logging_session_;

  std::string config_path() const;

  /**
   * Load and validate the configuration file into config_
   */
  bool load_config();

  /**
   * Start logging for this run; it stops when the Commands object goes away
   */
  void setup_logging();

  std::shared_ptr<store::IObjectStore> open_store();

  /**
   * Ask for one value; an empty answer keeps current
   */
  std::string prompt(const std::string& label, const std::string& current, bool secret = false);

  void print_usage();
};

}  // namespace config
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_COMMANDS_HPP
