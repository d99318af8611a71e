// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_LOG_INIT_HPP
#define CLOUDPHOTO_LOG_INIT_HPP

#include "cloudphoto_console_sink.hpp"
#include "cloudphoto_file_sink.hpp"
#include "cloudphoto_log_severity.hpp"

namespace cloudphoto {
namespace logging {

/**
 * Logging configuration for the cloudphoto tool.
 * The console sink is quiet by default so that command output is not mixed
 * with diagnostics; the file sink is opt-in.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::warn;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Apply CLOUDPHOTO_LOG_* environment variables to a LoggingConfig.
 *
 *   CLOUDPHOTO_LOG_LEVEL          console and file level
 *   CLOUDPHOTO_LOG_CONSOLE_LEVEL  console level (wins over CLOUDPHOTO_LOG_LEVEL)
 *   CLOUDPHOTO_LOG_FILE_LEVEL     file level (wins over CLOUDPHOTO_LOG_LEVEL)
 *   CLOUDPHOTO_LOG_FILE_ENABLED   true/false, yes/no, on/off, 1/0
 *   CLOUDPHOTO_LOG_FILE_DIR       log file directory
 *   CLOUDPHOTO_LOG_FORMAT         "json" or "text"
 *
 * Unparseable values leave the setting unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Effective configuration for one command run: --verbose lowers the console
 * threshold to info (never raises it), then the environment overrides apply.
 */
LoggingConfig resolve_logging_config(const LoggingConfig& base, bool verbose);

/**
 * Install the console and file sinks. No-op while already initialized.
 */
void init_logging(const LoggingConfig& config);

/**
 * Drain and remove the sinks. Records queued in the async sinks are lost
 * if the process exits without it.
 */
void shutdown_logging();

bool is_logging_initialized();

/**
 * Logging for the duration of one command.
 *
 * Initializes logging on construction unless it is already up, and shuts it
 * down on destruction only in that case.
 */
class LoggingSession {
public:
  explicit LoggingSession(const LoggingConfig& config);
  ~LoggingSession();

  LoggingSession(const LoggingSession&) = delete;
  LoggingSession& operator=(const LoggingSession&) = delete;

  bool owns_logging() const {
    return owns_logging_;
  }

private:
  bool owns_logging_;
};

}  // namespace logging
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_LOG_INIT_HPP
