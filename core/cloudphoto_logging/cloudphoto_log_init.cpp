// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cloudphoto_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <cctype>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>

#include "cloudphoto_log_macros.hpp"

namespace cloudphoto {
namespace logging {

namespace {

// Guards the sink pointers below
std::mutex g_state_mutex;
boost::shared_ptr<async_console_sink_t> g_console_sink;
boost::shared_ptr<async_file_sink_t> g_file_sink;
bool g_initialized = false;

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string lowered(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

std::optional<bool> parse_switch(const std::string& raw) {
  std::string value = lowered(raw);
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return false;
  }
  return std::nullopt;
}

// Level variables, most general first so that specific ones win
struct LevelVariable {
  const char* name;
  bool console;
  bool file;
};

const LevelVariable kLevelVariables[] = {
  {"CLOUDPHOTO_LOG_LEVEL", true, true},
  {"CLOUDPHOTO_LOG_CONSOLE_LEVEL", true, false},
  {"CLOUDPHOTO_LOG_FILE_LEVEL", false, true},
};

template<typename SinkPtr>
void stop_sink(SinkPtr& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

logger_type& get_logger() {
  static logger_type logger;
  return logger;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& variable : kLevelVariables) {
    auto value = env_value(variable.name);
    if (!value) {
      continue;
    }
    auto level = parse_severity_level(*value);
    if (!level) {
      continue;
    }
    if (variable.console) {
      config.console_level = *level;
    }
    if (variable.file) {
      config.file_level = *level;
    }
  }

  if (auto enabled = env_value("CLOUDPHOTO_LOG_FILE_ENABLED")) {
    if (auto parsed = parse_switch(*enabled)) {
      config.file_enabled = *parsed;
    }
  }
  if (auto directory = env_value("CLOUDPHOTO_LOG_FILE_DIR")) {
    config.file_config.directory = *directory;
  }
  if (auto format = env_value("CLOUDPHOTO_LOG_FORMAT")) {
    std::string name = lowered(*format);
    if (name == "json" || name == "text") {
      config.file_config.format_json = (name == "json");
    }
  }
}

LoggingConfig resolve_logging_config(const LoggingConfig& base, bool verbose) {
  LoggingConfig resolved = base;
  if (verbose && resolved.console_level > severity_level::info) {
    resolved.console_level = severity_level::info;
  }
  apply_env_overrides(resolved);
  return resolved;
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_state_mutex);
  if (g_initialized) {
    return;
  }

  boost::log::add_common_attributes();
  auto core = boost::log::core::get();

  if (config.console_enabled) {
    g_console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(g_console_sink);
  }
  if (config.file_enabled) {
    g_file_sink = create_file_sink(config.file_config, config.file_level);
    core->add_sink(g_file_sink);
  }

  g_initialized = true;
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_state_mutex);
  if (!g_initialized) {
    return;
  }

  stop_sink(g_console_sink);
  stop_sink(g_file_sink);
  g_initialized = false;
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_state_mutex);
  return g_initialized;
}

LoggingSession::LoggingSession(const LoggingConfig& config)
    : owns_logging_(!is_logging_initialized()) {
  if (owns_logging_) {
    init_logging(config);
  }
}

LoggingSession::~LoggingSession() {
  if (owns_logging_) {
    shutdown_logging();
  }
}

}  // namespace logging
}  // namespace cloudphoto
