// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_LOG_MACROS_HPP
#define CLOUDPHOTO_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "cloudphoto_log_severity.hpp"

namespace cloudphoto {
namespace logging {

typedef boost::log::sources::severity_logger<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in cloudphoto_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: CLOUDPHOTO_LOG_INFO("uploaded" << kv("key", key));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace cloudphoto

// =============================================================================
// Component identification
// Define CLOUDPHOTO_LOG_COMPONENT before including this header:
//
//   #define CLOUDPHOTO_LOG_COMPONENT "album_repository"
//   #include <cloudphoto_log_macros.hpp>
// =============================================================================
#ifndef CLOUDPHOTO_LOG_COMPONENT
#define CLOUDPHOTO_LOG_COMPONENT "cloudphoto"
#endif

// DEBUG logs are compiled out in release builds
#ifdef NDEBUG
#define CLOUDPHOTO_LOG_ENABLE_DEBUG 0
#else
#define CLOUDPHOTO_LOG_ENABLE_DEBUG 1
#endif

#define CLOUDPHOTO_LOG_DEBUG(msg)                                                              \
  do {                                                                                         \
    if (CLOUDPHOTO_LOG_ENABLE_DEBUG) {                                                         \
      BOOST_LOG_SEV(                                                                           \
        ::cloudphoto::logging::get_logger(), ::cloudphoto::logging::severity_level::debug     \
      ) << "["                                                                                 \
        << CLOUDPHOTO_LOG_COMPONENT << "] " << msg;                                            \
    }                                                                                          \
  } while (0)

#define CLOUDPHOTO_LOG_INFO(msg)                                                               \
  do {                                                                                         \
    BOOST_LOG_SEV(::cloudphoto::logging::get_logger(), ::cloudphoto::logging::severity_level::info) \
      << "[" << CLOUDPHOTO_LOG_COMPONENT << "] " << msg;                                       \
  } while (0)

#define CLOUDPHOTO_LOG_WARN(msg)                                                               \
  do {                                                                                         \
    BOOST_LOG_SEV(::cloudphoto::logging::get_logger(), ::cloudphoto::logging::severity_level::warn) \
      << "[" << CLOUDPHOTO_LOG_COMPONENT << "] " << msg;                                       \
  } while (0)

#define CLOUDPHOTO_LOG_ERROR(msg)                                                              \
  do {                                                                                         \
    BOOST_LOG_SEV(                                                                             \
      ::cloudphoto::logging::get_logger(), ::cloudphoto::logging::severity_level::error       \
    ) << "["                                                                                   \
      << CLOUDPHOTO_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

#define CLOUDPHOTO_LOG_FATAL(msg)                                                              \
  do {                                                                                         \
    BOOST_LOG_SEV(                                                                             \
      ::cloudphoto::logging::get_logger(), ::cloudphoto::logging::severity_level::fatal       \
    ) << "["                                                                                   \
      << CLOUDPHOTO_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

// =============================================================================
// Scoped context: tags every record in the current scope with the running
// command and the album it works on. Cleared when the scope exits.
// At most one context per scope.
//
// Usage: CLOUDPHOTO_LOG_SCOPED_CONTEXT("upload", album_name);
// =============================================================================
#define CLOUDPHOTO_LOG_SCOPED_CONTEXT(command_val, album_val)                            \
  ::boost::log::scoped_attribute cloudphoto_log_command_guard_ =                         \
    ::boost::log::add_scoped_thread_attribute(                                           \
      "Command", ::boost::log::attributes::constant<std::string>(command_val)            \
    );                                                                                   \
  ::boost::log::scoped_attribute cloudphoto_log_album_guard_ =                           \
    ::boost::log::add_scoped_thread_attribute(                                           \
      "Album", ::boost::log::attributes::constant<std::string>(album_val)                \
    )

#endif  // CLOUDPHOTO_LOG_MACROS_HPP
