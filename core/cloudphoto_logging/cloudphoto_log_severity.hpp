// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_LOG_SEVERITY_HPP
#define CLOUDPHOTO_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <ostream>
#include <string>

namespace cloudphoto {
namespace logging {

enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

/**
 * Lower-case level name, the spelling used in cloudphotorc.yaml and in the
 * CLOUDPHOTO_LOG_* variables
 */
inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "debug";
    case severity_level::info:
      return "info";
    case severity_level::warn:
      return "warn";
    case severity_level::error:
      return "error";
    case severity_level::fatal:
      return "fatal";
  }
  return "unknown";
}

/**
 * Inverse of severity_name. Case-insensitive; "warning" is accepted for warn.
 */
inline std::optional<severity_level> parse_severity_level(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  if (lower == "warning") {
    return severity_level::warn;
  }
  for (int i = 0; i <= static_cast<int>(severity_level::fatal); ++i) {
    auto level = static_cast<severity_level>(i);
    if (lower == severity_name(level)) {
      return level;
    }
  }
  return std::nullopt;
}

/**
 * Record tag: the upper-cased name ("WARN")
 */
inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  for (const char* c = severity_name(level); *c != '\0'; ++c) {
    strm << static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
  }
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_LOG_SEVERITY_HPP
