// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CLOUDPHOTO_FILE_SINK_HPP
#define CLOUDPHOTO_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "cloudphoto_log_severity.hpp"

namespace cloudphoto {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/tmp/cloudphoto/logs";
  std::string file_pattern = "cloudphoto_%Y%m%d.log";
  uint64_t rotation_size_mb = 10;
  int max_files = 5;
  bool format_json = false;  // One JSON object per line when true
};

/**
 * Escape a string for embedding in a JSON string literal.
 */
std::string escape_json(const std::string& s);

/**
 * Create async file sink with size-based rotation.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 * @return Shared pointer to the sink
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace cloudphoto

#endif  // CLOUDPHOTO_FILE_SINK_HPP
