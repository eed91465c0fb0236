// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_FILE_SINK_HPP
#define PAYFETCH_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "payfetch_log_severity.hpp"

namespace payfetch {
namespace logging {

using async_file_sink_t = boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>;

/**
 * Rotating log files for long batch runs
 */
struct FileSinkConfig {
  std::string directory = "/var/log/payfetch";
  std::string file_pattern = "payfetch_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;       // Older files are removed by the collector
  bool format_json = true;  // false = same text lines as the console
};

/**
 * Create the file sink, rotating by size and optionally at midnight.
 * An uncreatable directory falls back to /tmp with a warning on stderr.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config, severity_level min_level);

}  // namespace logging
}  // namespace payfetch

#endif  // PAYFETCH_FILE_SINK_HPP
