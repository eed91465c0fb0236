// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "payfetch_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "payfetch_log_format.hpp"

namespace payfetch {
namespace logging {

namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;

namespace {

std::string usable_directory(const std::string& requested) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(requested, ec);
  if (!ec && boost::filesystem::is_directory(requested, ec)) {
    return requested;
  }
  std::cerr << "payfetch: cannot use log directory '" << requested << "'"
            << (ec ? ": " + ec.message() : std::string()) << ", writing logs to /tmp" << std::endl;
  return "/tmp";
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config, severity_level min_level) {
  const std::string directory = usable_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024, keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json_record);
  } else {
    sink->set_formatter(
      [](const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
        format_text_record(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace payfetch
