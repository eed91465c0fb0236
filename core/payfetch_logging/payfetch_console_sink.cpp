// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "payfetch_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "payfetch_log_format.hpp"

namespace payfetch {
namespace logging {

boost::shared_ptr<async_console_sink_t> create_console_sink(severity_level min_level, bool use_colors) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::cerr, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
      format_text_record(rec, strm, use_colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace payfetch
