// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_CONSOLE_SINK_HPP
#define PAYFETCH_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "payfetch_log_severity.hpp"

namespace payfetch {
namespace logging {

// Fetch workers log from many threads; a full queue drops records rather
// than stalling a request on stderr.
using async_console_sink_t = boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>;

/**
 * Console sink on stderr. stdout is left to the progress lines and the
 * final summary.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(severity_level min_level, bool use_colors);

}  // namespace logging
}  // namespace payfetch

#endif  // PAYFETCH_CONSOLE_SINK_HPP
