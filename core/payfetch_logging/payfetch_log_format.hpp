// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_LOG_FORMAT_HPP
#define PAYFETCH_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

namespace payfetch {
namespace logging {

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * One-line text layout shared by the console and file sinks:
 *
 *   [2026-10-18 12:00:00.000000] [WARN] [fetch_worker] Rate limited delay_ms=1200 | payment_id=42 worker=3
 *
 * The context suffix appears only inside PAYFETCH_LOG_SCOPED_CONTEXT.
 */
void format_text_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * One JSON object per record: ts, level, msg, thread_id, payment_id, worker.
 */
void format_json_record(const boost::log::record_view& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace payfetch

#endif  // PAYFETCH_LOG_FORMAT_HPP
