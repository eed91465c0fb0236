// Copyright (c) 2026 ArcheBase
// Payfetch is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef PAYFETCH_LOG_SEVERITY_HPP
#define PAYFETCH_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace payfetch {
namespace logging {

/**
 * Severity levels for payfetch logging.
 * FATAL is reserved for errors that end the run.
 */
enum class severity_level {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
  fatal = 4
};

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* strings[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  if (static_cast<size_t>(level) < sizeof(strings) / sizeof(*strings)) {
    strm << strings[static_cast<size_t>(level)];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace payfetch

#endif  // PAYFETCH_LOG_SEVERITY_HPP
