// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "payfetch_log_format.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

#include "payfetch_log_severity.hpp"

namespace payfetch {
namespace logging {

namespace {

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

std::string message_of(const boost::log::record_view& rec) {
  auto msg = boost::log::extract<std::string>("Message", rec);
  return msg ? *msg : std::string();
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

void format_text_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << "[" << *ts << "] ";
  }

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]\033[0m ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << message_of(rec);

  auto payment_id = boost::log::extract<std::string>("PaymentID", rec);
  auto worker = boost::log::extract<std::string>("WorkerID", rec);
  if (payment_id || worker) {
    strm << " |";
    if (payment_id) {
      strm << " payment_id=" << *payment_id;
    }
    if (worker) {
      strm << " worker=" << *worker;
    }
  }
}

void format_json_record(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"" << escape_json(message_of(rec)) << "\"";

  using thread_id_t = boost::log::attributes::current_thread_id::value_type;
  if (auto thread_id = boost::log::extract<thread_id_t>("ThreadID", rec)) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }
  if (auto payment_id = boost::log::extract<std::string>("PaymentID", rec)) {
    strm << ",\"payment_id\":\"" << escape_json(*payment_id) << "\"";
  }
  if (auto worker = boost::log::extract<std::string>("WorkerID", rec)) {
    strm << ",\"worker\":\"" << escape_json(*worker) << "\"";
  }
  strm << "}";
}

}  // namespace logging
}  // namespace payfetch
