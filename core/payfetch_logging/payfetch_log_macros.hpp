// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_LOG_MACROS_HPP
#define PAYFETCH_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "payfetch_log_severity.hpp"

namespace payfetch {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger shared by every component and thread.
 */
logger_type& get_logger();

/**
 * " name=value" field for structured messages; strings are quoted.
 * Usage: PAYFETCH_LOG_INFO("Fetched" << kv("status", 200));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

inline std::string kv(const char* name, const std::string& value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

inline std::string kv(const char* name, const char* value) {
  return kv(name, std::string(value));
}

}  // namespace logging
}  // namespace payfetch

// Each translation unit names itself before including this header:
//
//   #define PAYFETCH_LOG_COMPONENT "fetch_worker"
//   #include <payfetch_log_macros.hpp>
#ifndef PAYFETCH_LOG_COMPONENT
#define PAYFETCH_LOG_COMPONENT "payfetch"
#endif

#ifdef NDEBUG
#define PAYFETCH_LOG_ENABLE_DEBUG 0
#else
#define PAYFETCH_LOG_ENABLE_DEBUG 1
#endif

#define PAYFETCH_LOG_AT(level, msg)                                                             \
  BOOST_LOG_SEV(::payfetch::logging::get_logger(), ::payfetch::logging::severity_level::level) \
    << "[" << PAYFETCH_LOG_COMPONENT << "] " << msg

#define PAYFETCH_LOG_DEBUG(msg)      \
  do {                               \
    if (PAYFETCH_LOG_ENABLE_DEBUG) { \
      PAYFETCH_LOG_AT(debug, msg);   \
    }                                \
  } while (0)

#define PAYFETCH_LOG_INFO(msg)   \
  do {                           \
    PAYFETCH_LOG_AT(info, msg);  \
  } while (0)

#define PAYFETCH_LOG_WARN(msg)   \
  do {                           \
    PAYFETCH_LOG_AT(warn, msg);  \
  } while (0)

#define PAYFETCH_LOG_ERROR(msg)  \
  do {                           \
    PAYFETCH_LOG_AT(error, msg); \
  } while (0)

// Errors that end the run
#define PAYFETCH_LOG_FATAL(msg)  \
  do {                           \
    PAYFETCH_LOG_AT(fatal, msg); \
  } while (0)

// Tags every record of the current thread with the payment and worker until
// the enclosing scope exits.
#define PAYFETCH_LOG_SCOPED_CONTEXT(payment_id_val, worker_id_val)                              \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                        \
    "PaymentID", boost::log::attributes::constant<std::string>(payment_id_val),                 \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_payfetch_payment_id_sentry_)                              \
  );                                                                                            \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                        \
    "WorkerID", boost::log::attributes::constant<std::string>(worker_id_val),                   \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_payfetch_worker_id_sentry_)                               \
  )

// Logs the 1st, (n+1)th, (2n+1)th... pass through this call site
#define PAYFETCH_LOG_INFO_EVERY_N(n, msg)                   \
  do {                                                      \
    static std::atomic<uint64_t> _payfetch_log_counter{0};  \
    if ((_payfetch_log_counter++ % (n)) == 0) {             \
      PAYFETCH_LOG_INFO(msg);                               \
    }                                                       \
  } while (0)

// At most one record per interval_sec at this call site, across threads
#define PAYFETCH_LOG_WARN_THROTTLE(interval_sec, msg)                                        \
  do {                                                                                       \
    static std::mutex _payfetch_throttle_mutex;                                              \
    static std::chrono::steady_clock::time_point _payfetch_next_log{};                       \
    bool _payfetch_due = false;                                                              \
    {                                                                                        \
      std::lock_guard<std::mutex> _payfetch_lock(_payfetch_throttle_mutex);                  \
      auto _payfetch_now = std::chrono::steady_clock::now();                                 \
      if (_payfetch_now >= _payfetch_next_log) {                                             \
        _payfetch_next_log =                                                                 \
          _payfetch_now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(   \
                            std::chrono::duration<double>(interval_sec)                      \
                          );                                                                 \
        _payfetch_due = true;                                                                \
      }                                                                                      \
    }                                                                                        \
    if (_payfetch_due) {                                                                     \
      PAYFETCH_LOG_WARN(msg);                                                                \
    }                                                                                        \
  } while (0)

#endif  // PAYFETCH_LOG_MACROS_HPP
