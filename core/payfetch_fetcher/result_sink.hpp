// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_RESULT_SINK_HPP
#define PAYFETCH_RESULT_SINK_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "payment_outcome.hpp"

namespace payfetch {
namespace fetcher {

/**
 * Quote a CSV field when it contains a comma, quote, CR or LF (RFC 4180).
 */
std::string format_csv_field(const std::string& field);

/**
 * Join fields into one CSV record terminated by CRLF.
 */
std::string format_csv_row(const std::vector<std::string>& fields);

/**
 * CSV record for an outcome, columns in kOutcomeColumns order.
 */
std::string format_outcome_row(const PaymentOutcome& outcome);

/**
 * Thread-safe CSV writer for outcomes.
 *
 * The header row is written and flushed on construction. Each write() holds
 * one lock for formatting, writing and flushing a single row, so rows never
 * interleave and every flushed row survives an interrupted run.
 *
 * Progress is reported after every 10th row and after the last expected
 * row as "[k/total] wrote rows to <destination>".
 */
class ResultSink {
public:
  using ProgressCallback = std::function<void(const std::string& line)>;

  /**
   * @param out Output stream, must outlive the sink
   * @param total Number of rows expected, used for progress reporting
   * @param destination Name shown in progress lines
   * @param progress Receives progress lines; they are logged either way
   * @throws std::runtime_error if the header cannot be written
   */
  ResultSink(
    std::ostream& out, std::size_t total, const std::string& destination,
    ProgressCallback progress = nullptr
  );

  ResultSink(const ResultSink&) = delete;
  ResultSink& operator=(const ResultSink&) = delete;

  /**
   * Append one outcome row and flush.
   *
   * @throws std::runtime_error if the stream fails
   */
  void write(const PaymentOutcome& outcome);

  std::size_t written() const;

  std::size_t total() const {
    return total_;
  }

  const std::string& destination() const {
    return destination_;
  }

private:
  void write_locked(const std::string& row);

  std::ostream& out_;
  std::size_t total_;
  std::string destination_;
  ProgressCallback progress_;

  mutable std::mutex mutex_;
  std::size_t written_ = 0;
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_RESULT_SINK_HPP
