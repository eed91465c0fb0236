// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "result_sink.hpp"

#include <stdexcept>

#define PAYFETCH_LOG_COMPONENT "result_sink"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace fetcher {

using logging::kv;

std::string format_csv_field(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }

  std::string quoted;
  quoted.reserve(field.size() + 2);
  quoted += '"';
  for (char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string format_csv_row(const std::vector<std::string>& fields) {
  std::string row;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      row += ',';
    }
    row += format_csv_field(fields[i]);
  }
  row += "\r\n";
  return row;
}

std::string format_outcome_row(const PaymentOutcome& outcome) {
  return format_csv_row({
    outcome.payment_id,
    outcome.order_id,
    outcome.external_reference,
    std::to_string(outcome.http_status),
    outcome.error,
  });
}

ResultSink::ResultSink(
  std::ostream& out, std::size_t total, const std::string& destination, ProgressCallback progress
)
    : out_(out)
    , total_(total)
    , destination_(destination)
    , progress_(std::move(progress)) {
  std::vector<std::string> header(kOutcomeColumns.begin(), kOutcomeColumns.end());
  std::lock_guard<std::mutex> lock(mutex_);
  write_locked(format_csv_row(header));
}

void ResultSink::write(const PaymentOutcome& outcome) {
  std::string row = format_outcome_row(outcome);

  std::lock_guard<std::mutex> lock(mutex_);
  write_locked(row);
  ++written_;

  if (written_ % 10 == 0 || written_ == total_) {
    std::string line = "[" + std::to_string(written_) + "/" + std::to_string(total_) +
                       "] wrote rows to " + destination_;
    PAYFETCH_LOG_INFO(line);
    if (progress_) {
      progress_(line);
    }
  }
}

std::size_t ResultSink::written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

void ResultSink::write_locked(const std::string& row) {
  out_.write(row.data(), static_cast<std::streamsize>(row.size()));
  out_.flush();
  if (!out_) {
    PAYFETCH_LOG_ERROR("Output write failed" << kv("destination", destination_));
    throw std::runtime_error("failed to write to " + destination_);
  }
}

}  // namespace fetcher
}  // namespace payfetch
