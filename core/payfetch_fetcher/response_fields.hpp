// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_RESPONSE_FIELDS_HPP
#define PAYFETCH_RESPONSE_FIELDS_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace payfetch {
namespace fetcher {

/**
 * Fields taken from a successful payment lookup.
 */
struct SuccessFields {
  std::string order_id;            // order.id, empty if absent
  std::string external_reference;  // external_reference, empty if absent
};

/**
 * Render a JSON value as a CSV cell.
 *
 * Strings are taken verbatim, integers in decimal, other values in their JSON
 * form. Null, false, zero, empty strings and empty containers give "".
 */
std::string stringify_field(const nlohmann::json& value);

/**
 * Parse a 2xx body and pull out the order and external references.
 *
 * @return std::nullopt if the body is not a JSON object
 */
std::optional<SuccessFields> extract_success_fields(const std::string& body);

/**
 * Pull the API error text from an error body: the first non-empty of
 * "message", "error", "cause".
 *
 * @return std::nullopt if the body is not a JSON object or has none of them
 */
std::optional<std::string> extract_api_message(const std::string& body);

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_RESPONSE_FIELDS_HPP
