// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "response_fields.hpp"

namespace payfetch {
namespace fetcher {

namespace {

bool is_empty_value(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
      return true;
    case nlohmann::json::value_t::boolean:
      return !value.get<bool>();
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
      return value.get<double>() == 0.0;
    case nlohmann::json::value_t::string:
      return value.get_ref<const std::string&>().empty();
    case nlohmann::json::value_t::object:
    case nlohmann::json::value_t::array:
      return value.empty();
    default:
      return false;
  }
}

// Parse without exceptions; anything but an object is rejected
std::optional<nlohmann::json> parse_object(const std::string& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::string stringify_field(const nlohmann::json& value) {
  if (is_empty_value(value)) {
    return "";
  }
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<uint64_t>());
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<int64_t>());
  }
  return value.dump();
}

std::optional<SuccessFields> extract_success_fields(const std::string& body) {
  auto data = parse_object(body);
  if (!data) {
    return std::nullopt;
  }

  SuccessFields fields;
  auto order = data->find("order");
  if (order != data->end() && order->is_object()) {
    auto id = order->find("id");
    if (id != order->end()) {
      fields.order_id = stringify_field(*id);
    }
  }
  auto ext_ref = data->find("external_reference");
  if (ext_ref != data->end()) {
    fields.external_reference = stringify_field(*ext_ref);
  }
  return fields;
}

std::optional<std::string> extract_api_message(const std::string& body) {
  auto data = parse_object(body);
  if (!data) {
    return std::nullopt;
  }

  for (const char* key : {"message", "error", "cause"}) {
    auto it = data->find(key);
    if (it == data->end()) {
      continue;
    }
    std::string text = stringify_field(*it);
    if (!text.empty()) {
      return text;
    }
  }
  return std::nullopt;
}

}  // namespace fetcher
}  // namespace payfetch
