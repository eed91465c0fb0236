// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "identifier_source.hpp"

#include <fstream>

#define PAYFETCH_LOG_COMPONENT "identifier_source"
#include <payfetch_log_macros.hpp>

namespace payfetch {
namespace app {

using logging::kv;

std::vector<std::string> parse_identifiers(std::istream& in) {
  const char* ws = " \t\r\n\f\v";
  std::vector<std::string> ids;
  std::string line;
  while (std::getline(in, line)) {
    auto begin = line.find_first_not_of(ws);
    if (begin == std::string::npos) {
      continue;
    }
    auto end = line.find_last_not_of(ws);
    std::string id = line.substr(begin, end - begin + 1);
    if (id[0] == '#') {
      continue;
    }
    ids.push_back(std::move(id));
  }
  return ids;
}

bool read_identifiers(const std::string& path, std::vector<std::string>& ids, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Cannot open input file: " + path;
    return false;
  }

  ids = parse_identifiers(file);
  if (file.bad()) {
    error = "Failed to read input file: " + path;
    return false;
  }

  PAYFETCH_LOG_INFO("Loaded payment IDs" << kv("path", path) << kv("count", ids.size()));
  return true;
}

}  // namespace app
}  // namespace payfetch
