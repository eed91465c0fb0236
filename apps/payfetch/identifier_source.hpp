// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_IDENTIFIER_SOURCE_HPP
#define PAYFETCH_IDENTIFIER_SOURCE_HPP

#include <istream>
#include <string>
#include <vector>

namespace payfetch {
namespace app {

/**
 * Read payment identifiers, one per line.
 *
 * Surrounding whitespace is trimmed; blank lines and lines starting with '#'
 * are skipped. Duplicates are kept, each one is fetched.
 */
std::vector<std::string> parse_identifiers(std::istream& in);

/**
 * Read identifiers from a file.
 *
 * @param error Set when the file cannot be opened or read
 * @return false on I/O failure
 */
bool read_identifiers(const std::string& path, std::vector<std::string>& ids, std::string& error);

}  // namespace app
}  // namespace payfetch

#endif  // PAYFETCH_IDENTIFIER_SOURCE_HPP
