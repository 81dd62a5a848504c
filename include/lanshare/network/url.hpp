#pragma once

#include <string>
#include <unordered_map>

namespace lanshare::network {

using QueryMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Percent-encode a value for use in a request target
 *
 * Unreserved characters and '/' pass through so shared paths stay readable
 * ("docs/a b.txt" becomes "docs/a%20b.txt").
 */
std::string url_encode(const std::string& value);

/**
 * @brief Decode percent escapes
 *
 * In query strings '+' is a space; in paths it is literal. Malformed escapes
 * are kept as-is.
 */
std::string url_decode(const std::string& value, bool plus_as_space = true);

/**
 * @brief Split "/path?query" into its decoded path and raw query
 */
void split_target(const std::string& target, std::string& path, std::string& query);

/**
 * @brief Parse "a=1&b=x%20y" into decoded key/value pairs; later keys win
 */
QueryMap parse_query(const std::string& query);

} // namespace lanshare::network
