#pragma once

#include "lanshare/core/error.hpp"

#include <filesystem>
#include <string>

namespace lanshare {

/**
 * @brief Normalise a client-supplied relative path
 *
 * Rejects with Forbidden, before any filesystem access: empty paths, absolute
 * paths, embedded NULs, and paths that still contain ".." after lexical
 * normalisation. Returns the normalised generic form ("docs/a.txt").
 */
Outcome<std::string> normalize_shared_path(const std::string& relative);

/**
 * @brief Join a validated relative path onto `root`
 *
 * The result is always lexically inside `root`.
 */
Outcome<std::filesystem::path> resolve_shared_path(const std::filesystem::path& root,
                                                   const std::string& relative);

} // namespace lanshare
