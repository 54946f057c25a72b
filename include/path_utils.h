#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and executable-relative lookup
 */

#include <string>

namespace helios {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Directory containing the running executable (from /proc/self/exe), or empty
 * when it cannot be determined.
 */
std::string executable_dir();

} // namespace helios
