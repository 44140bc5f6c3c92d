#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and config-relative paths
 */

#include <string>

namespace interrupt_filter {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolves path against base_dir unless it is absolute or starts with ~.
 * An empty base_dir leaves relative paths relative to the working directory.
 */
std::string resolve_relative(const std::string& base_dir, const std::string& path);

/**
 * Directory part of a file path ("" when there is none).
 */
std::string parent_dir(const std::string& path);

} // namespace interrupt_filter
