#pragma once

/**
 * @file path_utils.h
 * @brief Locating the config file and expanding user paths
 */

#include <string>

namespace live_scribe {

/// Leading "~" or "~/" replaced by $HOME; anything else returned as is
std::string expand_path(const std::string& path);

/// Directory holding the running executable, empty if it cannot be determined
std::string executable_dir();

/**
 * Config file to load. An explicit path wins (after ~ expansion); otherwise
 * <exe_dir>/../config/config.json when it exists (running from build/),
 * else the working-directory relative default.
 */
std::string resolve_config_path(const std::string& explicit_path = "");

} // namespace live_scribe
