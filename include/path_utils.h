#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and platform defaults
 */

#include <string>

namespace wayfarer {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Returns the platform espeak-ng data directory Piper should use when
 * speech.espeak_data_path is left empty.
 */
std::string default_espeak_data_path();

} // namespace wayfarer
