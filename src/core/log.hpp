#pragma once

#include <string>

// Debug log shared by the library and the CLI. Lines look like
// "[14:02:11.042] LocalServer: accepted connection fd=7".
// Default path: <temp_dir>/solo_debug.log. An empty path disables logging.
void set_log_path(const std::string& path);
std::string solo_log_path();

// Append a timestamped line to the debug log. Never throws.
void solo_log(const std::string& msg);
