#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Current process id as reported by the OS.
int32_t current_pid();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
