#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// "~" and "~/x" resolve against home_dir(); anything else is returned as-is.
std::filesystem::path expand_home(const std::string& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
