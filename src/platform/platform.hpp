#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Creates an empty, uniquely named file under temp_dir(). Returns its path,
// or an empty path on failure.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
