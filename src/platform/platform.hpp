#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Read a line from the terminal with echo disabled (passwords).
std::string read_secret(const std::string& prompt);

// Replace `path` with `contents`. The data goes to a 0600 sibling first and
// is renamed over the target, so readers see either the old or new file.
Result<void> write_private_file(const std::filesystem::path& path, const std::string& contents);

} // namespace platform
