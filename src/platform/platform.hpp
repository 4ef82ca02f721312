#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir when unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Replace `path` with `content` atomically: write a sibling temp file, then
// rename it over the target so readers never see a partial write.
bool atomic_write_file(const std::filesystem::path& path, const std::string& content,
                       std::string* error = nullptr);

} // namespace platform
