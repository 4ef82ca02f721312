#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Ensures the ~/.hps_cli directory and its logs/ subdirectory exist.
// Creates directories as needed but does not overwrite files.
void ensure_hps_directory_structure();

// Ensures the directory holding `file` exists.
void ensure_parent_directory(const fs::path& file);

// Get the base ~/.hps_cli path
fs::path get_hps_root();
