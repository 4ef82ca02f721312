#include "directory_structure.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>

fs::path get_hps_root() {
    return platform::home_dir() / HPS_STATE_DIR;
}

void ensure_hps_directory_structure() {
    fs::path root = get_hps_root();

    fs::create_directories(root);
    fs::create_directories(root / LOGS_DIR_NAME);
}

void ensure_parent_directory(const fs::path& file) {
    fs::path parent = file.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
