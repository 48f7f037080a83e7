#pragma once

#include <spdlog/common.h>

#include <filesystem> // Requires C++17
#include <string>
#include <vector>

namespace Config {

struct Settings {
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool log_to_file = true;
    std::string default_file_name = "todo_list_save.json"; // picker suggestion for a first save
    // Problems found while loading; logged once the logger is set up
    std::vector<std::string> warnings;
};

// Per-user directory holding settings.json and the log file; created if missing
std::filesystem::path get_config_dir();

// Missing file yields defaults; a malformed file yields defaults plus an entry in `warnings`
Settings load_settings(const std::filesystem::path& path);

// Installs the default spdlog logger. The terminal belongs to the UI, so
// output goes to `log_path` or nowhere.
void init_logging(const Settings& settings, const std::filesystem::path& log_path);

} // namespace Config
