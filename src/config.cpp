#include "config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <fstream>
#include <iostream>
#include <memory>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h> // For SHGetFolderPath
#else // Linux, macOS
#include <cstdlib>
#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>
#endif

namespace Config {

namespace {

const char* home_dir() {
#ifdef _WIN32
    return nullptr;
#else
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd) home = pwd->pw_dir;
    }
    return home;
#endif
}

} // namespace

std::filesystem::path get_config_dir() {
    std::filesystem::path config_dir;
    const std::string app_name = "Taskpad";

#ifdef _WIN32
    // Windows: %APPDATA%\Taskpad
    wchar_t path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathW(NULL, CSIDL_APPDATA, NULL, 0, path))) {
        config_dir = std::filesystem::path(path) / app_name;
    } else {
        config_dir = std::filesystem::current_path() / app_name; // Fallback
    }
#elif defined(__APPLE__)
    // macOS: ~/Library/Application Support/Taskpad
    if (const char* home = home_dir()) {
        config_dir = std::filesystem::path(home) / "Library" / "Application Support" / app_name;
    } else {
        config_dir = std::filesystem::current_path() / app_name; // Fallback
    }
#else // Linux (and other Unix-like)
    // Linux: $XDG_CONFIG_HOME/Taskpad or ~/.config/Taskpad
    std::filesystem::path base;
    if (const char* config_home = getenv("XDG_CONFIG_HOME"); config_home && *config_home) {
        base = config_home;
    } else if (const char* home = home_dir()) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path(); // Fallback
    }
    config_dir = base / app_name;
#endif

    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        std::cerr << "Error creating config directory " << config_dir.string() << ": " << ec.message() << std::endl;
        config_dir = std::filesystem::current_path();
    }
    return config_dir;
}

Settings load_settings(const std::filesystem::path& path) {
    Settings settings;
    if (!std::filesystem::exists(path))
        return settings;

    try {
        std::ifstream ifs(path);
        nlohmann::json j;
        ifs >> j;
        if (!j.is_object()) {
            settings.warnings.push_back(path.string() + " is not a JSON object, using default settings");
            return settings;
        }
        if (j.contains("log_level")) {
            // from_str maps unknown names to "off"; keep the default instead
            const auto name = j.at("log_level").get<std::string>();
            const auto level = spdlog::level::from_str(name);
            if (level != spdlog::level::off || name == "off")
                settings.log_level = level;
            else
                settings.warnings.push_back("Unknown log_level '" + name + "' in " + path.string());
        }
        settings.log_to_file = j.value("log_to_file", settings.log_to_file);
        settings.default_file_name = j.value("default_file_name", settings.default_file_name);
    } catch (const nlohmann::json::exception& e) {
        Settings defaults;
        defaults.warnings.push_back("Error reading " + path.string() + ": " + e.what() + ". Using default settings.");
        return defaults;
    }
    return settings;
}

void init_logging(const Settings& settings, const std::filesystem::path& log_path) {
    std::shared_ptr<spdlog::logger> logger;
    if (settings.log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true); // truncate on startup
        file_sink->set_level(spdlog::level::trace);
        logger = std::make_shared<spdlog::logger>("file_logger", file_sink);
    } else {
        logger = std::make_shared<spdlog::logger>("null_logger", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    spdlog::set_default_logger(logger);
    spdlog::set_level(settings.log_level);
    spdlog::flush_on(spdlog::level::info);

    for (const auto& warning : settings.warnings)
        spdlog::warn("{}", warning);
}

} // namespace Config
