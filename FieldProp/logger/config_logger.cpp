#include "config_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace field_prop_lib {

ConfigLogger& ConfigLogger::GetInstance() {
    static ConfigLogger instance;
    return instance;
}

ConfigLogger::ConfigLogger()
    : log_path_("")
    , level_("DEBUG")
    , enabled_(true) {
}

// ════════════════════════════════════════════════════════════════════════════
// Path
// ════════════════════════════════════════════════════════════════════════════

void ConfigLogger::SetLogPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_path_ = path;
    log_file_path_.clear();
}

std::string ConfigLogger::GetLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_path_;
}

std::string ConfigLogger::GetLogFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_path_.empty()) {
        log_file_path_ = BuildLogFilePath();
    }
    return log_file_path_;
}

std::string ConfigLogger::BuildLogFilePath() const {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm now_tm;

#if defined(_WIN32)
    localtime_s(&now_tm, &now_time);
#else
    localtime_r(&now_time, &now_tm);
#endif

    std::ostringstream date_ss;
    date_ss << std::put_time(&now_tm, "%Y-%m-%d");

    std::ostringstream time_ss;
    time_ss << std::put_time(&now_tm, "%H-%M-%S");

    std::filesystem::path base = log_path_.empty()
        ? std::filesystem::current_path()
        : std::filesystem::path(log_path_);

    std::filesystem::path file = base / kLogsDir / kLogSubdir / date_ss.str();
    file /= time_ss.str() + ".log";
    return file.string();
}

// ════════════════════════════════════════════════════════════════════════════
// Enable / level
// ════════════════════════════════════════════════════════════════════════════

void ConfigLogger::SetEnabled(bool enabled) {
    enabled_ = enabled;
}

bool ConfigLogger::IsEnabled() const {
    return enabled_;
}

void ConfigLogger::Enable() {
    enabled_ = true;
}

void ConfigLogger::Disable() {
    enabled_ = false;
}

void ConfigLogger::SetLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper != "DEBUG" && upper != "INFO" && upper != "WARNING" && upper != "ERROR") {
        throw std::invalid_argument("ConfigLogger: unknown log level '" + level + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    level_ = upper;
}

std::string ConfigLogger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

// ════════════════════════════════════════════════════════════════════════════
// Utilities
// ════════════════════════════════════════════════════════════════════════════

bool ConfigLogger::CreateLogDirectory() const {
    std::filesystem::path log_dir = std::filesystem::path(GetLogFilePath()).parent_path();

    try {
        if (!std::filesystem::exists(log_dir)) {
            std::filesystem::create_directories(log_dir);
        }
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ConfigLogger] Failed to create log directory: " << e.what() << "\n";
        return false;
    }
}

void ConfigLogger::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_path_.clear();
    log_file_path_.clear();
    level_ = "DEBUG";
    enabled_ = true;
}

} // namespace field_prop_lib
