#pragma once

/**
 * @file config_logger.hpp
 * @brief ConfigLogger - where and whether to write log files
 *
 * Log file layout:
 *   {path}/Logs/FIELDPROP/YYYY-MM-DD/HH-MM-SS.log
 * An empty path means the current working directory.
 */

#include <string>
#include <atomic>
#include <mutex>

namespace field_prop_lib {

class ConfigLogger {
public:
    static ConfigLogger& GetInstance();

    ConfigLogger(const ConfigLogger&) = delete;
    ConfigLogger& operator=(const ConfigLogger&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Path
    // ═══════════════════════════════════════════════════════════════════════

    void SetLogPath(const std::string& path);
    std::string GetLogPath() const;

    /// Full path of the log file for this run (timestamped)
    std::string GetLogFilePath() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Enable / level
    // ═══════════════════════════════════════════════════════════════════════

    void SetEnabled(bool enabled);
    bool IsEnabled() const;
    void Enable();
    void Disable();

    /**
     * @brief Minimum level: "DEBUG", "INFO", "WARNING" or "ERROR"
     * @throws std::invalid_argument for other names
     */
    void SetLevel(const std::string& level);
    std::string GetLevel() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Utilities
    // ═══════════════════════════════════════════════════════════════════════

    /// Create the directory of GetLogFilePath()
    bool CreateLogDirectory() const;

    void Reset();

private:
    ConfigLogger();

    /// Directory for the run's log file, derived from log_path_ and the clock
    std::string BuildLogFilePath() const;

    std::string log_path_;
    std::string level_;
    std::atomic<bool> enabled_;

    /// Resolved on first use so CreateLogDirectory() and the file agree
    mutable std::string log_file_path_;

    mutable std::mutex mutex_;

    static constexpr const char* kLogSubdir = "FIELDPROP";
    static constexpr const char* kLogsDir = "Logs";
};

} // namespace field_prop_lib
