#pragma once

/**
 * @file default_logger.hpp
 * @brief DefaultLogger - file logging through plog
 *
 * Writes "[component] message" lines to the rolling file given by
 * ConfigLogger::GetLogFilePath(). When ConfigLogger is disabled the
 * logger is a no-op.
 */

#include "../interface/i_logger.hpp"
#include "config_logger.hpp"

#include <plog/Log.h>
#include <plog/Initializers/RollingFileInitializer.h>

#include <atomic>
#include <mutex>
#include <string>

namespace field_prop_lib {

class DefaultLogger : public ILogger {
public:
    static DefaultLogger& GetInstance();

    DefaultLogger();
    ~DefaultLogger() override;

    // ═══════════════════════════════════════════════════════════════════════
    // ILogger
    // ═══════════════════════════════════════════════════════════════════════

    void Debug(const std::string& component, const std::string& message) override;
    void Info(const std::string& component, const std::string& message) override;
    void Warning(const std::string& component, const std::string& message) override;
    void Error(const std::string& component, const std::string& message) override;

    bool IsDebugEnabled() const override;
    bool IsInfoEnabled() const override;
    bool IsWarningEnabled() const override;
    bool IsErrorEnabled() const override;

    void Reset() override;

    // ═══════════════════════════════════════════════════════════════════════
    // Extras
    // ═══════════════════════════════════════════════════════════════════════

    /// "[component] message"
    static std::string FormatMessage(const std::string& component,
                                     const std::string& message);

    /// Map "DEBUG" / "INFO" / "WARNING" / "ERROR" to a plog severity
    static plog::Severity SeverityFromName(const std::string& level);

    bool IsInitialized() const;

    /// True when a plog file appender is attached
    bool IsWritingToFile() const;

private:
    void Initialize();
    void Shutdown();

    bool initialized_;
    std::atomic<bool> file_attached_;
    plog::Severity current_level_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
