#include "default_logger.hpp"

#include <iostream>

namespace field_prop_lib {

// ════════════════════════════════════════════════════════════════════════════
// DefaultLogger - plog rolling file backend
// ════════════════════════════════════════════════════════════════════════════

namespace {

constexpr size_t kMaxFileSize = 5 * 1024 * 1024;  // 5 MB
constexpr int    kMaxFiles    = 3;

} // namespace

DefaultLogger& DefaultLogger::GetInstance() {
    static DefaultLogger instance;
    return instance;
}

DefaultLogger::DefaultLogger()
    : initialized_(false)
    , file_attached_(false)
    , current_level_(plog::debug) {
    Initialize();
}

DefaultLogger::~DefaultLogger() {
    Shutdown();
}

/**
 * plog::init() may only attach one appender per instance for the whole
 * process. Later Initialize() calls (after Reset) only change the severity
 * of the logger that is already attached.
 */
void DefaultLogger::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return;
    }

    ConfigLogger& config = ConfigLogger::GetInstance();
    current_level_ = SeverityFromName(config.GetLevel());

    if (!config.IsEnabled()) {
        current_level_ = plog::none;
        if (file_attached_) {
            plog::get()->setMaxSeverity(plog::none);
        }
        initialized_ = true;
        return;
    }

    if (file_attached_) {
        plog::get()->setMaxSeverity(current_level_);
        initialized_ = true;
        return;
    }

    try {
        if (!config.CreateLogDirectory()) {
            current_level_ = plog::none;
            initialized_ = true;
            return;
        }

        std::string log_file_path = config.GetLogFilePath();
        plog::init(current_level_, log_file_path.c_str(), kMaxFileSize, kMaxFiles);
        file_attached_ = true;
    } catch (const std::exception& e) {
        std::cerr << "[DefaultLogger] plog initialization failed: " << e.what() << "\n";
        current_level_ = plog::none;
    }

    initialized_ = true;
}

void DefaultLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
}

// ════════════════════════════════════════════════════════════════════════════
// ILogger
// ════════════════════════════════════════════════════════════════════════════

void DefaultLogger::Debug(const std::string& component, const std::string& message) {
    if (!IsDebugEnabled()) {
        return;
    }
    PLOG_DEBUG << FormatMessage(component, message);
}

void DefaultLogger::Info(const std::string& component, const std::string& message) {
    if (!IsInfoEnabled()) {
        return;
    }
    PLOG_INFO << FormatMessage(component, message);
}

void DefaultLogger::Warning(const std::string& component, const std::string& message) {
    if (!IsWarningEnabled()) {
        return;
    }
    PLOG_WARNING << FormatMessage(component, message);
}

void DefaultLogger::Error(const std::string& component, const std::string& message) {
    if (!IsErrorEnabled()) {
        return;
    }
    PLOG_ERROR << FormatMessage(component, message);
}

bool DefaultLogger::IsDebugEnabled() const {
    return initialized_ && file_attached_ && current_level_ >= plog::debug;
}

bool DefaultLogger::IsInfoEnabled() const {
    return initialized_ && file_attached_ && current_level_ >= plog::info;
}

bool DefaultLogger::IsWarningEnabled() const {
    return initialized_ && file_attached_ && current_level_ >= plog::warning;
}

bool DefaultLogger::IsErrorEnabled() const {
    return initialized_ && file_attached_ && current_level_ >= plog::error;
}

void DefaultLogger::Reset() {
    Shutdown();
    Initialize();
}

// ════════════════════════════════════════════════════════════════════════════
// Extras
// ════════════════════════════════════════════════════════════════════════════

std::string DefaultLogger::FormatMessage(const std::string& component,
                                         const std::string& message) {
    return "[" + component + "] " + message;
}

plog::Severity DefaultLogger::SeverityFromName(const std::string& level) {
    if (level == "ERROR")   return plog::error;
    if (level == "WARNING") return plog::warning;
    if (level == "INFO")    return plog::info;
    return plog::debug;
}

bool DefaultLogger::IsInitialized() const {
    return initialized_;
}

bool DefaultLogger::IsWritingToFile() const {
    return file_attached_;
}

} // namespace field_prop_lib
