#include "logger.hpp"

namespace field_prop_lib {

ILoggerPtr Logger::current_logger_ = nullptr;
std::mutex Logger::mutex_;

namespace {

/// DefaultLogger is a process singleton (plog attaches once), so the
/// facade holds it through a non-owning shared_ptr.
ILoggerPtr DefaultLoggerHandle() {
    return ILoggerPtr(&DefaultLogger::GetInstance(), [](ILogger*) {});
}

} // namespace

ILogger& Logger::GetInstance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_logger_) {
        current_logger_ = DefaultLoggerHandle();
    }
    return *current_logger_;
}

void Logger::SetInstance(ILoggerPtr logger) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_logger_ = logger ? logger : DefaultLoggerHandle();
}

void Logger::ResetToDefault() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_logger_ = DefaultLoggerHandle();
    current_logger_->Reset();
}

void Logger::Debug(const std::string& component, const std::string& message) {
    GetInstance().Debug(component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
    GetInstance().Info(component, message);
}

void Logger::Warning(const std::string& component, const std::string& message) {
    GetInstance().Warning(component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
    GetInstance().Error(component, message);
}

bool Logger::IsEnabled() {
    return ConfigLogger::GetInstance().IsEnabled();
}

void Logger::Enable() {
    ConfigLogger::GetInstance().Enable();
}

void Logger::Disable() {
    ConfigLogger::GetInstance().Disable();
}

} // namespace field_prop_lib
