#pragma once

/**
 * @file i_logger.hpp
 * @brief ILogger - logging interface
 *
 * The default implementation writes through plog (DefaultLogger). An
 * application can install its own logger with Logger::SetInstance().
 */

#include <string>
#include <memory>

namespace field_prop_lib {

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void Debug(const std::string& component, const std::string& message) = 0;
    virtual void Info(const std::string& component, const std::string& message) = 0;
    virtual void Warning(const std::string& component, const std::string& message) = 0;
    virtual void Error(const std::string& component, const std::string& message) = 0;

    virtual bool IsDebugEnabled() const = 0;
    virtual bool IsInfoEnabled() const = 0;
    virtual bool IsWarningEnabled() const = 0;
    virtual bool IsErrorEnabled() const = 0;

    /// Re-read ConfigLogger and reinitialize
    virtual void Reset() = 0;
};

using ILoggerPtr = std::shared_ptr<ILogger>;

} // namespace field_prop_lib
