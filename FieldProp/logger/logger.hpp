#pragma once

/**
 * @file logger.hpp
 * @brief Logger - logging facade for FieldProp and the optics modules
 *
 * Provides:
 * - FIELDPROP_LOG_* macros
 * - Logger::SetInstance() to route messages into an application logger
 * - DEBUG compiled out in Release builds (NDEBUG)
 *
 * @code
 * #include "logger/logger.hpp"
 *
 * FIELDPROP_LOG_INFO("ASM", "M=2048, z=0.3");
 * FIELDPROP_LOG_WARNING("Sampling", "undersampled, dx > dx_crit");
 * @endcode
 */

#include "../interface/i_logger.hpp"
#include "default_logger.hpp"
#include "config_logger.hpp"

#include <mutex>
#include <string>

namespace field_prop_lib {

class Logger {
public:
    /// Current logger (DefaultLogger unless SetInstance() was called)
    static ILogger& GetInstance();

    static void SetInstance(ILoggerPtr logger);

    /// Back to DefaultLogger, re-reading ConfigLogger
    static void ResetToDefault();

    static void Debug(const std::string& component, const std::string& message);
    static void Info(const std::string& component, const std::string& message);
    static void Warning(const std::string& component, const std::string& message);
    static void Error(const std::string& component, const std::string& message);

    static bool IsEnabled();
    static void Enable();
    static void Disable();

private:
    static ILoggerPtr current_logger_;
    static std::mutex mutex_;
};

} // namespace field_prop_lib

// ════════════════════════════════════════════════════════════════════════════
// Logging macros
// ════════════════════════════════════════════════════════════════════════════

#ifdef NDEBUG
    #define FIELDPROP_LOG_DEBUG(component, message) \
        ((void)0)
#else
    #define FIELDPROP_LOG_DEBUG(component, message) \
        do { \
            if (field_prop_lib::Logger::IsEnabled()) { \
                field_prop_lib::Logger::Debug(component, message); \
            } \
        } while (0)
#endif // NDEBUG

#define FIELDPROP_LOG_INFO(component, message) \
    do { \
        if (field_prop_lib::Logger::IsEnabled()) { \
            field_prop_lib::Logger::Info(component, message); \
        } \
    } while (0)

#define FIELDPROP_LOG_WARNING(component, message) \
    do { \
        if (field_prop_lib::Logger::IsEnabled()) { \
            field_prop_lib::Logger::Warning(component, message); \
        } \
    } while (0)

#define FIELDPROP_LOG_ERROR(component, message) \
    do { \
        if (field_prop_lib::Logger::IsEnabled()) { \
            field_prop_lib::Logger::Error(component, message); \
        } \
    } while (0)
