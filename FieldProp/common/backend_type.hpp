#pragma once

/**
 * @file backend_type.hpp
 * @brief Enumeration of execution backends
 */

#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace field_prop_lib {

/**
 * @enum BackendType
 * @brief Supported compute backends
 */
enum class BackendType {
    CPU,          ///< Host memory + FFTW
    OPENCL,       ///< OpenCL device + clFFT
    AUTO          ///< OpenCL if a GPU is present, otherwise CPU
};

/**
 * @brief Convert BackendType to string
 */
inline const char* BackendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::CPU:    return "CPU";
        case BackendType::OPENCL: return "OpenCL";
        case BackendType::AUTO:   return "Auto";
        default:                  return "Unknown";
    }
}

/**
 * @brief Parse BackendType from a config string (case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
inline BackendType BackendTypeFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "CPU")    return BackendType::CPU;
    if (upper == "OPENCL") return BackendType::OPENCL;
    if (upper == "AUTO")   return BackendType::AUTO;

    throw std::invalid_argument("Unknown backend type: " + name);
}

} // namespace field_prop_lib
