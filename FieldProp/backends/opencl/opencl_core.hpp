#pragma once

/**
 * @file opencl_core.hpp
 * @brief OpenCLCore - platform/device discovery and context for one device
 *
 * Devices are enumerated across all platforms in platform order; the
 * device index used by the backend is the position in that list.
 */

#include <CL/cl.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace field_prop_lib {

enum class DeviceType {
    GPU,  // CL_DEVICE_TYPE_GPU
    CPU   // CL_DEVICE_TYPE_CPU
};

// ════════════════════════════════════════════════════════════════════════════
// OpenCLCore
// ════════════════════════════════════════════════════════════════════════════

class OpenCLCore {
public:
    explicit OpenCLCore(int device_index = 0, DeviceType device_type = DeviceType::GPU);
    ~OpenCLCore();

    OpenCLCore(const OpenCLCore&) = delete;
    OpenCLCore& operator=(const OpenCLCore&) = delete;
    OpenCLCore(OpenCLCore&& other) noexcept;
    OpenCLCore& operator=(OpenCLCore&& other) noexcept;

    // ═══════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Select the device and create its context
     * @throws std::runtime_error if there is no such device
     */
    void Initialize();
    void Cleanup();
    bool IsInitialized() const { return initialized_; }

    // ═══════════════════════════════════════════════════════════════
    // Handles
    // ═══════════════════════════════════════════════════════════════

    cl_context GetContext() const { return context_; }
    cl_device_id GetDevice() const { return device_; }
    cl_platform_id GetPlatform() const { return platform_; }
    int GetDeviceIndex() const { return device_index_; }
    DeviceType GetDeviceType() const { return device_type_; }

    // ═══════════════════════════════════════════════════════════════
    // Device information
    // ═══════════════════════════════════════════════════════════════

    std::string GetDeviceName() const;
    std::string GetExtensions() const;

    /// cl_khr_fp64 or a non-zero CL_DEVICE_DOUBLE_FP_CONFIG
    bool SupportsDoublePrecision() const;

    // ═══════════════════════════════════════════════════════════════
    // Discovery
    // ═══════════════════════════════════════════════════════════════

    static int GetAvailableDeviceCount(DeviceType device_type = DeviceType::GPU);

    static std::vector<std::pair<cl_platform_id, cl_device_id>>
        GetAllDevices(DeviceType device_type = DeviceType::GPU);

private:
    void InitializeOpenCL();
    void ReleaseResources();

    template<typename T>
    T GetDeviceInfoValue(cl_device_info param) const;
    std::string GetDeviceInfoString(cl_device_info param) const;

    int device_index_;
    DeviceType device_type_;
    bool initialized_;

    cl_platform_id platform_;
    cl_device_id device_;
    cl_context context_;

    mutable std::mutex mutex_;
};

// ════════════════════════════════════════════════════════════════════════════
// Error check helper
// ════════════════════════════════════════════════════════════════════════════

inline void CheckCLError(cl_int error, const std::string& operation) {
    if (error != CL_SUCCESS) {
        throw std::runtime_error("OpenCL Error [" + std::to_string(error) + "] in " + operation);
    }
}

} // namespace field_prop_lib
