#include "opencl_core.hpp"
#include "logger/logger.hpp"

namespace field_prop_lib {

OpenCLCore::OpenCLCore(int device_index, DeviceType device_type)
    : device_index_(device_index),
      device_type_(device_type),
      initialized_(false),
      platform_(nullptr),
      device_(nullptr),
      context_(nullptr) {
}

OpenCLCore::~OpenCLCore() {
    if (initialized_) {
        ReleaseResources();
        initialized_ = false;
    }
}

OpenCLCore::OpenCLCore(OpenCLCore&& other) noexcept
    : device_index_(other.device_index_),
      device_type_(other.device_type_),
      initialized_(other.initialized_),
      platform_(other.platform_),
      device_(other.device_),
      context_(other.context_) {
    other.initialized_ = false;
    other.platform_ = nullptr;
    other.device_ = nullptr;
    other.context_ = nullptr;
}

OpenCLCore& OpenCLCore::operator=(OpenCLCore&& other) noexcept {
    if (this != &other) {
        Cleanup();
        device_index_ = other.device_index_;
        device_type_ = other.device_type_;
        initialized_ = other.initialized_;
        platform_ = other.platform_;
        device_ = other.device_;
        context_ = other.context_;

        other.initialized_ = false;
        other.platform_ = nullptr;
        other.device_ = nullptr;
        other.context_ = nullptr;
    }
    return *this;
}

// ════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════════════════════════

void OpenCLCore::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }
    InitializeOpenCL();
    initialized_ = true;
    FIELDPROP_LOG_INFO("OpenCLCore", "Device " + std::to_string(device_index_) +
                       " initialized: " + GetDeviceName());
}

void OpenCLCore::InitializeOpenCL() {
    auto all_devices = GetAllDevices(device_type_);
    if (all_devices.empty()) {
        throw std::runtime_error(
            "No OpenCL devices found for type: " +
            std::string(device_type_ == DeviceType::GPU ? "GPU" : "CPU"));
    }

    if (device_index_ < 0 || device_index_ >= static_cast<int>(all_devices.size())) {
        throw std::runtime_error(
            "Invalid device index: " + std::to_string(device_index_) +
            ". Available devices: " + std::to_string(all_devices.size()));
    }

    platform_ = all_devices[device_index_].first;
    device_ = all_devices[device_index_].second;

    cl_context_properties props[] = {
        CL_CONTEXT_PLATFORM, reinterpret_cast<cl_context_properties>(platform_),
        0
    };

    cl_int err = CL_SUCCESS;
    context_ = clCreateContext(props, 1, &device_, nullptr, nullptr, &err);
    CheckCLError(err, "clCreateContext for device " + std::to_string(device_index_));
}

void OpenCLCore::Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        ReleaseResources();
        initialized_ = false;
        FIELDPROP_LOG_DEBUG("OpenCLCore", "Device " + std::to_string(device_index_) + " cleaned up");
    }
}

void OpenCLCore::ReleaseResources() {
    if (context_) {
        clReleaseContext(context_);
        context_ = nullptr;
    }
    device_ = nullptr;
    platform_ = nullptr;
}

// ════════════════════════════════════════════════════════════════════════════
// Discovery
// ════════════════════════════════════════════════════════════════════════════

int OpenCLCore::GetAvailableDeviceCount(DeviceType device_type) {
    return static_cast<int>(GetAllDevices(device_type).size());
}

std::vector<std::pair<cl_platform_id, cl_device_id>>
OpenCLCore::GetAllDevices(DeviceType device_type) {
    std::vector<std::pair<cl_platform_id, cl_device_id>> result;

    cl_uint num_platforms = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &num_platforms);
    if (err != CL_SUCCESS || num_platforms == 0) {
        return result;
    }

    std::vector<cl_platform_id> platforms(num_platforms);
    err = clGetPlatformIDs(num_platforms, platforms.data(), nullptr);
    if (err != CL_SUCCESS) {
        return result;
    }

    cl_device_type cl_dev_type =
        (device_type == DeviceType::GPU) ? CL_DEVICE_TYPE_GPU : CL_DEVICE_TYPE_CPU;

    for (const auto& platform : platforms) {
        cl_uint num_devices = 0;
        err = clGetDeviceIDs(platform, cl_dev_type, 0, nullptr, &num_devices);
        if (err != CL_SUCCESS || num_devices == 0) {
            continue;
        }

        std::vector<cl_device_id> devices(num_devices);
        err = clGetDeviceIDs(platform, cl_dev_type, num_devices, devices.data(), nullptr);
        if (err != CL_SUCCESS) {
            continue;
        }

        for (const auto& device : devices) {
            result.emplace_back(platform, device);
        }
    }

    return result;
}

// ════════════════════════════════════════════════════════════════════════════
// Device information
// ════════════════════════════════════════════════════════════════════════════

template<typename T>
T OpenCLCore::GetDeviceInfoValue(cl_device_info param) const {
    T value{};
    if (device_) {
        cl_int err = clGetDeviceInfo(device_, param, sizeof(T), &value, nullptr);
        if (err != CL_SUCCESS) {
            FIELDPROP_LOG_WARNING("OpenCLCore", "Failed to get device info param " +
                                  std::to_string(param));
        }
    }
    return value;
}

std::string OpenCLCore::GetDeviceInfoString(cl_device_info param) const {
    if (!device_) {
        return "";
    }
    size_t size = 0;
    cl_int err = clGetDeviceInfo(device_, param, 0, nullptr, &size);
    if (err != CL_SUCCESS || size == 0) {
        return "";
    }
    std::vector<char> buffer(size);
    err = clGetDeviceInfo(device_, param, size, buffer.data(), nullptr);
    if (err != CL_SUCCESS) {
        return "";
    }
    return std::string(buffer.data());
}

std::string OpenCLCore::GetDeviceName() const {
    return GetDeviceInfoString(CL_DEVICE_NAME);
}

std::string OpenCLCore::GetExtensions() const {
    return GetDeviceInfoString(CL_DEVICE_EXTENSIONS);
}

bool OpenCLCore::SupportsDoublePrecision() const {
    if (GetExtensions().find("cl_khr_fp64") != std::string::npos) {
        return true;
    }
    return GetDeviceInfoValue<cl_device_fp_config>(CL_DEVICE_DOUBLE_FP_CONFIG) != 0;
}

} // namespace field_prop_lib
