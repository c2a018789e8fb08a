#include "field_prop.hpp"
#include "backends/cpu/cpu_backend.hpp"
#include "backends/opencl/opencl_backend.hpp"
#include "backends/opencl/opencl_core.hpp"
#include "logger/logger.hpp"

#include <stdexcept>

namespace field_prop_lib {

// ════════════════════════════════════════════════════════════════════════════
// FieldProp
// ════════════════════════════════════════════════════════════════════════════

FieldProp::FieldProp(BackendType backend_type, int device_index)
    : requested_type_(backend_type),
      device_index_(device_index),
      initialized_(false),
      backend_(nullptr) {
}

FieldProp::~FieldProp() {
    Cleanup();
}

FieldProp::FieldProp(FieldProp&& other) noexcept
    : requested_type_(other.requested_type_),
      device_index_(other.device_index_),
      initialized_(other.initialized_),
      backend_(std::move(other.backend_)) {
    other.initialized_ = false;
}

FieldProp& FieldProp::operator=(FieldProp&& other) noexcept {
    if (this != &other) {
        Cleanup();
        requested_type_ = other.requested_type_;
        device_index_ = other.device_index_;
        initialized_ = other.initialized_;
        backend_ = std::move(other.backend_);
        other.initialized_ = false;
    }
    return *this;
}

std::unique_ptr<IBackend> FieldProp::CreateBackend(BackendType type) const {
    switch (type) {
        case BackendType::CPU:
            return std::make_unique<CpuBackend>();
        case BackendType::OPENCL:
            return std::make_unique<OpenCLBackend>();
        default:
            throw std::runtime_error("FieldProp: cannot create backend of type " +
                                     std::string(BackendTypeToString(type)));
    }
}

std::unique_ptr<IBackend> FieldProp::InitializeAuto() {
    if (OpenCLCore::GetAvailableDeviceCount(DeviceType::GPU) > device_index_) {
        auto gpu = CreateBackend(BackendType::OPENCL);
        try {
            gpu->Initialize(device_index_);
            return gpu;
        } catch (const std::runtime_error& e) {
            FIELDPROP_LOG_WARNING("FieldProp", std::string("OpenCL unavailable (") + e.what() +
                                  "), falling back to CPU");
        }
    } else {
        FIELDPROP_LOG_INFO("FieldProp", "No OpenCL GPU at index " + std::to_string(device_index_) +
                           ", using CPU");
    }

    auto cpu = CreateBackend(BackendType::CPU);
    cpu->Initialize(0);
    return cpu;
}

void FieldProp::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        FIELDPROP_LOG_WARNING("FieldProp", "Already initialized");
        return;
    }

    if (requested_type_ == BackendType::AUTO) {
        backend_ = InitializeAuto();
    } else {
        backend_ = CreateBackend(requested_type_);
        backend_->Initialize(device_index_);
    }

    initialized_ = true;
    FIELDPROP_LOG_INFO("FieldProp", std::string("Backend ") +
                       BackendTypeToString(backend_->GetType()) + ": " +
                       backend_->GetDeviceName());
}

void FieldProp::Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (backend_) {
        backend_->Cleanup();
        backend_.reset();
    }
    initialized_ = false;
}

// ════════════════════════════════════════════════════════════════════════════
// Information / access
// ════════════════════════════════════════════════════════════════════════════

BackendType FieldProp::GetBackendType() const {
    if (!initialized_ || !backend_) {
        return requested_type_;
    }
    return backend_->GetType();
}

std::string FieldProp::GetDeviceName() const {
    if (!initialized_ || !backend_) {
        return "Unknown";
    }
    return backend_->GetDeviceName();
}

IBackend& FieldProp::GetBackend() {
    if (!initialized_ || !backend_) {
        throw std::runtime_error("FieldProp not initialized");
    }
    return *backend_;
}

const IBackend& FieldProp::GetBackend() const {
    if (!initialized_ || !backend_) {
        throw std::runtime_error("FieldProp not initialized");
    }
    return *backend_;
}

void FieldProp::Synchronize() {
    if (initialized_ && backend_) {
        backend_->Synchronize();
    }
}

} // namespace field_prop_lib
