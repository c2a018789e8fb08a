#include "cpu_backend.hpp"
#include "logger/logger.hpp"

#include <complex>
#include <cstring>
#include <stdexcept>

namespace field_prop_lib {

CpuBackend::CpuBackend()
    : initialized_(false) {
}

CpuBackend::~CpuBackend() {
    Cleanup();
}

// ════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════════════════════════

void CpuBackend::Initialize(int device_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }
    if (device_index != 0) {
        FIELDPROP_LOG_WARNING("CPU", "device_index " + std::to_string(device_index) +
                              " ignored, the host is device 0");
    }
    initialized_ = true;
    FIELDPROP_LOG_INFO("CPU", "CpuBackend initialized (FFTW " +
                       std::string(fftw_version) + ")");
}

void CpuBackend::Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ && allocations_.empty()) {
        return;
    }

    if (!allocations_.empty()) {
        FIELDPROP_LOG_WARNING("CPU", "Cleanup with " + std::to_string(allocations_.size()) +
                              " live allocation(s), releasing them");
        for (void* ptr : allocations_) {
            fftw_free(ptr);
        }
        allocations_.clear();
    }

    plan_cache_.ClearAll();
    initialized_ = false;
    FIELDPROP_LOG_DEBUG("CPU", "CpuBackend cleaned up");
}

std::string CpuBackend::GetDeviceName() const {
    return "Host CPU (FFTW3)";
}

void CpuBackend::RequireInitialized(const char* operation) const {
    if (!initialized_) {
        throw std::runtime_error(std::string("CpuBackend::") + operation +
                                 ": backend not initialized");
    }
}

// ════════════════════════════════════════════════════════════════════════════
// Memory
// ════════════════════════════════════════════════════════════════════════════

void* CpuBackend::Allocate(size_t size_bytes) {
    RequireInitialized("Allocate");

    void* ptr = fftw_malloc(size_bytes);
    if (!ptr) {
        throw std::runtime_error("CpuBackend::Allocate: fftw_malloc failed for " +
                                 std::to_string(size_bytes) + " bytes");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    allocations_.insert(ptr);
    return ptr;
}

void CpuBackend::Free(void* ptr) {
    if (!ptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocations_.find(ptr);
    if (it == allocations_.end()) {
        // Already released by Cleanup()
        return;
    }
    fftw_free(ptr);
    allocations_.erase(it);
}

void CpuBackend::MemcpyHostToDevice(void* dst, const void* src, size_t size_bytes) {
    std::memcpy(dst, src, size_bytes);
}

void CpuBackend::MemcpyDeviceToHost(void* dst, const void* src, size_t size_bytes) {
    std::memcpy(dst, src, size_bytes);
}

void CpuBackend::MemcpyDeviceToDevice(void* dst, const void* src, size_t size_bytes) {
    std::memmove(dst, src, size_bytes);
}

size_t CpuBackend::GetAllocationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_.size();
}

// ════════════════════════════════════════════════════════════════════════════
// Compute
// ════════════════════════════════════════════════════════════════════════════

void CpuBackend::Fft2D(void* buffer, size_t n, FftDirection direction) {
    RequireInitialized("Fft2D");
    if (n == 0) {
        throw std::invalid_argument("CpuBackend::Fft2D: n must be positive");
    }

    fftw_plan plan = plan_cache_.GetOrCreate(n, direction);
    auto* data = static_cast<fftw_complex*>(buffer);
    fftw_execute_dft(plan, data, data);

    if (direction == FftDirection::INVERSE) {
        // FFTW_BACKWARD is unnormalised
        const double scale = 1.0 / static_cast<double>(n * n);
        auto* samples = static_cast<std::complex<double>*>(buffer);
        const size_t count = n * n;
        for (size_t i = 0; i < count; ++i) {
            samples[i] *= scale;
        }
    }
}

void CpuBackend::Multiply(void* buffer, const void* factor, size_t count) {
    RequireInitialized("Multiply");

    auto* dst = static_cast<std::complex<double>*>(buffer);
    const auto* src = static_cast<const std::complex<double>*>(factor);
    for (size_t i = 0; i < count; ++i) {
        dst[i] *= src[i];
    }
}

} // namespace field_prop_lib
