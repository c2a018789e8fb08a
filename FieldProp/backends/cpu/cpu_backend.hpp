#pragma once

/**
 * @file cpu_backend.hpp
 * @brief CpuBackend - host memory and FFTW transforms
 *
 * "Device" memory is host memory from fftw_malloc; the memcpy family is
 * plain std::memcpy. Used when no OpenCL device is present and as the
 * reference the OpenCL backend is checked against.
 */

#include "common/i_backend.hpp"
#include "fftw_plan_cache.hpp"

#include <mutex>
#include <set>
#include <string>

namespace field_prop_lib {

class CpuBackend : public IBackend {
public:
    CpuBackend();
    ~CpuBackend() override;

    CpuBackend(const CpuBackend&) = delete;
    CpuBackend& operator=(const CpuBackend&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // IBackend: lifecycle
    // ═══════════════════════════════════════════════════════════════

    void Initialize(int device_index) override;
    bool IsInitialized() const override { return initialized_; }
    void Cleanup() override;

    // ═══════════════════════════════════════════════════════════════
    // IBackend: device information
    // ═══════════════════════════════════════════════════════════════

    BackendType GetType() const override { return BackendType::CPU; }
    int GetDeviceIndex() const override { return 0; }
    std::string GetDeviceName() const override;
    bool SupportsDoublePrecision() const override { return true; }

    // ═══════════════════════════════════════════════════════════════
    // IBackend: memory
    // ═══════════════════════════════════════════════════════════════

    void* Allocate(size_t size_bytes) override;
    void Free(void* ptr) override;

    void MemcpyHostToDevice(void* dst, const void* src, size_t size_bytes) override;
    void MemcpyDeviceToHost(void* dst, const void* src, size_t size_bytes) override;
    void MemcpyDeviceToDevice(void* dst, const void* src, size_t size_bytes) override;

    // ═══════════════════════════════════════════════════════════════
    // IBackend: compute
    // ═══════════════════════════════════════════════════════════════

    void Fft2D(void* buffer, size_t n, FftDirection direction) override;
    void Multiply(void* buffer, const void* factor, size_t count) override;
    void Synchronize() override {}

    // ═══════════════════════════════════════════════════════════════
    // CPU specific
    // ═══════════════════════════════════════════════════════════════

    const FftwPlanCache& GetPlanCache() const { return plan_cache_; }

    /// Number of live allocations (leak check in tests)
    size_t GetAllocationCount() const;

private:
    void RequireInitialized(const char* operation) const;

    bool initialized_;
    FftwPlanCache plan_cache_;
    std::set<void*> allocations_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
