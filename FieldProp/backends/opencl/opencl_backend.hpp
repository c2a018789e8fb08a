#pragma once

/**
 * @file opencl_backend.hpp
 * @brief OpenCLBackend - IBackend on an OpenCL GPU with clFFT
 *
 * Owns the OpenCLCore (context), one in-order command queue, the clFFT
 * plan cache and the complex_multiply kernel. Device handles returned by
 * Allocate() are cl_mem objects.
 *
 * Requires a device with cl_khr_fp64: Initialize() throws otherwise.
 */

#include "common/i_backend.hpp"
#include "opencl_core.hpp"
#include "clfft_plan_cache.hpp"

#include <CL/cl.h>

#include <memory>
#include <mutex>
#include <string>

namespace field_prop_lib {

// ════════════════════════════════════════════════════════════════════════════
// Class: OpenCLBackend
// ════════════════════════════════════════════════════════════════════════════

class OpenCLBackend : public IBackend {
public:
    OpenCLBackend();
    ~OpenCLBackend() override;

    OpenCLBackend(const OpenCLBackend&) = delete;
    OpenCLBackend& operator=(const OpenCLBackend&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // IBackend: lifecycle
    // ═══════════════════════════════════════════════════════════════

    void Initialize(int device_index) override;
    bool IsInitialized() const override { return initialized_; }
    void Cleanup() override;

    // ═══════════════════════════════════════════════════════════════
    // IBackend: device information
    // ═══════════════════════════════════════════════════════════════

    BackendType GetType() const override { return BackendType::OPENCL; }
    int GetDeviceIndex() const override { return device_index_; }
    std::string GetDeviceName() const override;
    bool SupportsDoublePrecision() const override;

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
    void Synchronize() override;

    // ═══════════════════════════════════════════════════════════════
    // OpenCL specific
    // ═══════════════════════════════════════════════════════════════

    OpenCLCore& GetCore();
    const OpenCLCore& GetCore() const;

    cl_command_queue GetQueue() const { return queue_; }

    const ClfftPlanCache* GetPlanCache() const { return plan_cache_.get(); }

private:
    void CreateQueue();
    void CompileKernels();
    void ReleaseResources();
    void RequireInitialized(const char* operation) const;

    int device_index_;
    bool initialized_;
    bool clfft_acquired_;

    std::unique_ptr<OpenCLCore> core_;
    std::unique_ptr<ClfftPlanCache> plan_cache_;

    cl_context context_;
    cl_device_id device_;
    cl_command_queue queue_;
    cl_program program_;
    cl_kernel multiply_kernel_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
