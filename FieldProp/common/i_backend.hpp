#pragma once

/**
 * @file i_backend.hpp
 * @brief Abstract interface for execution backends (CPU, OpenCL)
 *
 * IBackend is the Bridge between the propagators and the place where the
 * arrays actually live. A propagator never asks whether a field is "already
 * on the device": it uploads once through the backend it was given, runs
 * FFT / multiply steps there, and downloads the result.
 *
 * Implementations:
 * - CpuBackend    (see backends/cpu/cpu_backend.hpp)
 * - OpenCLBackend (see backends/opencl/opencl_backend.hpp)
 */

#include "backend_type.hpp"

#include <string>
#include <cstddef>

namespace field_prop_lib {

/**
 * @enum FftDirection
 * @brief Direction of a 2D transform
 *
 * FORWARD is unnormalised, INVERSE is scaled by 1/(n*n) so that
 * INVERSE(FORWARD(u)) == u.
 */
enum class FftDirection {
    FORWARD,
    INVERSE
};

// ════════════════════════════════════════════════════════════════════════════
// Interface: IBackend
// ════════════════════════════════════════════════════════════════════════════

/**
 * @interface IBackend
 * @brief Memory placement and the two compute primitives the propagators need
 *
 * All device buffers hold interleaved std::complex<double> samples in
 * row-major order.
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Initialize the backend for a device
     * @param device_index Device index (ignored by CpuBackend)
     * @throws std::runtime_error on initialization failure
     */
    virtual void Initialize(int device_index) = 0;

    virtual bool IsInitialized() const = 0;

    /**
     * @brief Release plans, queues and contexts
     */
    virtual void Cleanup() = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Device information
    // ═══════════════════════════════════════════════════════════════════════

    virtual BackendType GetType() const = 0;
    virtual int GetDeviceIndex() const = 0;
    virtual std::string GetDeviceName() const = 0;
    virtual bool SupportsDoublePrecision() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Memory
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Allocate device memory
     * @return Opaque handle (host pointer or cl_mem)
     * @throws std::runtime_error when the allocation fails
     */
    virtual void* Allocate(size_t size_bytes) = 0;

    virtual void Free(void* ptr) = 0;

    virtual void MemcpyHostToDevice(void* dst, const void* src, size_t size_bytes) = 0;
    virtual void MemcpyDeviceToHost(void* dst, const void* src, size_t size_bytes) = 0;
    virtual void MemcpyDeviceToDevice(void* dst, const void* src, size_t size_bytes) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Compute
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief In-place 2D FFT of an n x n complex<double> buffer
     * @param buffer Device handle from Allocate()
     * @param n Side length
     * @param direction FORWARD (unnormalised) or INVERSE (scaled by 1/n^2)
     */
    virtual void Fft2D(void* buffer, size_t n, FftDirection direction) = 0;

    /**
     * @brief buffer[i] *= factor[i] for i in [0, count)
     */
    virtual void Multiply(void* buffer, const void* factor, size_t count) = 0;

    /**
     * @brief Wait until all queued work has finished
     */
    virtual void Synchronize() = 0;
};

} // namespace field_prop_lib
