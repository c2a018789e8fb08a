#pragma once

/**
 * @file device_buffer.hpp
 * @brief DeviceBuffer - RAII wrapper for backend memory
 *
 * Typed buffer with automatic release through the owning IBackend.
 * ToDevice() / ToHost() are the only way the propagators move arrays
 * between host and backend memory.
 *
 * Usage:
 * @code
 * auto buffer = ToDevice(backend, field.Samples());
 * backend.Fft2D(buffer.GetPtr(), n, FftDirection::FORWARD);
 * std::vector<std::complex<double>> out = ToHost(buffer);
 * @endcode
 */

#include "i_backend.hpp"

#include <vector>
#include <stdexcept>
#include <string>

namespace field_prop_lib {

// ════════════════════════════════════════════════════════════════════════════
// Class: DeviceBuffer
// ════════════════════════════════════════════════════════════════════════════

template<typename T>
class DeviceBuffer {
public:
    /**
     * @brief Allocate num_elements of T on the backend
     * @throws std::invalid_argument if num_elements is 0
     * @throws std::runtime_error if the backend cannot allocate
     */
    DeviceBuffer(IBackend& backend, size_t num_elements)
        : ptr_(nullptr),
          num_elements_(num_elements),
          size_bytes_(num_elements * sizeof(T)),
          backend_(&backend)
    {
        if (num_elements_ == 0) {
            throw std::invalid_argument("DeviceBuffer: num_elements must be positive");
        }
        ptr_ = backend_->Allocate(size_bytes_);
        if (!ptr_) {
            throw std::runtime_error("DeviceBuffer: allocation of " +
                                     std::to_string(size_bytes_) + " bytes failed");
        }
    }

    ~DeviceBuffer() {
        if (ptr_ && backend_) {
            backend_->Free(ptr_);
        }
    }

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    DeviceBuffer(DeviceBuffer&& other) noexcept
        : ptr_(other.ptr_),
          num_elements_(other.num_elements_),
          size_bytes_(other.size_bytes_),
          backend_(other.backend_)
    {
        other.ptr_ = nullptr;
        other.backend_ = nullptr;
    }

    DeviceBuffer& operator=(DeviceBuffer&& other) noexcept {
        if (this != &other) {
            if (ptr_ && backend_) {
                backend_->Free(ptr_);
            }
            ptr_ = other.ptr_;
            num_elements_ = other.num_elements_;
            size_bytes_ = other.size_bytes_;
            backend_ = other.backend_;

            other.ptr_ = nullptr;
            other.backend_ = nullptr;
        }
        return *this;
    }

    // ═══════════════════════════════════════════════════════════════
    // Data transfer
    // ═══════════════════════════════════════════════════════════════

    void Write(const std::vector<T>& data) {
        if (data.size() != num_elements_) {
            throw std::runtime_error("DeviceBuffer::Write: size mismatch (" +
                                     std::to_string(data.size()) + " vs " +
                                     std::to_string(num_elements_) + ")");
        }
        backend_->MemcpyHostToDevice(ptr_, data.data(), size_bytes_);
    }

    std::vector<T> Read() const {
        std::vector<T> result(num_elements_);
        backend_->MemcpyDeviceToHost(result.data(), ptr_, size_bytes_);
        return result;
    }

    void CopyFrom(const DeviceBuffer<T>& other) {
        if (other.GetSizeBytes() != size_bytes_) {
            throw std::runtime_error("DeviceBuffer::CopyFrom: size mismatch");
        }
        backend_->MemcpyDeviceToDevice(ptr_, other.GetPtr(), size_bytes_);
    }

    // ═══════════════════════════════════════════════════════════════
    // Info
    // ═══════════════════════════════════════════════════════════════

    void* GetPtr() const { return ptr_; }
    size_t GetNumElements() const { return num_elements_; }
    size_t GetSizeBytes() const { return size_bytes_; }
    bool IsValid() const { return ptr_ != nullptr && backend_ != nullptr; }

private:
    void* ptr_;              ///< Backend handle
    size_t num_elements_;
    size_t size_bytes_;
    IBackend* backend_;      ///< Not owned
};

// ════════════════════════════════════════════════════════════════════════════
// Host <-> backend helpers
// ════════════════════════════════════════════════════════════════════════════

template<typename T>
DeviceBuffer<T> ToDevice(IBackend& backend, const std::vector<T>& host) {
    DeviceBuffer<T> buffer(backend, host.size());
    buffer.Write(host);
    return buffer;
}

template<typename T>
std::vector<T> ToHost(const DeviceBuffer<T>& buffer) {
    return buffer.Read();
}

} // namespace field_prop_lib
