#pragma once

/**
 * @file field_prop.hpp
 * @brief FieldProp - owner of the execution backend (not a singleton)
 *
 * One FieldProp object selects and owns one IBackend. Propagators borrow
 * it by reference through GetBackend().
 *
 * @code
 * FieldProp fp(BackendType::AUTO);
 * fp.Initialize();
 * AngularSpectrumPropagator asm_prop(fp.GetBackend());
 * @endcode
 *
 * AUTO resolves in Initialize(): OpenCL when a GPU with double precision
 * is present, CPU otherwise.
 */

#include "common/i_backend.hpp"
#include "common/backend_type.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace field_prop_lib {

class FieldProp {
public:
    explicit FieldProp(BackendType backend_type = BackendType::AUTO, int device_index = 0);
    ~FieldProp();

    FieldProp(const FieldProp&) = delete;
    FieldProp& operator=(const FieldProp&) = delete;
    FieldProp(FieldProp&& other) noexcept;
    FieldProp& operator=(FieldProp&& other) noexcept;

    // ═══════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Create and initialize the backend
     * @throws std::runtime_error if an explicitly requested backend
     *         cannot be initialized
     */
    void Initialize();
    bool IsInitialized() const { return initialized_; }
    void Cleanup();

    // ═══════════════════════════════════════════════════════════════
    // Information
    // ═══════════════════════════════════════════════════════════════

    /// Requested type (may be AUTO)
    BackendType GetRequestedType() const { return requested_type_; }

    /// Effective type after Initialize() (never AUTO once initialized)
    BackendType GetBackendType() const;

    int GetDeviceIndex() const { return device_index_; }
    std::string GetDeviceName() const;

    // ═══════════════════════════════════════════════════════════════
    // Access
    // ═══════════════════════════════════════════════════════════════

    /// @throws std::runtime_error before Initialize()
    IBackend& GetBackend();
    const IBackend& GetBackend() const;

    void Synchronize();

private:
    std::unique_ptr<IBackend> CreateBackend(BackendType type) const;
    std::unique_ptr<IBackend> InitializeAuto();

    BackendType requested_type_;
    int device_index_;
    bool initialized_;

    std::unique_ptr<IBackend> backend_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
