#include "opencl_backend.hpp"
#include "kernels/field_kernel_sources.hpp"
#include "logger/logger.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>

namespace field_prop_lib {

namespace {

constexpr size_t kMultiplyWorkGroup = 64;

} // namespace

OpenCLBackend::OpenCLBackend()
    : device_index_(-1),
      initialized_(false),
      clfft_acquired_(false),
      context_(nullptr),
      device_(nullptr),
      queue_(nullptr),
      program_(nullptr),
      multiply_kernel_(nullptr) {
}

OpenCLBackend::~OpenCLBackend() {
    Cleanup();
}

// ════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════════════════════════

void OpenCLBackend::Initialize(int device_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        ReleaseResources();
    }

    device_index_ = device_index;

    try {
        core_ = std::make_unique<OpenCLCore>(device_index, DeviceType::GPU);
        core_->Initialize();
        context_ = core_->GetContext();
        device_ = core_->GetDevice();

        if (!core_->SupportsDoublePrecision()) {
            throw std::runtime_error("OpenCLBackend::Initialize - device " +
                                     std::to_string(device_index) + " (" +
                                     core_->GetDeviceName() + ") lacks cl_khr_fp64");
        }

        CreateQueue();
        CompileKernels();

        ClfftLibrary::Acquire();
        clfft_acquired_ = true;
        plan_cache_ = std::make_unique<ClfftPlanCache>(context_, queue_);
    } catch (const std::exception& e) {
        FIELDPROP_LOG_ERROR("OpenCLBackend", e.what());
        ReleaseResources();
        throw;
    }

    initialized_ = true;
    FIELDPROP_LOG_INFO("OpenCLBackend", "Initialized device " + std::to_string(device_index) +
                       ": " + core_->GetDeviceName());
}

void OpenCLBackend::CreateQueue() {
    cl_int err = CL_SUCCESS;
#ifdef CL_VERSION_2_0
    cl_queue_properties props[] = {0};
    queue_ = clCreateCommandQueueWithProperties(context_, device_, props, &err);
#else
    queue_ = clCreateCommandQueue(context_, device_, 0, &err);
#endif
    if (err != CL_SUCCESS || !queue_) {
        throw std::runtime_error(
            "OpenCLBackend::Initialize - Failed to create command queue for device " +
            std::to_string(device_index_) + ". Error code: " + std::to_string(err));
    }
}

void OpenCLBackend::CompileKernels() {
    cl_int err = CL_SUCCESS;

    const char* source = kernels::GetComplexMultiplyKernelSource();
    size_t source_len = std::strlen(source);

    program_ = clCreateProgramWithSource(context_, 1, &source, &source_len, &err);
    CheckCLError(err, "clCreateProgramWithSource");

    err = clBuildProgram(program_, 1, &device_, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t log_size = 0;
        clGetProgramBuildInfo(program_, device_, CL_PROGRAM_BUILD_LOG, 0, nullptr, &log_size);
        std::vector<char> log(log_size + 1, '\0');
        clGetProgramBuildInfo(program_, device_, CL_PROGRAM_BUILD_LOG, log_size, log.data(), nullptr);
        FIELDPROP_LOG_ERROR("OpenCLBackend", std::string("Build log:\n") + log.data());
        throw std::runtime_error("clBuildProgram failed: " + std::to_string(err));
    }

    multiply_kernel_ = clCreateKernel(program_, kernels::GetComplexMultiplyKernelName(), &err);
    CheckCLError(err, "clCreateKernel complex_multiply");
}

void OpenCLBackend::Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }
    ReleaseResources();
    FIELDPROP_LOG_DEBUG("OpenCLBackend", "Device " + std::to_string(device_index_) + " cleaned up");
}

/**
 * Order matters: plans before clfftTeardown, everything before the context.
 */
void OpenCLBackend::ReleaseResources() {
    if (queue_) {
        clFinish(queue_);
    }

    plan_cache_.reset();
    if (clfft_acquired_) {
        ClfftLibrary::Release();
        clfft_acquired_ = false;
    }

    if (multiply_kernel_) {
        clReleaseKernel(multiply_kernel_);
        multiply_kernel_ = nullptr;
    }
    if (program_) {
        clReleaseProgram(program_);
        program_ = nullptr;
    }
    if (queue_) {
        clReleaseCommandQueue(queue_);
        queue_ = nullptr;
    }

    context_ = nullptr;
    device_ = nullptr;
    core_.reset();

    initialized_ = false;
}

void OpenCLBackend::RequireInitialized(const char* operation) const {
    if (!initialized_) {
        throw std::runtime_error(std::string("OpenCLBackend::") + operation +
                                 ": backend not initialized");
    }
}

// ════════════════════════════════════════════════════════════════════════════
// Device information
// ════════════════════════════════════════════════════════════════════════════

std::string OpenCLBackend::GetDeviceName() const {
    if (!core_ || !core_->IsInitialized()) {
        return "";
    }
    return core_->GetDeviceName();
}

bool OpenCLBackend::SupportsDoublePrecision() const {
    if (!core_ || !core_->IsInitialized()) {
        return false;
    }
    return core_->SupportsDoublePrecision();
}

OpenCLCore& OpenCLBackend::GetCore() {
    if (!core_) {
        throw std::runtime_error("OpenCLBackend::GetCore: backend not initialized");
    }
    return *core_;
}

const OpenCLCore& OpenCLBackend::GetCore() const {
    if (!core_) {
        throw std::runtime_error("OpenCLBackend::GetCore: backend not initialized");
    }
    return *core_;
}

// ════════════════════════════════════════════════════════════════════════════
// Memory
// ════════════════════════════════════════════════════════════════════════════

void* OpenCLBackend::Allocate(size_t size_bytes) {
    RequireInitialized("Allocate");

    cl_int err = CL_SUCCESS;
    cl_mem mem = clCreateBuffer(context_, CL_MEM_READ_WRITE, size_bytes, nullptr, &err);
    CheckCLError(err, "clCreateBuffer (" + std::to_string(size_bytes) + " bytes)");
    return static_cast<void*>(mem);
}

void OpenCLBackend::Free(void* ptr) {
    if (ptr) {
        clReleaseMemObject(static_cast<cl_mem>(ptr));
    }
}

void OpenCLBackend::MemcpyHostToDevice(void* dst, const void* src, size_t size_bytes) {
    RequireInitialized("MemcpyHostToDevice");
    cl_int err = clEnqueueWriteBuffer(queue_, static_cast<cl_mem>(dst), CL_TRUE,
                                      0, size_bytes, src, 0, nullptr, nullptr);
    CheckCLError(err, "clEnqueueWriteBuffer");
}

void OpenCLBackend::MemcpyDeviceToHost(void* dst, const void* src, size_t size_bytes) {
    RequireInitialized("MemcpyDeviceToHost");
    cl_mem src_mem = static_cast<cl_mem>(const_cast<void*>(src));
    cl_int err = clEnqueueReadBuffer(queue_, src_mem, CL_TRUE,
                                     0, size_bytes, dst, 0, nullptr, nullptr);
    CheckCLError(err, "clEnqueueReadBuffer");
}

void OpenCLBackend::MemcpyDeviceToDevice(void* dst, const void* src, size_t size_bytes) {
    RequireInitialized("MemcpyDeviceToDevice");
    cl_mem src_mem = static_cast<cl_mem>(const_cast<void*>(src));
    cl_mem dst_mem = static_cast<cl_mem>(dst);
    cl_int err = clEnqueueCopyBuffer(queue_, src_mem, dst_mem, 0, 0, size_bytes,
                                     0, nullptr, nullptr);
    CheckCLError(err, "clEnqueueCopyBuffer");
}

// ════════════════════════════════════════════════════════════════════════════
// Compute
// ════════════════════════════════════════════════════════════════════════════

void OpenCLBackend::Fft2D(void* buffer, size_t n, FftDirection direction) {
    RequireInitialized("Fft2D");
    if (n == 0) {
        throw std::invalid_argument("OpenCLBackend::Fft2D: n must be positive");
    }

    clfftPlanHandle plan = plan_cache_->GetOrCreate(n);
    cl_mem mem = static_cast<cl_mem>(buffer);
    clfftDirection dir = (direction == FftDirection::FORWARD) ? CLFFT_FORWARD : CLFFT_BACKWARD;

    clfftStatus status = clfftEnqueueTransform(
        plan, dir,
        1, &queue_,
        0, nullptr,
        nullptr,
        &mem,       // in place
        nullptr,
        nullptr);

    if (status != CLFFT_SUCCESS) {
        throw std::runtime_error("clfftEnqueueTransform failed: " + std::to_string(status));
    }
}

void OpenCLBackend::Multiply(void* buffer, const void* factor, size_t count) {
    RequireInitialized("Multiply");
    if (count == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    cl_mem buffer_mem = static_cast<cl_mem>(buffer);
    cl_mem factor_mem = static_cast<cl_mem>(const_cast<void*>(factor));
    cl_ulong n = static_cast<cl_ulong>(count);

    cl_int err = clSetKernelArg(multiply_kernel_, 0, sizeof(cl_mem), &buffer_mem);
    err |= clSetKernelArg(multiply_kernel_, 1, sizeof(cl_mem), &factor_mem);
    err |= clSetKernelArg(multiply_kernel_, 2, sizeof(cl_ulong), &n);
    CheckCLError(err, "clSetKernelArg complex_multiply");

    size_t global_size = ((count + kMultiplyWorkGroup - 1) / kMultiplyWorkGroup) * kMultiplyWorkGroup;
    size_t local_size = kMultiplyWorkGroup;

    err = clEnqueueNDRangeKernel(queue_, multiply_kernel_, 1, nullptr,
                                 &global_size, &local_size, 0, nullptr, nullptr);
    CheckCLError(err, "clEnqueueNDRangeKernel complex_multiply");
}

void OpenCLBackend::Synchronize() {
    if (queue_) {
        CheckCLError(clFinish(queue_), "clFinish");
    }
}

} // namespace field_prop_lib
