#pragma once

/**
 * @file clfft_plan_cache.hpp
 * @brief ClfftPlanCache - cache of baked 2D double-precision clFFT plans
 *
 * One plan per side length n: CLFFT_2D, CLFFT_DOUBLE, interleaved complex,
 * in place. The same plan serves both directions; clFFT's default
 * backward scale is 1/(n*n), which is the normalisation IBackend::Fft2D
 * promises.
 *
 * ClfftLibrary reference-counts clfftSetup() / clfftTeardown() for the
 * process, so several OpenCLBackend instances can coexist.
 */

#include <clFFT.h>
#include <CL/cl.h>

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace field_prop_lib {

// ============================================================================
// ClfftLibrary - process-wide clfftSetup / clfftTeardown
// ============================================================================

class ClfftLibrary {
public:
    static void Acquire() {
        std::lock_guard<std::mutex> lock(Mutex());
        if (RefCount() == 0) {
            clfftSetupData setup;
            // Filled by hand: the installed clFFT.h does not always ship the
            // inline clfftInitSetupData().
            setup.major = clfftVersionMajor;
            setup.minor = clfftVersionMinor;
            setup.patch = clfftVersionPatch;
            setup.debugFlags = 0;
            clfftStatus status = clfftSetup(&setup);
            if (status != CLFFT_SUCCESS) {
                throw std::runtime_error("[ClfftLibrary] clfftSetup failed: " +
                                         std::to_string(status));
            }
        }
        ++RefCount();
    }

    static void Release() {
        std::lock_guard<std::mutex> lock(Mutex());
        if (RefCount() == 0) {
            return;
        }
        if (--RefCount() == 0) {
            clfftTeardown();
        }
    }

private:
    static std::mutex& Mutex() {
        static std::mutex mutex;
        return mutex;
    }

    static int& RefCount() {
        static int count = 0;
        return count;
    }
};

// ============================================================================
// ClfftPlanCache
// ============================================================================

class ClfftPlanCache {
public:
    ClfftPlanCache(cl_context context, cl_command_queue queue)
        : context_(context), queue_(queue) {
    }

    ~ClfftPlanCache() {
        ClearAll();
    }

    ClfftPlanCache(const ClfftPlanCache&) = delete;
    ClfftPlanCache& operator=(const ClfftPlanCache&) = delete;

    /**
     * @brief Baked plan for an n x n transform
     * @throws std::runtime_error with the clFFT status on failure
     */
    clfftPlanHandle GetOrCreate(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(n);
        if (it != cache_.end()) {
            return it->second;
        }

        clfftPlanHandle handle = 0;
        size_t lengths[2] = {n, n};
        clfftStatus status = clfftCreateDefaultPlan(&handle, context_, CLFFT_2D, lengths);
        if (status != CLFFT_SUCCESS) {
            throw std::runtime_error(
                "[ClfftPlanCache] clfftCreateDefaultPlan failed: " + std::to_string(status));
        }

        status = clfftSetPlanPrecision(handle, CLFFT_DOUBLE);
        if (status == CLFFT_SUCCESS) {
            status = clfftSetLayout(handle, CLFFT_COMPLEX_INTERLEAVED, CLFFT_COMPLEX_INTERLEAVED);
        }
        if (status == CLFFT_SUCCESS) {
            status = clfftSetResultLocation(handle, CLFFT_INPLACE);
        }
        if (status != CLFFT_SUCCESS) {
            clfftDestroyPlan(&handle);
            throw std::runtime_error(
                "[ClfftPlanCache] plan setup failed: " + std::to_string(status));
        }

        status = clfftBakePlan(handle, 1, &queue_, nullptr, nullptr);
        if (status != CLFFT_SUCCESS) {
            clfftDestroyPlan(&handle);
            throw std::runtime_error(
                "[ClfftPlanCache] clfftBakePlan failed: " + std::to_string(status));
        }

        cache_[n] = handle;
        return handle;
    }

    void ClearAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [n, handle] : cache_) {
            if (handle) {
                clfftDestroyPlan(&handle);
                handle = 0;
            }
        }
        cache_.clear();
    }

    size_t GetCacheSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

private:
    cl_context context_;
    cl_command_queue queue_;

    std::map<size_t, clfftPlanHandle> cache_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
