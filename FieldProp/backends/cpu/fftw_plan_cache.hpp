#pragma once

/**
 * @file fftw_plan_cache.hpp
 * @brief FftwPlanCache - cache of in-place 2D FFTW plans
 *
 * Plans are created once per (n, direction) on a scratch buffer from
 * fftw_malloc and executed later with fftw_execute_dft() on any buffer of
 * the same size and alignment. Every backend allocation goes through
 * fftw_malloc, so the alignment always matches.
 *
 * The FFTW planner is not thread-safe; all planner calls happen under
 * the cache mutex.
 */

#include "common/i_backend.hpp"

#include <fftw3.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace field_prop_lib {

// ============================================================================
// FftwPlanKey
// ============================================================================

struct FftwPlanKey {
    size_t n;                   ///< Side length of the n x n transform
    FftDirection direction;

    bool operator<(const FftwPlanKey& other) const {
        if (n != other.n) return n < other.n;
        return static_cast<int>(direction) < static_cast<int>(other.direction);
    }
};

// ============================================================================
// FftwPlanCache
// ============================================================================

class FftwPlanCache {
public:
    FftwPlanCache() = default;

    ~FftwPlanCache() {
        ClearAll();
    }

    FftwPlanCache(const FftwPlanCache&) = delete;
    FftwPlanCache& operator=(const FftwPlanCache&) = delete;

    /**
     * @brief Return the cached plan for (n, direction), planning on a miss
     * @throws std::runtime_error if FFTW cannot create the plan
     */
    fftw_plan GetOrCreate(size_t n, FftDirection direction) {
        std::lock_guard<std::mutex> lock(mutex_);

        FftwPlanKey key{n, direction};
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            ++total_hits_;
            return it->second;
        }

        const int side = static_cast<int>(n);
        fftw_complex* scratch = fftw_alloc_complex(n * n);
        if (!scratch) {
            throw std::runtime_error("[FftwPlanCache] fftw_alloc_complex failed for n=" +
                                     std::to_string(n));
        }

        const int sign = (direction == FftDirection::FORWARD) ? FFTW_FORWARD : FFTW_BACKWARD;
        fftw_plan plan = fftw_plan_dft_2d(side, side, scratch, scratch, sign, FFTW_ESTIMATE);
        fftw_free(scratch);

        if (!plan) {
            throw std::runtime_error("[FftwPlanCache] fftw_plan_dft_2d failed for n=" +
                                     std::to_string(n));
        }

        cache_.emplace(key, plan);
        ++total_creates_;
        return plan;
    }

    bool HasPlan(size_t n, FftDirection direction) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.find(FftwPlanKey{n, direction}) != cache_.end();
    }

    void ClearAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, plan] : cache_) {
            fftw_destroy_plan(plan);
        }
        cache_.clear();
    }

    size_t GetCacheSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    size_t GetTotalCreates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_creates_;
    }

    size_t GetTotalHits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_hits_;
    }

private:
    std::map<FftwPlanKey, fftw_plan> cache_;
    size_t total_creates_ = 0;
    size_t total_hits_ = 0;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
