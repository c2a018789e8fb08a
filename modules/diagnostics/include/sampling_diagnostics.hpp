#pragma once

/**
 * @file sampling_diagnostics.hpp
 * @brief Fresnel number and critical sampling checks (advisory only)
 *
 * None of these functions throw. Invalid input (non-positive or
 * non-finite values) yields an INVALID classification with NaN advisory
 * values.
 */

#include <cstddef>
#include <string>

namespace scalar_optics {

// ════════════════════════════════════════════════════════════════════════════
// Fresnel number
// ════════════════════════════════════════════════════════════════════════════

enum class FresnelRegime {
    GOOD,          ///< N_f <= 1
    BORDERLINE,    ///< 1 < N_f <= 30
    UNRELIABLE,    ///< N_f > 30
    INVALID
};

struct FresnelNumberResult {
    double value;
    FresnelRegime regime;
};

/// N_f = a^2 / (lambda z)
FresnelNumberResult FresnelNumber(double wavelength, double distance, double aperture_radius) noexcept;

// ════════════════════════════════════════════════════════════════════════════
// Critical sampling
// ════════════════════════════════════════════════════════════════════════════

enum class SamplingStatus {
    UNDERSAMPLED,  ///< dx < dx_crit
    CRITICAL,      ///< dx == dx_crit
    OVERSAMPLED,   ///< dx > dx_crit
    INVALID
};

struct SamplingReport {
    SamplingStatus status;
    double dx;
    double dx_critical;          ///< lambda z / L
    double ratio;                ///< dx / dx_critical
    double suggested_distance;   ///< z' = L^2 / (M lambda)
    double suggested_window;     ///< L' = lambda z / (dx M)
    double suggested_samples;    ///< M' = L / dx_critical
};

SamplingReport EvaluateSampling(double wavelength, double distance, double window_size,
                                double dx, size_t samples) noexcept;

// ════════════════════════════════════════════════════════════════════════════
// Text
// ════════════════════════════════════════════════════════════════════════════

const char* ToString(FresnelRegime regime) noexcept;
const char* ToString(SamplingStatus status) noexcept;

/// One line: value and regime
std::string Describe(const FresnelNumberResult& result);

/// Status line plus the suggested z' / L' / M' when not CRITICAL
std::string Describe(const SamplingReport& report, double distance, double window_size,
                     size_t samples);

} // namespace scalar_optics
