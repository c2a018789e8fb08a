#include "sampling_diagnostics.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace scalar_optics {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

bool PositiveFinite(double v) {
    return v > 0.0 && std::isfinite(v);
}

} // namespace

// ════════════════════════════════════════════════════════════════════════════
// Fresnel number
// ════════════════════════════════════════════════════════════════════════════

FresnelNumberResult FresnelNumber(double wavelength, double distance, double aperture_radius) noexcept {
    if (!PositiveFinite(wavelength) || !PositiveFinite(distance) ||
        !PositiveFinite(aperture_radius)) {
        return {kNaN, FresnelRegime::INVALID};
    }

    const double n_f = (aperture_radius * aperture_radius) / (wavelength * distance);
    if (!std::isfinite(n_f)) {
        return {n_f, FresnelRegime::INVALID};
    }

    FresnelRegime regime = FresnelRegime::UNRELIABLE;
    if (n_f <= 1.0) {
        regime = FresnelRegime::GOOD;
    } else if (n_f <= 30.0) {
        regime = FresnelRegime::BORDERLINE;
    }
    return {n_f, regime};
}

// ════════════════════════════════════════════════════════════════════════════
// Critical sampling
// ════════════════════════════════════════════════════════════════════════════

SamplingReport EvaluateSampling(double wavelength, double distance, double window_size,
                                double dx, size_t samples) noexcept {
    SamplingReport report{SamplingStatus::INVALID, dx, kNaN, kNaN, kNaN, kNaN, kNaN};

    if (!PositiveFinite(wavelength) || !PositiveFinite(distance) ||
        !PositiveFinite(window_size) || !PositiveFinite(dx) || samples == 0) {
        return report;
    }

    const double m = static_cast<double>(samples);
    const double dx_crit = (wavelength * distance) / window_size;

    report.dx_critical        = dx_crit;
    report.ratio              = dx / dx_crit;
    report.suggested_distance = (window_size * window_size / m) / wavelength;
    report.suggested_window   = (wavelength * distance) / (dx * m);
    report.suggested_samples  = window_size / dx_crit;

    if (dx == dx_crit) {
        report.status = SamplingStatus::CRITICAL;
    } else if (dx > dx_crit) {
        report.status = SamplingStatus::OVERSAMPLED;
    } else if (dx < dx_crit) {
        report.status = SamplingStatus::UNDERSAMPLED;
    }
    return report;
}

// ════════════════════════════════════════════════════════════════════════════
// Text
// ════════════════════════════════════════════════════════════════════════════

const char* ToString(FresnelRegime regime) noexcept {
    switch (regime) {
        case FresnelRegime::GOOD:       return "good regime";
        case FresnelRegime::BORDERLINE: return "borderline but acceptable";
        case FresnelRegime::UNRELIABLE: return "outside reliable Fresnel regime";
        default:                        return "invalid input";
    }
}

const char* ToString(SamplingStatus status) noexcept {
    switch (status) {
        case SamplingStatus::UNDERSAMPLED: return "undersampled (dx < dx_crit)";
        case SamplingStatus::CRITICAL:     return "critical (dx = dx_crit)";
        case SamplingStatus::OVERSAMPLED:  return "oversampled (dx > dx_crit)";
        default:                           return "unexpected condition (check inputs)";
    }
}

std::string Describe(const FresnelNumberResult& result) {
    std::ostringstream oss;
    oss << "Fresnel number: " << std::fixed << std::setprecision(4) << result.value
        << "  (" << ToString(result.regime) << ")";
    return oss.str();
}

std::string Describe(const SamplingReport& report, double distance, double window_size,
                     size_t samples) {
    std::ostringstream oss;
    oss << "Sampling criterion: " << ToString(report.status);

    if (report.status == SamplingStatus::UNDERSAMPLED ||
        report.status == SamplingStatus::OVERSAMPLED) {
        oss << "\nIt is suggested to apply one of the following changes:\n"
            << "  - Change propagation distance from z = " << distance
            << " to z = " << report.suggested_distance << "\n"
            << "  - Change side length from L = " << window_size
            << " to L = " << report.suggested_window << "\n"
            << "  - Change sampling points from M = " << samples
            << " to M = " << report.suggested_samples;
    }
    return oss.str();
}

} // namespace scalar_optics
