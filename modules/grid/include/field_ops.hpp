#pragma once

/**
 * @file field_ops.hpp
 * @brief Elementwise helpers on ComplexField (intensity, phase, power)
 */

#include "array2d.hpp"

#include <cmath>
#include <complex>
#include <cstddef>

namespace scalar_optics {

/// |u|^2 per sample
inline RealArray Intensity(const ComplexField& field) {
    RealArray out(field.GetRows(), field.GetCols());
    const auto& src = field.GetData();
    auto& dst = out.GetData();
    for (size_t i = 0; i < src.size(); ++i) {
        dst[i] = std::norm(src[i]);
    }
    return out;
}

/// arg(u) in (-pi, pi]
inline RealArray Phase(const ComplexField& field) {
    RealArray out(field.GetRows(), field.GetCols());
    const auto& src = field.GetData();
    auto& dst = out.GetData();
    for (size_t i = 0; i < src.size(); ++i) {
        dst[i] = std::arg(src[i]);
    }
    return out;
}

/// Sum of |u|^2 over all samples (discrete power, no dx^2 factor)
inline double TotalPower(const ComplexField& field) {
    double sum = 0.0;
    for (const auto& v : field.GetData()) {
        sum += std::norm(v);
    }
    return sum;
}

struct PeakSample {
    size_t row = 0;
    size_t col = 0;
    double value = 0.0;
};

/// Largest sample; first occurrence in row-major order wins
inline PeakSample FindPeak(const RealArray& array) {
    PeakSample peak;
    if (array.IsEmpty()) {
        return peak;
    }
    const auto& data = array.GetData();
    size_t best = 0;
    for (size_t i = 1; i < data.size(); ++i) {
        if (data[i] > data[best]) {
            best = i;
        }
    }
    peak.row = best / array.GetCols();
    peak.col = best % array.GetCols();
    peak.value = data[best];
    return peak;
}

} // namespace scalar_optics
