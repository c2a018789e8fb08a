#pragma once

/**
 * @file field_comparison.hpp
 * @brief Summary numbers for comparing two propagated fields
 */

#include "array2d.hpp"

#include <cstddef>

namespace scalar_optics {

struct FieldSummary {
    double total_power;     ///< sum |u|^2
    double peak_intensity;
    size_t peak_row;
    size_t peak_col;
};

struct FieldComparison {
    FieldSummary reference;
    FieldSummary candidate;
    /// max |I_ref - I_cand| / max I_ref along column floor(M/2);
    /// NaN when the shapes differ or the reference column is all zero
    double central_column_difference;
};

FieldSummary Summarize(const ComplexField& field);

/// `reference` and `candidate` are expected on the same grid
FieldComparison CompareFields(const ComplexField& reference, const ComplexField& candidate);

} // namespace scalar_optics
