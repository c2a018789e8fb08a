#include "field_comparison.hpp"
#include "field_ops.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>

namespace scalar_optics {

FieldSummary Summarize(const ComplexField& field) {
    const PeakSample peak = FindPeak(Intensity(field));
    return FieldSummary{TotalPower(field), peak.value, peak.row, peak.col};
}

FieldComparison CompareFields(const ComplexField& reference, const ComplexField& candidate) {
    FieldComparison result{Summarize(reference), Summarize(candidate),
                           std::numeric_limits<double>::quiet_NaN()};

    if (!reference.SameShape(candidate) || reference.IsEmpty()) {
        return result;
    }

    const size_t col = reference.GetCols() / 2;
    double max_ref = 0.0;
    double max_diff = 0.0;
    for (size_t r = 0; r < reference.GetRows(); ++r) {
        const double i_ref = std::norm(reference(r, col));
        const double i_cand = std::norm(candidate(r, col));
        max_ref = std::max(max_ref, i_ref);
        max_diff = std::max(max_diff, std::abs(i_ref - i_cand));
    }

    if (max_ref > 0.0) {
        result.central_column_difference = max_diff / max_ref;
    }
    return result;
}

} // namespace scalar_optics
