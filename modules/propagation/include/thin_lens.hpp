#pragma once

/**
 * @file thin_lens.hpp
 * @brief ThinLensOperator - circular pupil and paraxial lens phase
 *
 * t(x, y) = pupil(x, y) * exp(-i k (x^2 + y^2) / (2 zf))
 *
 * zf > 0 converges, zf < 0 diverges. Coordinates come from the field's
 * own window (BuildAxis(L, M)).
 */

#include "array2d.hpp"

#include <cstddef>

namespace scalar_optics {

class ThinLensOperator {
public:
    /**
     * @brief field * t
     * @throws field_prop_lib::DegenerateParameterError for zf == 0 or
     *         non-finite zf
     * @throws field_prop_lib::InvalidDimensionError for an empty or
     *         non-square field, L <= 0, lambda <= 0, radius <= 0
     */
    static ComplexField Apply(const ComplexField& field, double window_size, double wavelength,
                              double focal_distance, double lens_radius);

    /// t on an M x M grid of side L (same errors as Apply)
    static ComplexField Transmittance(size_t samples, double window_size, double wavelength,
                                      double focal_distance, double lens_radius);
};

} // namespace scalar_optics
