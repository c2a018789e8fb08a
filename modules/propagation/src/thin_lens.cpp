#include "thin_lens.hpp"
#include "aperture_masks.hpp"
#include "coordinate_grid.hpp"
#include "propagation_parameters.hpp"
#include "common/errors.hpp"
#include "logger/logger.hpp"

#include <cmath>
#include <complex>
#include <sstream>

namespace scalar_optics {

using field_prop_lib::DegenerateParameterError;
using field_prop_lib::InvalidDimensionError;

ComplexField ThinLensOperator::Transmittance(size_t samples, double window_size, double wavelength,
                                             double focal_distance, double lens_radius) {
    if (focal_distance == 0.0 || !std::isfinite(focal_distance)) {
        std::ostringstream oss;
        oss << "ThinLens: focal distance must be non-zero and finite, got " << focal_distance;
        throw DegenerateParameterError(oss.str());
    }
    if (!(wavelength > 0.0) || !std::isfinite(wavelength)) {
        std::ostringstream oss;
        oss << "ThinLens: wavelength must be positive, got " << wavelength;
        throw InvalidDimensionError(oss.str());
    }

    // Validates L, M
    const CoordinateGrid grid = CoordinateGrid::Create(window_size, samples);
    const BinaryMask pupil = CircularPupil(grid.Mesh(), lens_radius);
    const RealArray r2 = grid.RadiusSquared();

    const double k = kTwoPi / wavelength;
    const double coeff = -k / (2.0 * focal_distance);

    ComplexField t(samples, samples);
    auto& dst = t.GetData();
    const auto& p = pupil.GetData();
    const auto& r2_data = r2.GetData();
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] = p[i] ? std::polar(1.0, coeff * r2_data[i]) : std::complex<double>(0.0, 0.0);
    }
    return t;
}

ComplexField ThinLensOperator::Apply(const ComplexField& field, double window_size,
                                     double wavelength, double focal_distance,
                                     double lens_radius) {
    if (field.IsEmpty() || !field.IsSquare()) {
        throw InvalidDimensionError("ThinLens: field must be square and non-empty, got " +
                                    std::to_string(field.GetRows()) + "x" +
                                    std::to_string(field.GetCols()));
    }

    const ComplexField t = Transmittance(field.GetRows(), window_size, wavelength,
                                         focal_distance, lens_radius);

    FIELDPROP_LOG_DEBUG("ThinLens", "zf=" + std::to_string(focal_distance) +
                        " radius=" + std::to_string(lens_radius));

    ComplexField out = field;
    auto& data = out.GetData();
    const auto& t_data = t.GetData();
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] *= t_data[i];
    }
    return out;
}

} // namespace scalar_optics
