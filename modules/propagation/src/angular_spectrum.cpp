#include "angular_spectrum.hpp"
#include "coordinate_grid.hpp"
#include "fft_shift.hpp"
#include "spectral_filter.hpp"
#include "common/errors.hpp"
#include "logger/logger.hpp"

#include <cmath>
#include <complex>
#include <sstream>

namespace scalar_optics {

using field_prop_lib::DegenerateParameterError;
using field_prop_lib::InvalidDimensionError;

namespace {

void ValidateArguments(size_t samples, double window_size, double wavelength, double distance) {
    if (samples == 0) {
        throw InvalidDimensionError("AngularSpectrum: field must be non-empty");
    }
    if (!(window_size > 0.0) || !std::isfinite(window_size)) {
        std::ostringstream oss;
        oss << "AngularSpectrum: window size must be positive, got " << window_size;
        throw InvalidDimensionError(oss.str());
    }
    if (!(wavelength > 0.0) || !std::isfinite(wavelength)) {
        std::ostringstream oss;
        oss << "AngularSpectrum: wavelength must be positive, got " << wavelength;
        throw InvalidDimensionError(oss.str());
    }
    if (!std::isfinite(distance)) {
        throw DegenerateParameterError("AngularSpectrum: distance must be finite");
    }
}

} // namespace

AngularSpectrumPropagator::AngularSpectrumPropagator(field_prop_lib::IBackend& backend)
    : backend_(backend) {
}

ComplexField AngularSpectrumPropagator::TransferFunction(size_t samples, double window_size,
                                                         double wavelength, double distance) {
    ValidateArguments(samples, window_size, wavelength, distance);

    const RealArray f2 = CoordinateGrid::Create(window_size, samples).FrequencySquared();
    const double inv_lambda2 = 1.0 / (wavelength * wavelength);
    const double scale = kTwoPi * kTwoPi;

    ComplexField h(samples, samples);
    const auto& f2_data = f2.GetData();
    auto& h_data = h.GetData();

    for (size_t i = 0; i < h_data.size(); ++i) {
        const double delta = scale * (inv_lambda2 - f2_data[i]);
        const double kz_mag = std::sqrt(std::abs(delta));
        if (delta >= 0.0) {
            h_data[i] = std::polar(1.0, kz_mag * distance);
        } else {
            h_data[i] = std::exp(-kz_mag * std::abs(distance));
        }
    }
    return h;
}

ComplexField AngularSpectrumPropagator::Propagate(const ComplexField& field, double window_size,
                                                  double wavelength, double distance) const {
    if (field.IsEmpty() || !field.IsSquare()) {
        throw InvalidDimensionError("AngularSpectrum: field must be square and non-empty, got " +
                                    std::to_string(field.GetRows()) + "x" +
                                    std::to_string(field.GetCols()));
    }
    const size_t m = field.GetRows();
    ValidateArguments(m, window_size, wavelength, distance);

    if (distance == 0.0) {
        return field;
    }

    FIELDPROP_LOG_DEBUG("ASM", "M=" + std::to_string(m) + " L=" + std::to_string(window_size) +
                        " lambda=" + std::to_string(wavelength) + " z=" + std::to_string(distance));

    const ComplexField h = TransferFunction(m, window_size, wavelength, distance);
    return ApplySpectralFilter(backend_, field, IfftShift(h));
}

ComplexField AngularSpectrumPropagator::Propagate(const ComplexField& field,
                                                  const PropagationParameters& params) const {
    return Propagate(field, params.input_window, params.wavelength, params.distance);
}

} // namespace scalar_optics
