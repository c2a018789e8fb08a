#include "two_step_fresnel.hpp"
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

constexpr double kPi = 3.14159265358979323846;

void RequirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream oss;
        oss << "TwoStepFresnel: " << name << " must be positive, got " << value;
        throw InvalidDimensionError(oss.str());
    }
}

/// exp(i * coefficient * r2) for every sample of r2
ComplexField QuadraticPhase(const RealArray& r2, double coefficient) {
    ComplexField out(r2.GetRows(), r2.GetCols());
    const auto& src = r2.GetData();
    auto& dst = out.GetData();
    for (size_t i = 0; i < src.size(); ++i) {
        dst[i] = std::polar(1.0, coefficient * src[i]);
    }
    return out;
}

} // namespace

TwoStepFresnelPropagator::TwoStepFresnelPropagator(field_prop_lib::IBackend& backend)
    : backend_(backend) {
}

ComplexField TwoStepFresnelPropagator::Propagate(const ComplexField& field, double input_window,
                                                 double output_window, double wavelength,
                                                 double distance) const {
    if (field.IsEmpty() || !field.IsSquare()) {
        throw InvalidDimensionError("TwoStepFresnel: field must be square and non-empty, got " +
                                    std::to_string(field.GetRows()) + "x" +
                                    std::to_string(field.GetCols()));
    }
    RequirePositive(input_window, "input window");
    RequirePositive(output_window, "output window");
    RequirePositive(wavelength, "wavelength");
    if (!std::isfinite(distance)) {
        throw DegenerateParameterError("TwoStepFresnel: distance must be finite");
    }
    if (distance == 0.0) {
        throw DegenerateParameterError("TwoStepFresnel: distance must be non-zero");
    }

    const size_t m = field.GetRows();
    const double k = kTwoPi / wavelength;
    const double dx1 = input_window / static_cast<double>(m);
    const double dx2 = output_window / static_cast<double>(m);
    const double window_delta = input_window - output_window;

    FIELDPROP_LOG_DEBUG("TwoStep", "M=" + std::to_string(m) +
                        " L_in=" + std::to_string(input_window) +
                        " L_out=" + std::to_string(output_window) +
                        " z=" + std::to_string(distance));

    const CoordinateGrid source = CoordinateGrid::Create(input_window, m);
    const CoordinateGrid observation = CoordinateGrid::Create(output_window, m);

    // Stage 1: source-plane chirp
    ComplexField u = field;
    {
        const double coeff = k / (2.0 * distance * input_window) * window_delta;
        const ComplexField chirp = QuadraticPhase(source.RadiusSquared(), coeff);
        auto& data = u.GetData();
        const auto& c = chirp.GetData();
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] *= c[i];
        }
    }

    // Stage 2: intermediate-plane transfer term on the source frequency grid
    const double h_coeff = -kPi * wavelength * distance * input_window / output_window;
    const ComplexField h = QuadraticPhase(source.FrequencySquared(), h_coeff);
    u = ApplySpectralFilter(backend_, u, IfftShift(h));

    // Stage 3: observation-plane phase and amplitude scale
    const double scale = (output_window / input_window) * (dx1 * dx1) / (dx2 * dx2);
    const double obs_coeff = -k / (2.0 * distance * output_window) * window_delta;
    const std::complex<double> piston = std::polar(scale, k * distance);

    const RealArray r2 = observation.RadiusSquared();
    auto& data = u.GetData();
    const auto& r2_data = r2.GetData();
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] *= piston * std::polar(1.0, obs_coeff * r2_data[i]);
    }

    return u;
}

ComplexField TwoStepFresnelPropagator::Propagate(const ComplexField& field,
                                                 const PropagationParameters& params) const {
    return Propagate(field, params.input_window, params.output_window,
                     params.wavelength, params.distance);
}

} // namespace scalar_optics
