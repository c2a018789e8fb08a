#pragma once

/**
 * @file propagation_parameters.hpp
 * @brief Per-call parameters of a free-space propagation
 */

#include <cstddef>

namespace scalar_optics {

struct PropagationParameters {
    double wavelength    = 0.0;   ///< lambda (m)
    double distance      = 0.0;   ///< z (m), sign allowed for the angular spectrum
    double input_window  = 0.0;   ///< L_in (m)
    double output_window = 0.0;   ///< L_out (m); the angular spectrum ignores it
    size_t samples       = 0;     ///< M

    double Wavenumber() const;
    double InputSpacing() const;
    double OutputSpacing() const;
};

constexpr double kTwoPi = 6.28318530717958647692;

inline double PropagationParameters::Wavenumber() const {
    return kTwoPi / wavelength;
}

inline double PropagationParameters::InputSpacing() const {
    return input_window / static_cast<double>(samples);
}

inline double PropagationParameters::OutputSpacing() const {
    return output_window / static_cast<double>(samples);
}

} // namespace scalar_optics
