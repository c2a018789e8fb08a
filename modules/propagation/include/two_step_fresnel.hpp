#pragma once

/**
 * @file two_step_fresnel.hpp
 * @brief TwoStepFresnelPropagator - Fresnel propagation with a scaled window
 *
 * Source window L_in, observation window L_out, both sampled M times
 * (dx1 = L_in/M, dx2 = L_out/M), k = 2 pi / lambda:
 *
 * 1. u * exp(i k/(2 z L_in) (L_in - L_out)(x1^2 + y1^2)), then fftshift(fft2)
 * 2. * exp(-i pi lambda z L_in/L_out (fx^2 + fy^2)), then ifft2(ifftshift)
 * 3. * (L_out/L_in)(dx1^2/dx2^2) exp(i k z - i k/(2 z L_out)(L_in - L_out)(x2^2 + y2^2))
 */

#include "array2d.hpp"
#include "propagation_parameters.hpp"
#include "common/i_backend.hpp"

namespace scalar_optics {

class TwoStepFresnelPropagator {
public:
    explicit TwoStepFresnelPropagator(field_prop_lib::IBackend& backend);

    /**
     * @throws field_prop_lib::InvalidDimensionError for an empty or
     *         non-square field, L_in <= 0, L_out <= 0, lambda <= 0
     * @throws field_prop_lib::DegenerateParameterError for z == 0 or
     *         non-finite z
     */
    ComplexField Propagate(const ComplexField& field, double input_window,
                           double output_window, double wavelength, double distance) const;

    ComplexField Propagate(const ComplexField& field,
                           const PropagationParameters& params) const;

private:
    field_prop_lib::IBackend& backend_;
};

} // namespace scalar_optics
