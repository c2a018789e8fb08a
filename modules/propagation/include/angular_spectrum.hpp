#pragma once

/**
 * @file angular_spectrum.hpp
 * @brief AngularSpectrumPropagator - exact scalar propagation, same window
 *
 * S = fftshift(fft2(u))
 * Delta = (2 pi)^2 (1/lambda^2 - fx^2 - fy^2)
 * kz = sqrt(Delta)            for Delta >= 0 (propagating)
 * kz = i sqrt(|Delta|)        for Delta <  0 (evanescent)
 * u' = ifft2(ifftshift(S * exp(i kz z)))
 *
 * Evanescent orders decay as exp(-sqrt(|Delta|) |z|) for either sign of z.
 * For z < 0 this departs from the literal exp(i kz z), which would grow as
 * exp(+sqrt(|Delta|) |z|).
 */

#include "array2d.hpp"
#include "propagation_parameters.hpp"
#include "common/i_backend.hpp"

#include <cstddef>

namespace scalar_optics {

class AngularSpectrumPropagator {
public:
    /// The backend is borrowed and must outlive the propagator
    explicit AngularSpectrumPropagator(field_prop_lib::IBackend& backend);

    /**
     * @brief Propagate a square field by z within its own window L
     *
     * z == 0 returns the input unchanged.
     *
     * @throws field_prop_lib::InvalidDimensionError for an empty or
     *         non-square field, L <= 0, lambda <= 0
     * @throws field_prop_lib::DegenerateParameterError for non-finite z
     */
    ComplexField Propagate(const ComplexField& field, double window_size,
                           double wavelength, double distance) const;

    /// Uses input_window, wavelength and distance; output_window is ignored
    ComplexField Propagate(const ComplexField& field,
                           const PropagationParameters& params) const;

    /**
     * @brief Centred transfer function H(fx, fy) on the M x M frequency grid
     * @throws same as Propagate
     */
    static ComplexField TransferFunction(size_t samples, double window_size,
                                         double wavelength, double distance);

private:
    field_prop_lib::IBackend& backend_;
};

} // namespace scalar_optics
