#pragma once

/**
 * @file spectral_filter.hpp
 * @brief ifft2(fft2(u) .* G) on a backend
 *
 * With G = IfftShift(H) this equals the centred form
 * ifft2(ifftshift(fftshift(fft2(u)) .* H)) used by both propagators,
 * without shifting the spectrum itself.
 */

#include "array2d.hpp"
#include "common/i_backend.hpp"

namespace scalar_optics {

/**
 * @param backend  Initialized backend; the field and filter are uploaded
 *                 once and the result is downloaded once
 * @param field    Square M x M field
 * @param filter   M x M filter in FFT (unshifted) order
 * @throws field_prop_lib::InvalidDimensionError on non-square or
 *         mismatched shapes
 */
ComplexField ApplySpectralFilter(field_prop_lib::IBackend& backend,
                                 const ComplexField& field,
                                 const ComplexField& filter);

} // namespace scalar_optics
