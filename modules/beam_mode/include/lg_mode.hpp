#pragma once

/**
 * @file lg_mode.hpp
 * @brief Laguerre-Gaussian LG(p, l) beam sampled on a Cartesian grid
 *
 * zR  = k w0^2 / 2
 * U00 = 1/(1 + i z/zR) * exp(-r^2 / w0^2 / (1 + i z/zR))
 * R   = sqrt(2) r / w(z),   w(z) = w0 sqrt(1 + (z/zR)^2)
 * U   = U00 R^|l| L_p^|l|(R^2) exp(i l phi) exp(-i (2p + |l| + 1) atan(z/zR))
 *
 * The field is not power-normalised.
 */

#include "array2d.hpp"

#include <cstdint>
#include <vector>

namespace scalar_optics {

struct LgModeResult {
    RealArray phase;       ///< arg(U) in (-pi, pi]
    RealArray intensity;   ///< |U|^2
    ComplexField field;    ///< U
};

/**
 * @brief Sample LG(p, l) on the mesh of (x_axis, y_axis)
 *
 * @param p       Radial index, p >= 0
 * @param l       Azimuthal index (topological charge), any sign
 * @param k       Wavenumber 2*pi/lambda, > 0
 * @param w0      Waist radius, > 0
 * @param x_axis  Column coordinates
 * @param y_axis  Row coordinates
 * @param z       Distance from the waist (0 = waist plane)
 *
 * @throws field_prop_lib::InvalidDimensionError for p < 0, k <= 0,
 *         w0 <= 0 or empty axes
 */
LgModeResult GenerateLgMode(int p, int l, double k, double w0,
                            const std::vector<double>& x_axis,
                            const std::vector<double>& y_axis,
                            double z = 0.0);

/**
 * @brief Generalised Laguerre polynomial L_p^{alpha}(x), alpha = |l|
 *
 * Series form: C(p+a, p) + sum_{m=1..p} (-1)^m / m! C(p+a, p-m) x^m
 */
double GeneralizedLaguerre(int p, int alpha, double x);

/**
 * @brief C(n, k); exact in 64-bit integers while it fits, double after
 *
 * Returns 0 for k < 0 or k > n.
 */
double Binomial(int n, int k);

} // namespace scalar_optics
