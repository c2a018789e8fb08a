#include "lg_mode.hpp"
#include "common/errors.hpp"
#include "logger/logger.hpp"

#include <cmath>
#include <complex>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace scalar_optics {

using field_prop_lib::InvalidDimensionError;

namespace {

constexpr double kPi = 3.14159265358979323846;

/// angle() may land on -pi for negative reals with a -0 imaginary part
double WrapPhase(double phase) {
    if (phase <= -kPi) {
        phase += 2.0 * kPi;
    }
    return phase;
}

} // namespace

// ════════════════════════════════════════════════════════════════════════════
// Binomial / Laguerre
// ════════════════════════════════════════════════════════════════════════════

double Binomial(int n, int k) {
    if (k < 0 || n < 0 || k > n) {
        return 0.0;
    }
    if (k > n - k) {
        k = n - k;
    }

    // result * (n - k + i) / i stays an integer at every step
    uint64_t result = 1;
    for (int i = 1; i <= k; ++i) {
        const uint64_t factor = static_cast<uint64_t>(n - k + i);
        if (result > std::numeric_limits<uint64_t>::max() / factor) {
            double approx = static_cast<double>(result);
            for (int j = i; j <= k; ++j) {
                approx = approx * static_cast<double>(n - k + j) / static_cast<double>(j);
            }
            return approx;
        }
        result = result * factor / static_cast<uint64_t>(i);
    }
    return static_cast<double>(result);
}

double GeneralizedLaguerre(int p, int alpha, double x) {
    double sum = Binomial(p + alpha, p);
    double factorial = 1.0;
    double x_pow = 1.0;
    for (int m = 1; m <= p; ++m) {
        factorial *= m;
        x_pow *= x;
        const double sign = (m % 2 == 0) ? 1.0 : -1.0;
        sum += sign / factorial * Binomial(p + alpha, p - m) * x_pow;
    }
    return sum;
}

// ════════════════════════════════════════════════════════════════════════════
// GenerateLgMode
// ════════════════════════════════════════════════════════════════════════════

LgModeResult GenerateLgMode(int p, int l, double k, double w0,
                            const std::vector<double>& x_axis,
                            const std::vector<double>& y_axis,
                            double z) {
    if (p < 0) {
        throw InvalidDimensionError("GenerateLgMode: p must be >= 0, got " + std::to_string(p));
    }
    if (!(k > 0.0) || !std::isfinite(k)) {
        std::ostringstream oss;
        oss << "GenerateLgMode: wavenumber must be positive, got " << k;
        throw InvalidDimensionError(oss.str());
    }
    if (!(w0 > 0.0) || !std::isfinite(w0)) {
        std::ostringstream oss;
        oss << "GenerateLgMode: waist must be positive, got " << w0;
        throw InvalidDimensionError(oss.str());
    }
    if (x_axis.empty() || y_axis.empty()) {
        throw InvalidDimensionError("GenerateLgMode: axes must be non-empty");
    }

    const int abs_l = std::abs(l);
    const size_t rows = y_axis.size();
    const size_t cols = x_axis.size();

    const double z_r = k * w0 * w0 / 2.0;
    const std::complex<double> q(1.0, z / z_r);         // 1 + i z/zR
    const double w_z = w0 * std::sqrt(1.0 + (z * z) / (z_r * z_r));
    const double gouy = static_cast<double>(2 * p + abs_l + 1) * std::atan(z / z_r);
    const std::complex<double> gouy_factor = std::polar(1.0, -gouy);

    LgModeResult result{RealArray(rows, cols), RealArray(rows, cols), ComplexField(rows, cols)};

    for (size_t r = 0; r < rows; ++r) {
        const double y = y_axis[r];
        for (size_t c = 0; c < cols; ++c) {
            const double x = x_axis[c];
            const double rho2 = x * x + y * y;
            const double phi = std::atan2(y, x);

            const std::complex<double> u00 = 1.0 / q * std::exp(-rho2 / (w0 * w0) / q);
            const double big_r = std::sqrt(2.0) * std::sqrt(rho2) / w_z;
            const double radial = std::pow(big_r, abs_l) *
                                  GeneralizedLaguerre(p, abs_l, big_r * big_r);

            const std::complex<double> u = u00 * radial *
                                           std::polar(1.0, static_cast<double>(l) * phi) *
                                           gouy_factor;

            result.field(r, c) = u;
            result.intensity(r, c) = std::norm(u);
            result.phase(r, c) = WrapPhase(std::arg(u));
        }
    }

    FIELDPROP_LOG_DEBUG("LGMode", "LG(" + std::to_string(p) + "," + std::to_string(l) +
                        ") on " + std::to_string(rows) + "x" + std::to_string(cols));
    return result;
}

} // namespace scalar_optics
