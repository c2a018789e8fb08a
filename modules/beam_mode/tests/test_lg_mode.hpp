#pragma once

/**
 * @file test_lg_mode.hpp
 * @brief Tests for Binomial, GeneralizedLaguerre and GenerateLgMode
 */

#include "lg_mode.hpp"
#include "coordinate_grid.hpp"
#include "field_ops.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <complex>
#include <iostream>
#include <vector>

namespace test_lg_mode {

using namespace scalar_optics;

constexpr double kPi = 3.14159265358979323846;

bool Near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

bool TestBinomialAndLaguerre() {
    std::cout << "\n  TEST: Binomial and generalised Laguerre values\n";
    try {
        bool ok = Binomial(5, 2) == 10.0 && Binomial(7, 0) == 1.0 && Binomial(7, 7) == 1.0 &&
                  Binomial(3, 5) == 0.0 && Binomial(4, -1) == 0.0 &&
                  Binomial(60, 30) == static_cast<double>(118264581564861424ULL);
        if (!ok) {
            std::cerr << "  [FAIL] binomial\n";
            return false;
        }

        for (int a = 0; a <= 3; ++a) {
            for (double x : {0.0, 0.5, 2.0, 7.25}) {
                const double l0 = 1.0;
                const double l1 = 1.0 + a - x;
                const double l2 = (a + 1.0) * (a + 2.0) / 2.0 - (a + 2.0) * x + x * x / 2.0;
                if (!Near(GeneralizedLaguerre(0, a, x), l0) ||
                    !Near(GeneralizedLaguerre(1, a, x), l1) ||
                    !Near(GeneralizedLaguerre(2, a, x), l2, 1e-10)) {
                    std::cerr << "  [FAIL] Laguerre alpha=" << a << " x=" << x << "\n";
                    return false;
                }
            }
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestLaguerreRecurrence() {
    std::cout << "\n  TEST: Laguerre three-term recurrence, p and alpha in [0, 10]\n";
    try {
        // (p+1) L_{p+1} = (2p+1+a-x) L_p - (p+a) L_{p-1}
        for (int a = 0; a <= 10; ++a) {
            for (double x : {0.0, 0.3, 1.7, 4.0, 9.5}) {
                if (GeneralizedLaguerre(0, a, x) != 1.0 ||
                    !Near(GeneralizedLaguerre(10, a, 0.0), Binomial(10 + a, 10), 1e-6)) {
                    std::cerr << "  [FAIL] boundary values alpha=" << a << "\n";
                    return false;
                }
                for (int p = 1; p < 10; ++p) {
                    const double prev = GeneralizedLaguerre(p - 1, a, x);
                    const double cur = GeneralizedLaguerre(p, a, x);
                    const double next = GeneralizedLaguerre(p + 1, a, x);
                    const double lhs = (p + 1) * next;
                    const double rhs = (2.0 * p + 1.0 + a - x) * cur - (p + a) * prev;
                    const double scale = 1.0 + std::abs(lhs) + std::abs(rhs);
                    if (!Near(lhs, rhs, 1e-9 * scale + 1e-6)) {
                        std::cerr << "  [FAIL] p=" << p << " alpha=" << a << " x=" << x
                                  << ": " << lhs << " vs " << rhs << "\n";
                        return false;
                    }
                }
            }
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestFundamentalMode() {
    std::cout << "\n  TEST: LG(0,0) is a Gaussian at the waist\n";
    try {
        const double w0 = 1e-3;
        const double k = 2.0 * kPi / 500e-9;
        const std::vector<double> axis = BuildAxis(8e-3, 64);
        const LgModeResult mode = GenerateLgMode(0, 0, k, w0, axis, axis);

        for (size_t r = 0; r < 64; r += 7) {
            for (size_t c = 0; c < 64; c += 5) {
                const double rho2 = axis[r] * axis[r] + axis[c] * axis[c];
                const double expected = std::exp(-rho2 / (w0 * w0));
                if (!Near(mode.field(r, c).real(), expected) ||
                    !Near(mode.field(r, c).imag(), 0.0) ||
                    !Near(mode.intensity(r, c), expected * expected)) {
                    std::cerr << "  [FAIL] sample (" << r << ", " << c << ")\n";
                    return false;
                }
            }
        }

        const PeakSample peak = FindPeak(mode.intensity);
        if (peak.row != 32 || peak.col != 32 || !Near(peak.value, 1.0)) {
            std::cerr << "  [FAIL] peak not at the centre\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestVortexPhase() {
    std::cout << "\n  TEST: LG(0,+-1) amplitude and helical phase\n";
    try {
        const double w0 = 1e-3;
        const double k = 2.0 * kPi / 500e-9;
        const std::vector<double> axis = {-1e-3, 0.0, 1e-3};

        const LgModeResult plus = GenerateLgMode(0, 1, k, w0, axis, axis);
        const LgModeResult minus = GenerateLgMode(0, -1, k, w0, axis, axis);

        // (row 1, col 2): x = w0, y = 0; (row 2, col 1): x = 0, y = w0
        const double amplitude = std::sqrt(2.0) * std::exp(-1.0);

        bool ok = Near(plus.intensity(1, 1), 0.0) &&
                  Near(plus.intensity(1, 2), amplitude * amplitude) &&
                  Near(minus.intensity(2, 1), amplitude * amplitude) &&
                  Near(plus.phase(1, 2), 0.0) &&
                  Near(plus.phase(2, 1), kPi / 2.0) &&
                  Near(minus.phase(2, 1), -kPi / 2.0) &&
                  Near(std::abs(plus.phase(1, 0)), kPi, 1e-9);
        if (!ok) {
            std::cerr << "  [FAIL] vortex samples\n";
            return false;
        }

        for (double phase : plus.phase.GetData()) {
            if (phase <= -kPi || phase > kPi) {
                std::cerr << "  [FAIL] phase " << phase << " outside (-pi, pi]\n";
                return false;
            }
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestNegativeChargeHigherOrder() {
    std::cout << "\n  TEST: LG(2,-3) is the conjugate of LG(2,3) at the waist\n";
    try {
        const double w0 = 1e-3;
        const double k = 2.0 * kPi / 500e-9;
        const std::vector<double> axis = {-1e-3, 0.0, 1e-3};

        const LgModeResult plus = GenerateLgMode(2, 3, k, w0, axis, axis);
        const LgModeResult minus = GenerateLgMode(2, -3, k, w0, axis, axis);

        for (size_t i = 0; i < plus.field.GetSize(); ++i) {
            const std::complex<double> expected = std::conj(plus.field.GetData()[i]);
            if (std::abs(minus.field.GetData()[i] - expected) > 1e-12) {
                std::cerr << "  [FAIL] sample " << i << "\n";
                return false;
            }
        }

        // r = w0: R^2 = 2, R^3 L_2^3(2) = 2 sqrt(2) * 2, Gaussian exp(-1)
        const double amplitude = 4.0 * std::sqrt(2.0) * std::exp(-1.0);
        bool ok = Near(minus.intensity(1, 2), amplitude * amplitude, 1e-10) &&
                  Near(minus.intensity(2, 1), amplitude * amplitude, 1e-10) &&
                  Near(minus.intensity(1, 1), 0.0) &&
                  Near(minus.phase(1, 2), 0.0, 1e-12) &&
                  Near(minus.phase(2, 1), kPi / 2.0, 1e-12) &&
                  Near(plus.phase(2, 1), -kPi / 2.0, 1e-12);
        if (!ok) {
            std::cerr << "  [FAIL] I=" << minus.intensity(1, 2) << " phase="
                      << minus.phase(2, 1) << "\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestRayleighDistance() {
    std::cout << "\n  TEST: LG(0,0) at z = zR (waist growth and Gouy phase)\n";
    try {
        const double w0 = 1e-3;
        const double k = 2.0 * kPi / 500e-9;
        const double z_r = k * w0 * w0 / 2.0;
        const std::vector<double> axis = {0.0};

        const LgModeResult mode = GenerateLgMode(0, 0, k, w0, axis, axis, z_r);
        // 1/(1+i) * exp(-i pi/4): |.|^2 = 1/2, arg = -pi/2
        if (!Near(mode.intensity(0, 0), 0.5) || !Near(mode.phase(0, 0), -kPi / 2.0)) {
            std::cerr << "  [FAIL] I=" << mode.intensity(0, 0) << " phase=" << mode.phase(0, 0) << "\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestInvalidArguments() {
    std::cout << "\n  TEST: GenerateLgMode rejects invalid arguments\n";
    const std::vector<double> axis = {0.0, 1e-3};
    int rejected = 0;
    try { GenerateLgMode(-1, 0, 1.0, 1e-3, axis, axis); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { GenerateLgMode(0, 0, 1.0, 0.0, axis, axis); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { GenerateLgMode(0, 0, -1.0, 1e-3, axis, axis); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { GenerateLgMode(0, 0, 1.0, 1e-3, {}, axis); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }

    if (rejected != 4) {
        std::cerr << "  [FAIL] " << rejected << " of 4 rejected\n";
        return false;
    }
    std::cout << "  [PASS]\n";
    return true;
}

int run() {
    std::cout << "\n═══════════════════════════════════════════════════════════════\n";
    std::cout << "  Laguerre-Gaussian modes\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    int passed = 0;
    int failed = 0;

    if (TestBinomialAndLaguerre()) passed++; else failed++;
    if (TestLaguerreRecurrence()) passed++; else failed++;
    if (TestFundamentalMode()) passed++; else failed++;
    if (TestVortexPhase()) passed++; else failed++;
    if (TestNegativeChargeHigherOrder()) passed++; else failed++;
    if (TestRayleighDistance()) passed++; else failed++;
    if (TestInvalidArguments()) passed++; else failed++;

    std::cout << "\n  Passed: " << passed << "  Failed: " << failed << "\n";
    return (failed > 0) ? 1 : 0;
}

} // namespace test_lg_mode
