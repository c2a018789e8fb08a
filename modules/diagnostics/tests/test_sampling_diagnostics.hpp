#pragma once

/**
 * @file test_sampling_diagnostics.hpp
 * @brief Tests for FresnelNumber, EvaluateSampling and CompareFields
 */

#include "sampling_diagnostics.hpp"
#include "field_comparison.hpp"

#include <cmath>
#include <complex>
#include <iostream>
#include <string>

namespace test_sampling_diagnostics {

using namespace scalar_optics;

bool RelNear(double a, double b, double rel = 1e-9) {
    return std::abs(a - b) <= rel * std::abs(b);
}

bool TestFresnelNumber() {
    std::cout << "\n  TEST: Fresnel number and regime\n";
    try {
        const FresnelNumberResult wide = FresnelNumber(500e-9, 0.3, 3e-3);
        const FresnelNumberResult mid = FresnelNumber(500e-9, 0.3, 1e-3);
        const FresnelNumberResult narrow = FresnelNumber(500e-9, 0.3, 3e-4);
        const FresnelNumberResult unit = FresnelNumber(0.25, 4.0, 1.0);

        bool ok = RelNear(wide.value, 60.0) && wide.regime == FresnelRegime::UNRELIABLE &&
                  RelNear(mid.value, 20.0 / 3.0) && mid.regime == FresnelRegime::BORDERLINE &&
                  RelNear(narrow.value, 0.6) && narrow.regime == FresnelRegime::GOOD &&
                  unit.value == 1.0 && unit.regime == FresnelRegime::GOOD;

        const FresnelNumberResult zero_z = FresnelNumber(500e-9, 0.0, 1e-3);
        const FresnelNumberResult bad_a = FresnelNumber(500e-9, 0.3, -1e-3);
        ok = ok && zero_z.regime == FresnelRegime::INVALID && std::isnan(zero_z.value) &&
             bad_a.regime == FresnelRegime::INVALID;

        const std::string text = Describe(wide);
        ok = ok && text.find("60.0000") != std::string::npos &&
             text.find("outside reliable Fresnel regime") != std::string::npos;

        if (!ok) {
            std::cerr << "  [FAIL] " << wide.value << " " << mid.value << " " << narrow.value << "\n";
            return false;
        }
        std::cout << "  [PASS] " << text << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestSamplingReport() {
    std::cout << "\n  TEST: critical sampling report\n";
    try {
        // L = 1.28 cm, M = 2048, lambda = 500 nm, z = 30 cm
        const SamplingReport under = EvaluateSampling(500e-9, 0.3, 0.0128, 6.25e-6, 2048);
        bool ok = under.status == SamplingStatus::UNDERSAMPLED &&
                  RelNear(under.dx_critical, 1.171875e-5) &&
                  RelNear(under.ratio, 6.25e-6 / 1.171875e-5) &&
                  RelNear(under.suggested_distance, 0.16) &&
                  RelNear(under.suggested_window, 1.171875e-5) &&
                  RelNear(under.suggested_samples, 0.0128 / 1.171875e-5);

        const SamplingReport critical = EvaluateSampling(0.5, 1.0, 2.0, 0.25, 8);
        const SamplingReport over = EvaluateSampling(0.5, 1.0, 2.0, 0.5, 4);
        ok = ok && critical.status == SamplingStatus::CRITICAL &&
             over.status == SamplingStatus::OVERSAMPLED;

        const SamplingReport no_samples = EvaluateSampling(500e-9, 0.3, 0.0128, 6.25e-6, 0);
        const SamplingReport bad_dx = EvaluateSampling(500e-9, 0.3, 0.0128, -1.0, 2048);
        ok = ok && no_samples.status == SamplingStatus::INVALID &&
             std::isnan(no_samples.dx_critical) && bad_dx.status == SamplingStatus::INVALID;

        const std::string advice = Describe(under, 0.3, 0.0128, 2048);
        const std::string quiet = Describe(critical, 1.0, 2.0, 8);
        ok = ok && advice.find("Change propagation distance") != std::string::npos &&
             advice.find("Change sampling points") != std::string::npos &&
             quiet.find("Change") == std::string::npos;

        if (!ok) {
            std::cerr << "  [FAIL] report values\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestCompareFields() {
    std::cout << "\n  TEST: CompareFields central column difference\n";
    try {
        using cplx = std::complex<double>;
        ComplexField reference(2, 2);
        ComplexField candidate(2, 2);
        reference(0, 1) = cplx(1.0, 0.0);
        reference(1, 1) = cplx(0.0, 2.0);
        candidate(0, 1) = cplx(1.0, 0.0);
        candidate(1, 1) = cplx(std::sqrt(2.0), 0.0);

        const FieldComparison cmp = CompareFields(reference, candidate);
        bool ok = RelNear(cmp.central_column_difference, 0.5) &&
                  RelNear(cmp.reference.total_power, 5.0) &&
                  cmp.reference.peak_row == 1 && cmp.reference.peak_col == 1;

        const FieldComparison same = CompareFields(reference, reference);
        const FieldComparison shapes = CompareFields(reference, ComplexField(3, 3));
        const FieldComparison dark = CompareFields(ComplexField(2, 2), candidate);
        ok = ok && same.central_column_difference == 0.0 &&
             std::isnan(shapes.central_column_difference) &&
             std::isnan(dark.central_column_difference);

        if (!ok) {
            std::cerr << "  [FAIL] difference " << cmp.central_column_difference << "\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

int run() {
    std::cout << "\n═══════════════════════════════════════════════════════════════\n";
    std::cout << "  Sampling diagnostics\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    int passed = 0;
    int failed = 0;

    if (TestFresnelNumber()) passed++; else failed++;
    if (TestSamplingReport()) passed++; else failed++;
    if (TestCompareFields()) passed++; else failed++;

    std::cout << "\n  Passed: " << passed << "  Failed: " << failed << "\n";
    return (failed > 0) ? 1 : 0;
}

} // namespace test_sampling_diagnostics
