#pragma once

/**
 * @file test_two_step_fresnel.hpp
 * @brief Tests for TwoStepFresnelPropagator, checked against the angular spectrum
 */

#include "two_step_fresnel.hpp"
#include "angular_spectrum.hpp"
#include "coordinate_grid.hpp"
#include "field_ops.hpp"
#include "field_comparison.hpp"
#include "backends/cpu/cpu_backend.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <complex>
#include <iostream>
#include <limits>

namespace test_two_step_fresnel {

using namespace scalar_optics;
using field_prop_lib::CpuBackend;
using cplx = std::complex<double>;

constexpr double kPi = 3.14159265358979323846;
constexpr double kWavelength = 500e-9;
constexpr double kWaist = 1e-4;
constexpr double kWindow = 1.28e-3;
constexpr size_t kSamples = 128;

ComplexField Gaussian() {
    const RealArray r2 = CoordinateGrid::Create(kWindow, kSamples).RadiusSquared();
    ComplexField field(kSamples, kSamples);
    for (size_t i = 0; i < field.GetSize(); ++i) {
        field.GetData()[i] = std::exp(-r2.GetData()[i] / (kWaist * kWaist));
    }
    return field;
}

double RayleighDistance() {
    return kPi * kWaist * kWaist / kWavelength;
}

bool TestMatchesAngularSpectrum() {
    std::cout << "\n  TEST: L_out = L_in agrees with the angular spectrum\n";
    try {
        CpuBackend backend;
        backend.Initialize(0);
        AngularSpectrumPropagator asm_propagator(backend);
        TwoStepFresnelPropagator two_step(backend);

        const ComplexField u1 = Gaussian();
        const double z = RayleighDistance();
        const ComplexField u_asm = asm_propagator.Propagate(u1, kWindow, kWavelength, z);
        const ComplexField u_fr = two_step.Propagate(u1, kWindow, kWindow, kWavelength, z);

        const FieldComparison cmp = CompareFields(u_asm, u_fr);
        std::cout << "    Central column difference: " << cmp.central_column_difference << "\n";

        if (!(cmp.central_column_difference < 1e-3) ||
            cmp.candidate.peak_row != cmp.reference.peak_row ||
            cmp.candidate.peak_col != cmp.reference.peak_col ||
            std::abs(cmp.candidate.total_power - cmp.reference.total_power) >
                1e-9 * cmp.reference.total_power) {
            std::cerr << "  [FAIL] fields differ\n";
            return false;
        }
        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestScaledWindow() {
    std::cout << "\n  TEST: L_out = 2 L_in keeps the physical intensity\n";
    try {
        CpuBackend backend;
        backend.Initialize(0);
        TwoStepFresnelPropagator two_step(backend);

        PropagationParameters params;
        params.wavelength = kWavelength;
        params.distance = RayleighDistance();
        params.input_window = kWindow;
        params.output_window = 2.0 * kWindow;
        params.samples = kSamples;

        const ComplexField u1 = Gaussian();
        const ComplexField u2 = two_step.Propagate(u1, params);

        // Energy on the coarser grid: sum |u2|^2 dx2^2 = sum |u1|^2 dx1^2
        const double ratio = TotalPower(u2) / TotalPower(u1);
        const PeakSample peak = FindPeak(Intensity(u2));

        std::cout << "    Power ratio: " << ratio << "  Peak: " << peak.value << "\n";
        if (std::abs(ratio - 0.25) > 1e-9 ||
            peak.row != kSamples / 2 || peak.col != kSamples / 2 ||
            std::abs(peak.value - 0.5) > 0.01) {
            std::cerr << "  [FAIL] scaled result\n";
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
    std::cout << "\n  TEST: z = 0 and non-positive windows are rejected\n";
    CpuBackend backend;
    backend.Initialize(0);
    TwoStepFresnelPropagator two_step(backend);
    const ComplexField square(8, 8, cplx(1.0, 0.0));

    int rejected = 0;
    try { two_step.Propagate(square, 1e-3, 1e-3, kWavelength, 0.0); }
    catch (const field_prop_lib::DegenerateParameterError&) { rejected++; }
    try { two_step.Propagate(square, 1e-3, 1e-3, kWavelength, std::numeric_limits<double>::infinity()); }
    catch (const field_prop_lib::DegenerateParameterError&) { rejected++; }
    try { two_step.Propagate(square, 1e-3, 0.0, kWavelength, 0.1); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { two_step.Propagate(square, -1e-3, 1e-3, kWavelength, 0.1); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { two_step.Propagate(ComplexField(), 1e-3, 1e-3, kWavelength, 0.1); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }

    if (rejected != 5) {
        std::cerr << "  [FAIL] " << rejected << " of 5 rejected\n";
        return false;
    }
    std::cout << "  [PASS]\n";
    return true;
}

int run() {
    std::cout << "\n═══════════════════════════════════════════════════════════════\n";
    std::cout << "  Two-step Fresnel propagation\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    int passed = 0;
    int failed = 0;

    if (TestMatchesAngularSpectrum()) passed++; else failed++;
    if (TestScaledWindow()) passed++; else failed++;
    if (TestInvalidArguments()) passed++; else failed++;

    std::cout << "\n  Passed: " << passed << "  Failed: " << failed << "\n";
    return (failed > 0) ? 1 : 0;
}

} // namespace test_two_step_fresnel
