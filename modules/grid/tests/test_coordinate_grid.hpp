#pragma once

/**
 * @file test_coordinate_grid.hpp
 * @brief Tests for Array2D, field helpers and CoordinateGrid
 */

#include "array2d.hpp"
#include "coordinate_grid.hpp"
#include "field_ops.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <complex>
#include <iostream>
#include <vector>

namespace test_coordinate_grid {

using namespace scalar_optics;

bool Near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

bool TestAxes() {
    std::cout << "\n  TEST: spatial and frequency axes\n";
    try {
        const std::vector<double> x = BuildAxis(1.0, 4);
        const std::vector<double> fx = BuildFrequencyAxis(1.0, 4);
        const std::vector<double> x_expected = {-0.5, -0.25, 0.0, 0.25};
        const std::vector<double> fx_expected = {-2.0, -1.0, 0.0, 1.0};

        for (size_t i = 0; i < 4; ++i) {
            if (!Near(x[i], x_expected[i]) || !Near(fx[i], fx_expected[i])) {
                std::cerr << "  [FAIL] sample " << i << ": x=" << x[i] << " fx=" << fx[i] << "\n";
                return false;
            }
        }

        const std::vector<double> odd = BuildAxis(1.0, 5);
        if (odd.size() != 5 || !Near(odd.front(), -0.5) || !Near(odd.back(), 0.3)) {
            std::cerr << "  [FAIL] odd axis\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestCoordinateGrid() {
    std::cout << "\n  TEST: CoordinateGrid mesh and squared radius\n";
    try {
        const CoordinateGrid grid = CoordinateGrid::Create(0.0128, 256);
        if (!Near(grid.GetSpacing(), 5e-5, 1e-18) || grid.GetSamples() != 256) {
            std::cerr << "  [FAIL] spacing " << grid.GetSpacing() << "\n";
            return false;
        }

        const MeshGrid mesh = grid.Mesh();
        const RealArray r2 = grid.RadiusSquared();
        const RealArray f2 = grid.FrequencySquared();
        if (mesh.x.GetRows() != 256 || mesh.x.GetCols() != 256 || !r2.SameShape(mesh.y)) {
            std::cerr << "  [FAIL] mesh shape\n";
            return false;
        }

        // Row index is y, column index is x
        const double x = mesh.x(3, 200);
        const double y = mesh.y(3, 200);
        if (!Near(x, grid.Axis()[200]) || !Near(y, grid.Axis()[3]) ||
            !Near(r2(3, 200), x * x + y * y) || r2(128, 128) != 0.0 || f2(128, 128) != 0.0) {
            std::cerr << "  [FAIL] mesh orientation\n";
            return false;
        }

        const MeshGrid rect = MakeMeshGrid({0.0, 1.0, 2.0}, {5.0, 6.0});
        if (rect.x.GetRows() != 2 || rect.x.GetCols() != 3 || rect.y(1, 2) != 6.0) {
            std::cerr << "  [FAIL] rectangular mesh\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestInvalidGrid() {
    std::cout << "\n  TEST: invalid windows are rejected\n";
    int rejected = 0;
    try { BuildAxis(0.0, 8); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { BuildFrequencyAxis(1.0, 0); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { CoordinateGrid::Create(-1.0, 8); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { MakeMeshGrid({}, {1.0}); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
    try { ComplexField(2, 2, std::vector<std::complex<double>>(3)); }
    catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }

    if (rejected != 5) {
        std::cerr << "  [FAIL] only " << rejected << " of 5 rejected\n";
        return false;
    }
    std::cout << "  [PASS]\n";
    return true;
}

bool TestFieldOps() {
    std::cout << "\n  TEST: Intensity, Phase, TotalPower, FindPeak\n";
    try {
        ComplexField field(2, 3);
        field(0, 0) = {1.0, 1.0};
        field(1, 2) = {0.0, -3.0};
        field(1, 0) = {-2.0, 0.0};

        const RealArray intensity = Intensity(field);
        const RealArray phase = Phase(field);
        const PeakSample peak = FindPeak(intensity);

        const double pi = 3.14159265358979323846;
        bool ok = Near(intensity(0, 0), 2.0) && Near(intensity(1, 2), 9.0) &&
                  Near(TotalPower(field), 15.0) &&
                  Near(phase(0, 0), pi / 4.0) && Near(phase(1, 2), -pi / 2.0) &&
                  peak.row == 1 && peak.col == 2 && Near(peak.value, 9.0);
        if (!ok) {
            std::cerr << "  [FAIL] helper values\n";
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
    std::cout << "  Coordinate grid\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    int passed = 0;
    int failed = 0;

    if (TestAxes()) passed++; else failed++;
    if (TestCoordinateGrid()) passed++; else failed++;
    if (TestInvalidGrid()) passed++; else failed++;
    if (TestFieldOps()) passed++; else failed++;

    std::cout << "\n  Passed: " << passed << "  Failed: " << failed << "\n";
    return (failed > 0) ? 1 : 0;
}

} // namespace test_coordinate_grid
