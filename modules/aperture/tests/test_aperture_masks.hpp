#pragma once

/**
 * @file test_aperture_masks.hpp
 * @brief Tests for DrawDisk, DrawRing, CenterPlace, CircularPupil, ApplyMask
 */

#include "aperture_masks.hpp"
#include "coordinate_grid.hpp"
#include "common/errors.hpp"

#include <complex>
#include <iostream>
#include <numeric>

namespace test_aperture_masks {

using namespace scalar_optics;

size_t CountSet(const BinaryMask& mask) {
    return std::accumulate(mask.GetData().begin(), mask.GetData().end(), size_t{0});
}

bool TestDisk() {
    std::cout << "\n  TEST: DrawDisk pixel counts and centre\n";
    try {
        // diameter 3 rounds up to radius 2: 13 samples with x^2 + y^2 <= 4
        const BinaryMask d3 = DrawDisk(5, 3.0);
        // radius 1: plus sign about (2, 2)
        const BinaryMask d2 = DrawDisk(4, 2.0);
        // diameter 5 -> radius 3: 29 samples, the (2, 2) offset included
        const BinaryMask d5 = DrawDisk(16, 5.0);

        bool ok = CountSet(d3) == 13 && d3(1, 1) == 1 && d3(3, 3) == 1 && d3(0, 2) == 1 &&
                  d3(2, 4) == 1 && d3(0, 0) == 0 && d3(0, 1) == 0 &&
                  CountSet(d2) == 5 && d2(2, 2) == 1 && d2(1, 2) == 1 && d2(2, 3) == 1 &&
                  d2(1, 1) == 0 &&
                  CountSet(d5) == 29 && d5(10, 10) == 1 && d5(5, 8) == 1 && d5(11, 11) == 0;
        if (!ok) {
            std::cerr << "  [FAIL] counts " << CountSet(d3) << ", " << CountSet(d2) << ", "
                      << CountSet(d5) << "\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestRing() {
    std::cout << "\n  TEST: DrawRing is outer AND NOT inner\n";
    try {
        const BinaryMask outer = DrawDisk(9, 7.0);
        const BinaryMask inner = DrawDisk(9, 3.0);
        const BinaryMask ring = DrawRing(9, 3.0, 7.0);

        for (size_t i = 0; i < ring.GetSize(); ++i) {
            const uint8_t expected = outer.GetData()[i] && !inner.GetData()[i];
            if (ring.GetData()[i] != expected) {
                std::cerr << "  [FAIL] sample " << i << "\n";
                return false;
            }
        }

        if (CountSet(outer) != 49 || CountSet(ring) != 36 || ring(4, 4) != 0 || ring(4, 6) != 0 ||
            ring(4, 7) != 1 || ring(0, 4) != 1) {
            std::cerr << "  [FAIL] ring count " << CountSet(ring) << "\n";
            return false;
        }

        const BinaryMask no_hole = DrawRing(9, 0.0, 7.0);
        if (no_hole.GetData() != outer.GetData()) {
            std::cerr << "  [FAIL] inner = 0 should leave the full disk\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestDegenerateRing() {
    std::cout << "\n  TEST: DrawRing with inner >= outer is empty\n";
    try {
        const BinaryMask equal = DrawRing(16, 6.0, 6.0);
        const BinaryMask inverted = DrawRing(16, 10.0, 4.0);
        if (CountSet(equal) != 0 || CountSet(inverted) != 0 ||
            equal.GetRows() != 16 || inverted.GetCols() != 16) {
            std::cerr << "  [FAIL] mask not empty\n";
            return false;
        }

        int rejected = 0;
        try { DrawRing(16, -1.0, 4.0); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
        try { DrawRing(16, 1.0, 0.0); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
        try { DrawDisk(0, 4.0); } catch (const field_prop_lib::InvalidDimensionError&) { rejected++; }
        if (rejected != 3) {
            std::cerr << "  [FAIL] invalid diameters accepted\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestOversizedDisk() {
    std::cout << "\n  TEST: disk larger than the array is rejected\n";
    try {
        int rejected = 0;
        try { DrawDisk(4, 10.0); } catch (const field_prop_lib::InconsistentGridError&) { rejected++; }
        try { DrawDisk(4, 4.0); } catch (const field_prop_lib::InconsistentGridError&) { rejected++; }
        try { DrawRing(8, 2.0, 9.0); } catch (const field_prop_lib::InconsistentGridError&) { rejected++; }
        if (rejected != 3) {
            std::cerr << "  [FAIL] " << rejected << " of 3 oversized masks rejected\n";
            return false;
        }

        // 2r+1 == size still fits: r = 2 touches all four edges of a 5x5 array
        const BinaryMask exact = DrawDisk(5, 4.0);
        if (CountSet(exact) != 13 || exact(0, 2) != 1 || exact(4, 2) != 1 ||
            exact(2, 0) != 1 || exact(2, 4) != 1 || exact(0, 1) != 0) {
            std::cerr << "  [FAIL] exact fit count " << CountSet(exact) << "\n";
            return false;
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestCenterPlace() {
    std::cout << "\n  TEST: CenterPlace anchor for even and odd sizes\n";
    try {
        const RealArray small(2, 2, 1.0);

        const RealArray odd = CenterPlace(5, 5, small);
        const RealArray wide = CenterPlace(6, 4, small);   // 4 rows, 6 cols
        const RealArray full = CenterPlace(2, 2, small);

        bool ok = odd(1, 1) == 1.0 && odd(2, 2) == 1.0 && odd(0, 0) == 0.0 && odd(3, 3) == 0.0 &&
                  wide.GetRows() == 4 && wide.GetCols() == 6 &&
                  wide(1, 2) == 1.0 && wide(2, 3) == 1.0 && wide(1, 1) == 0.0 &&
                  full(0, 0) == 1.0 && full(1, 1) == 1.0;
        if (!ok) {
            std::cerr << "  [FAIL] placement\n";
            return false;
        }

        try {
            CenterPlace(3, 3, RealArray(4, 2, 1.0));
            std::cerr << "  [FAIL] oversized array accepted\n";
            return false;
        } catch (const field_prop_lib::InconsistentGridError&) {
        }

        std::cout << "  [PASS]\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  [FAIL] Exception: " << e.what() << "\n";
        return false;
    }
}

bool TestPupilAndMask() {
    std::cout << "\n  TEST: CircularPupil and ApplyMask\n";
    try {
        const MeshGrid mesh = CoordinateGrid::Create(1.0, 4).Mesh();
        const BinaryMask pupil = CircularPupil(mesh, 0.25);
        if (CountSet(pupil) != 5 || pupil(2, 2) != 1 || pupil(3, 3) != 0) {
            std::cerr << "  [FAIL] pupil count " << CountSet(pupil) << "\n";
            return false;
        }

        const ComplexField field(4, 4, std::complex<double>(1.0, -1.0));
        const ComplexField masked = ApplyMask(field, pupil);
        if (masked(2, 2) != std::complex<double>(1.0, -1.0) ||
            masked(0, 0) != std::complex<double>(0.0, 0.0)) {
            std::cerr << "  [FAIL] masked values\n";
            return false;
        }

        try {
            ApplyMask(field, BinaryMask(3, 3, 1));
            std::cerr << "  [FAIL] shape mismatch accepted\n";
            return false;
        } catch (const field_prop_lib::InvalidDimensionError&) {
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
    std::cout << "  Aperture masks\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    int passed = 0;
    int failed = 0;

    if (TestDisk()) passed++; else failed++;
    if (TestRing()) passed++; else failed++;
    if (TestDegenerateRing()) passed++; else failed++;
    if (TestOversizedDisk()) passed++; else failed++;
    if (TestCenterPlace()) passed++; else failed++;
    if (TestPupilAndMask()) passed++; else failed++;

    std::cout << "\n  Passed: " << passed << "  Failed: " << failed << "\n";
    return (failed > 0) ? 1 : 0;
}

} // namespace test_aperture_masks
