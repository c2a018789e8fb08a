#pragma once

/**
 * @file coordinate_grid.hpp
 * @brief Sampled spatial and spatial-frequency coordinates of a square window
 *
 * For a window of side L sampled M times (dx = L/M):
 * - spatial axis   x_i = -L/2 + i*dx,          i = 0..M-1
 * - frequency axis f_i = -1/(2dx) + i/L,       i = 0..M-1
 *
 * For even M sample floor(M/2) carries x = 0 and f = 0, matching the
 * fftshift ordering. For odd M both axes are offset by half a sample.
 */

#include "array2d.hpp"

#include <cstddef>
#include <vector>

namespace scalar_optics {

/**
 * @struct MeshGrid
 * @brief x(r, c) = axis_x[c], y(r, c) = axis_y[r]
 */
struct MeshGrid {
    RealArray x;
    RealArray y;
};

/**
 * @throws field_prop_lib::InvalidDimensionError if L is not positive and
 *         finite, or M == 0
 */
std::vector<double> BuildAxis(double window_size, size_t samples);

/// @throws field_prop_lib::InvalidDimensionError (same rules as BuildAxis)
std::vector<double> BuildFrequencyAxis(double window_size, size_t samples);

/**
 * @brief Two (len(y) x len(x)) arrays from 1D axes
 * @throws field_prop_lib::InvalidDimensionError if either axis is empty
 */
MeshGrid MakeMeshGrid(const std::vector<double>& axis_x, const std::vector<double>& axis_y);

// ════════════════════════════════════════════════════════════════════════════
// CoordinateGrid
// ════════════════════════════════════════════════════════════════════════════

class CoordinateGrid {
public:
    /// @throws field_prop_lib::InvalidDimensionError for L <= 0 or M == 0
    static CoordinateGrid Create(double window_size, size_t samples);

    double GetWindowSize() const { return window_size_; }
    size_t GetSamples() const { return samples_; }
    double GetSpacing() const { return window_size_ / static_cast<double>(samples_); }

    std::vector<double> Axis() const;
    std::vector<double> FrequencyAxis() const;
    MeshGrid Mesh() const;
    MeshGrid FrequencyMesh() const;

    /// x^2 + y^2 per sample of the spatial mesh
    RealArray RadiusSquared() const;

    /// fx^2 + fy^2 per sample of the frequency mesh
    RealArray FrequencySquared() const;

private:
    CoordinateGrid(double window_size, size_t samples)
        : window_size_(window_size), samples_(samples) {}

    double window_size_;
    size_t samples_;
};

} // namespace scalar_optics
