#include "coordinate_grid.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <sstream>

namespace scalar_optics {

using field_prop_lib::InvalidDimensionError;

namespace {

void ValidateWindow(double window_size, size_t samples) {
    if (!(window_size > 0.0) || !std::isfinite(window_size)) {
        std::ostringstream oss;
        oss << "window size must be positive and finite, got " << window_size;
        throw InvalidDimensionError(oss.str());
    }
    if (samples == 0) {
        throw InvalidDimensionError("sample count must be positive");
    }
}

/// r^2 of a square mesh built from one axis
RealArray SquaredRadius(const std::vector<double>& axis) {
    const size_t m = axis.size();
    RealArray out(m, m);
    for (size_t r = 0; r < m; ++r) {
        const double y2 = axis[r] * axis[r];
        for (size_t c = 0; c < m; ++c) {
            out(r, c) = axis[c] * axis[c] + y2;
        }
    }
    return out;
}

} // namespace

// ════════════════════════════════════════════════════════════════════════════
// Free functions
// ════════════════════════════════════════════════════════════════════════════

std::vector<double> BuildAxis(double window_size, size_t samples) {
    ValidateWindow(window_size, samples);

    const double dx = window_size / static_cast<double>(samples);
    std::vector<double> axis(samples);
    for (size_t i = 0; i < samples; ++i) {
        axis[i] = -window_size / 2.0 + static_cast<double>(i) * dx;
    }
    return axis;
}

std::vector<double> BuildFrequencyAxis(double window_size, size_t samples) {
    ValidateWindow(window_size, samples);

    const double dx = window_size / static_cast<double>(samples);
    const double df = 1.0 / window_size;
    std::vector<double> axis(samples);
    for (size_t i = 0; i < samples; ++i) {
        axis[i] = -1.0 / (2.0 * dx) + static_cast<double>(i) * df;
    }
    return axis;
}

MeshGrid MakeMeshGrid(const std::vector<double>& axis_x, const std::vector<double>& axis_y) {
    if (axis_x.empty() || axis_y.empty()) {
        throw InvalidDimensionError("MakeMeshGrid: axes must be non-empty");
    }

    const size_t rows = axis_y.size();
    const size_t cols = axis_x.size();

    MeshGrid mesh{RealArray(rows, cols), RealArray(rows, cols)};
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            mesh.x(r, c) = axis_x[c];
            mesh.y(r, c) = axis_y[r];
        }
    }
    return mesh;
}

// ════════════════════════════════════════════════════════════════════════════
// CoordinateGrid
// ════════════════════════════════════════════════════════════════════════════

CoordinateGrid CoordinateGrid::Create(double window_size, size_t samples) {
    ValidateWindow(window_size, samples);
    return CoordinateGrid(window_size, samples);
}

std::vector<double> CoordinateGrid::Axis() const {
    return BuildAxis(window_size_, samples_);
}

std::vector<double> CoordinateGrid::FrequencyAxis() const {
    return BuildFrequencyAxis(window_size_, samples_);
}

MeshGrid CoordinateGrid::Mesh() const {
    auto axis = Axis();
    return MakeMeshGrid(axis, axis);
}

MeshGrid CoordinateGrid::FrequencyMesh() const {
    auto axis = FrequencyAxis();
    return MakeMeshGrid(axis, axis);
}

RealArray CoordinateGrid::RadiusSquared() const {
    return SquaredRadius(Axis());
}

RealArray CoordinateGrid::FrequencySquared() const {
    return SquaredRadius(FrequencyAxis());
}

} // namespace scalar_optics
