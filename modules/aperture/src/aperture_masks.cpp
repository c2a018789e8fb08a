#include "aperture_masks.hpp"
#include "logger/logger.hpp"

#include <cmath>
#include <sstream>

namespace scalar_optics {

using field_prop_lib::InconsistentGridError;
using field_prop_lib::InvalidDimensionError;

namespace {

/**
 * Local stencil of side 2r+1 about the origin with r = ceil(d/2),
 * thresholded at x^2 + y^2 <= r^2, written into a size x size array with
 * its centre on (floor(size/2), floor(size/2)).
 *
 * @throws InconsistentGridError if the stencil does not fit the array
 */
BinaryMask StampDisk(size_t size, double diameter, const char* who) {
    const long radius = static_cast<long>(std::ceil(diameter / 2.0));
    const long side = 2 * radius + 1;
    const long n = static_cast<long>(size);
    if (side > n) {
        std::ostringstream oss;
        oss << who << ": diameter " << diameter << " needs a " << side << "x" << side
            << " stencil, array is " << size << "x" << size;
        throw InconsistentGridError(oss.str());
    }

    BinaryMask mask(size, size, 0);
    const long centre = n / 2;
    const long radius_sq = radius * radius;

    for (long dy = -radius; dy <= radius; ++dy) {
        for (long dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius_sq) {
                mask(static_cast<size_t>(centre + dy), static_cast<size_t>(centre + dx)) = 1;
            }
        }
    }
    return mask;
}

void RequireSize(size_t size, const char* who) {
    if (size == 0) {
        throw InvalidDimensionError(std::string(who) + ": size must be positive");
    }
}

} // namespace

BinaryMask DrawDisk(size_t size, double diameter) {
    RequireSize(size, "DrawDisk");
    if (!(diameter > 0.0) || !std::isfinite(diameter)) {
        std::ostringstream oss;
        oss << "DrawDisk: diameter must be positive, got " << diameter;
        throw InvalidDimensionError(oss.str());
    }
    return StampDisk(size, diameter, "DrawDisk");
}

BinaryMask DrawRing(size_t size, double inner_diameter, double outer_diameter) {
    RequireSize(size, "DrawRing");
    if (!(outer_diameter > 0.0) || !std::isfinite(outer_diameter)) {
        std::ostringstream oss;
        oss << "DrawRing: outer diameter must be positive, got " << outer_diameter;
        throw InvalidDimensionError(oss.str());
    }
    if (inner_diameter < 0.0 || !std::isfinite(inner_diameter)) {
        std::ostringstream oss;
        oss << "DrawRing: inner diameter must be >= 0, got " << inner_diameter;
        throw InvalidDimensionError(oss.str());
    }

    if (inner_diameter >= outer_diameter) {
        FIELDPROP_LOG_WARNING("Aperture", "DrawRing: inner diameter >= outer diameter, mask is empty");
        return BinaryMask(size, size, 0);
    }

    BinaryMask ring = StampDisk(size, outer_diameter, "DrawRing");
    if (inner_diameter == 0.0) {
        return ring;
    }

    const BinaryMask hole = StampDisk(size, inner_diameter, "DrawRing");
    auto& out = ring.GetData();
    const auto& h = hole.GetData();
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(out[i] && !h[i]);
    }
    return ring;
}

BinaryMask CircularPupil(const MeshGrid& mesh, double radius) {
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        std::ostringstream oss;
        oss << "CircularPupil: radius must be positive, got " << radius;
        throw InvalidDimensionError(oss.str());
    }
    if (!mesh.x.SameShape(mesh.y)) {
        throw InvalidDimensionError("CircularPupil: mesh x and y differ in shape");
    }

    BinaryMask pupil(mesh.x.GetRows(), mesh.x.GetCols(), 0);
    const auto& xs = mesh.x.GetData();
    const auto& ys = mesh.y.GetData();
    auto& out = pupil.GetData();
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = std::sqrt(xs[i] * xs[i] + ys[i] * ys[i]) <= radius ? 1 : 0;
    }
    return pupil;
}

ComplexField ApplyMask(const ComplexField& field, const BinaryMask& mask) {
    if (!field.SameShape(mask)) {
        throw InvalidDimensionError(
            "ApplyMask: field is " + std::to_string(field.GetRows()) + "x" +
            std::to_string(field.GetCols()) + ", mask is " +
            std::to_string(mask.GetRows()) + "x" + std::to_string(mask.GetCols()));
    }

    ComplexField out = field;
    auto& data = out.GetData();
    const auto& m = mask.GetData();
    for (size_t i = 0; i < data.size(); ++i) {
        if (!m[i]) {
            data[i] = 0.0;
        }
    }
    return out;
}

} // namespace scalar_optics
