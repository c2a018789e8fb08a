#pragma once

/**
 * @file aperture_masks.hpp
 * @brief Binary disk / ring masks, centred placement, circular pupil
 *
 * Pixel masks (DrawDisk, DrawRing) are centred on sample
 * (floor(size/2), floor(size/2)), the sample that carries coordinate 0 on
 * a BuildAxis() grid. Diameters are in samples; they need not be integers.
 */

#include "array2d.hpp"
#include "coordinate_grid.hpp"
#include "common/errors.hpp"

#include <cstddef>
#include <string>

namespace scalar_optics {

/**
 * @brief 1 where x^2 + y^2 <= r^2, r = ceil(diameter/2), (x, y) pixel offsets
 * @throws field_prop_lib::InvalidDimensionError for size == 0 or diameter <= 0
 * @throws field_prop_lib::InconsistentGridError if 2r+1 > size
 */
BinaryMask DrawDisk(size_t size, double diameter);

/**
 * @brief DrawDisk(outer) AND NOT DrawDisk(inner)
 *
 * inner_diameter == 0 means no hole; inner_diameter >= outer_diameter
 * gives an all-zero mask.
 *
 * @throws field_prop_lib::InvalidDimensionError for size == 0,
 *         outer_diameter <= 0 or inner_diameter < 0
 * @throws field_prop_lib::InconsistentGridError if the outer disk does not fit
 */
BinaryMask DrawRing(size_t size, double inner_diameter, double outer_diameter);

/**
 * @brief sqrt(x^2 + y^2) <= radius on a physical mesh
 * @throws field_prop_lib::InvalidDimensionError for radius <= 0 or
 *         mismatched mesh shapes
 */
BinaryMask CircularPupil(const MeshGrid& mesh, double radius);

/**
 * @brief field * mask, elementwise
 * @throws field_prop_lib::InvalidDimensionError on shape mismatch
 */
ComplexField ApplyMask(const ComplexField& field, const BinaryMask& mask);

/**
 * @brief Place `small` into a zero (bg_height x bg_width) background
 *
 * Anchor (0-based): row floor((bg_height - h)/2), col floor((bg_width - w)/2).
 *
 * @throws field_prop_lib::InconsistentGridError if `small` is larger than
 *         the background in either dimension
 */
template<typename T>
Array2D<T> CenterPlace(size_t bg_width, size_t bg_height, const Array2D<T>& small) {
    const size_t h = small.GetRows();
    const size_t w = small.GetCols();

    if (h > bg_height || w > bg_width) {
        throw field_prop_lib::InconsistentGridError(
            "CenterPlace: " + std::to_string(h) + "x" + std::to_string(w) +
            " array does not fit a " + std::to_string(bg_height) + "x" +
            std::to_string(bg_width) + " background");
    }

    Array2D<T> out(bg_height, bg_width, T{});
    const size_t row0 = (bg_height - h) / 2;
    const size_t col0 = (bg_width - w) / 2;

    for (size_t r = 0; r < h; ++r) {
        for (size_t c = 0; c < w; ++c) {
            out(row0 + r, col0 + c) = small(r, c);
        }
    }
    return out;
}

} // namespace scalar_optics
