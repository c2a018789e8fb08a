#pragma once

/**
 * @file fft_shift.hpp
 * @brief fftshift / ifftshift on Array2D
 *
 * FftShift rolls each dimension by floor(n/2) so the DC sample moves to
 * index floor(n/2); IfftShift is its inverse (roll by -floor(n/2)) and
 * differs from FftShift only for odd n.
 */

#include "array2d.hpp"

#include <cstddef>

namespace scalar_optics {

namespace detail {

template<typename T>
Array2D<T> Roll(const Array2D<T>& in, size_t row_shift, size_t col_shift) {
    const size_t rows = in.GetRows();
    const size_t cols = in.GetCols();
    Array2D<T> out(rows, cols);
    for (size_t r = 0; r < rows; ++r) {
        const size_t dst_r = (r + row_shift) % rows;
        for (size_t c = 0; c < cols; ++c) {
            out(dst_r, (c + col_shift) % cols) = in(r, c);
        }
    }
    return out;
}

} // namespace detail

template<typename T>
Array2D<T> FftShift(const Array2D<T>& in) {
    if (in.IsEmpty()) {
        return in;
    }
    return detail::Roll(in, in.GetRows() / 2, in.GetCols() / 2);
}

template<typename T>
Array2D<T> IfftShift(const Array2D<T>& in) {
    if (in.IsEmpty()) {
        return in;
    }
    const size_t rows = in.GetRows();
    const size_t cols = in.GetCols();
    return detail::Roll(in, rows - rows / 2, cols - cols / 2);
}

} // namespace scalar_optics
