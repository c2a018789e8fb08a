#pragma once

/**
 * @file array2d.hpp
 * @brief Array2D - row-major 2D container used for fields, masks and meshes
 *
 * Row index is y, column index is x. The storage is a std::vector so a
 * field can be handed to ToDevice() without copying into another layout.
 */

#include "common/errors.hpp"

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace scalar_optics {

template<typename T>
class Array2D {
public:
    using value_type = T;

    Array2D() : rows_(0), cols_(0) {}

    Array2D(size_t rows, size_t cols, const T& value = T{})
        : rows_(rows), cols_(cols), data_(rows * cols, value) {}

    /**
     * @brief Adopt existing row-major samples
     * @throws field_prop_lib::InvalidDimensionError if data.size() != rows*cols
     */
    Array2D(size_t rows, size_t cols, std::vector<T> data)
        : rows_(rows), cols_(cols), data_(std::move(data)) {
        if (data_.size() != rows_ * cols_) {
            throw field_prop_lib::InvalidDimensionError(
                "Array2D: " + std::to_string(data_.size()) + " samples for a " +
                std::to_string(rows_) + "x" + std::to_string(cols_) + " array");
        }
    }

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    size_t GetRows() const { return rows_; }
    size_t GetCols() const { return cols_; }
    size_t GetSize() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }
    bool IsSquare() const { return rows_ == cols_; }

    template<typename U>
    bool SameShape(const Array2D<U>& other) const {
        return rows_ == other.GetRows() && cols_ == other.GetCols();
    }

    std::vector<T>& GetData() { return data_; }
    const std::vector<T>& GetData() const { return data_; }

private:
    size_t rows_;
    size_t cols_;
    std::vector<T> data_;
};

using ComplexField = Array2D<std::complex<double>>;
using RealArray    = Array2D<double>;
using BinaryMask   = Array2D<uint8_t>;

} // namespace scalar_optics
