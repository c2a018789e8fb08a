#pragma once

/**
 * @file errors.hpp
 * @brief Error taxonomy for grid, mask and propagation routines
 *
 * All three categories are rejected input, so they derive from
 * std::invalid_argument through FieldPropError:
 * - InvalidDimensionError     - non-positive L, M, radius, or mismatched shapes
 * - DegenerateParameterError  - zero distance / focal length (division by zero)
 * - InconsistentGridError     - array does not fit the requested placement
 *
 * Backend failures (no device, OpenCL / clFFT / FFTW status codes) are
 * std::runtime_error and are not part of this hierarchy.
 */

#include <stdexcept>
#include <string>

namespace field_prop_lib {

class FieldPropError : public std::invalid_argument {
public:
    explicit FieldPropError(const std::string& message)
        : std::invalid_argument(message) {}
};

class InvalidDimensionError : public FieldPropError {
public:
    explicit InvalidDimensionError(const std::string& message)
        : FieldPropError("InvalidDimension: " + message) {}
};

class DegenerateParameterError : public FieldPropError {
public:
    explicit DegenerateParameterError(const std::string& message)
        : FieldPropError("DegenerateParameter: " + message) {}
};

class InconsistentGridError : public FieldPropError {
public:
    explicit InconsistentGridError(const std::string& message)
        : FieldPropError("InconsistentGrid: " + message) {}
};

} // namespace field_prop_lib
