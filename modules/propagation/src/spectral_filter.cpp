#include "spectral_filter.hpp"
#include "common/device_buffer.hpp"
#include "common/errors.hpp"

#include <complex>

namespace scalar_optics {

using field_prop_lib::FftDirection;
using field_prop_lib::InvalidDimensionError;

ComplexField ApplySpectralFilter(field_prop_lib::IBackend& backend,
                                 const ComplexField& field,
                                 const ComplexField& filter) {
    if (field.IsEmpty() || !field.IsSquare()) {
        throw InvalidDimensionError("ApplySpectralFilter: field must be square and non-empty");
    }
    if (!field.SameShape(filter)) {
        throw InvalidDimensionError("ApplySpectralFilter: filter shape differs from field");
    }

    const size_t n = field.GetRows();

    auto buffer = field_prop_lib::ToDevice(backend, field.GetData());
    auto factor = field_prop_lib::ToDevice(backend, filter.GetData());

    backend.Fft2D(buffer.GetPtr(), n, FftDirection::FORWARD);
    backend.Multiply(buffer.GetPtr(), factor.GetPtr(), n * n);
    backend.Fft2D(buffer.GetPtr(), n, FftDirection::INVERSE);
    backend.Synchronize();

    return ComplexField(n, n, field_prop_lib::ToHost(buffer));
}

} // namespace scalar_optics
