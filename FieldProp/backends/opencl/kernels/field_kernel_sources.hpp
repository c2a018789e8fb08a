#pragma once

// ════════════════════════════════════════════════════════════════════════════
// OpenCL C sources for OpenCLBackend
// ════════════════════════════════════════════════════════════════════════════

namespace field_prop_lib {
namespace kernels {

// ════════════════════════════════════════════════════════════════════════════
// complex_multiply - buffer[i] *= factor[i], interleaved double2
// ════════════════════════════════════════════════════════════════════════════
inline const char* GetComplexMultiplyKernelSource() {
    return R"CL(
#pragma OPENCL EXTENSION cl_khr_fp64 : enable

__kernel void complex_multiply(
    __global double2* buffer,         // in/out
    __global const double2* factor,
    ulong count
) {
    size_t gid = get_global_id(0);
    if (gid >= count) return;

    double2 a = buffer[gid];
    double2 b = factor[gid];
    buffer[gid] = (double2)(a.x * b.x - a.y * b.y,
                            a.x * b.y + a.y * b.x);
}
)CL";
}

inline const char* GetComplexMultiplyKernelName() {
    return "complex_multiply";
}

} // namespace kernels
} // namespace field_prop_lib
