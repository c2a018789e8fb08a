#pragma once

/**
 * @file config_types.hpp
 * @brief Plain data for fieldprop_config.json
 *
 * Every field carries the value used by the reference LG(0,1) run, so a
 * file with missing keys (or no file at all) still describes a complete
 * simulation. Lengths are in metres; ring diameters are in samples.
 *
 * JSON layout:
 * @code
 * {
 *   "version": "1.0",
 *   "beam":    { "p": 0, "l": 1, "beam_diameter": 0.006 },
 *   "grid":    { "input_window": 0.0128, "samples": 2048, "scale_factor": 1.0 },
 *   "optics":  { "wavelength": 5e-7, "distance": 0.3, "use_lens": true,
 *                "focal_distance": 0.3, "lens_radius": 0.0254,
 *                "use_ring_aperture": false,
 *                "ring_inner_diameter": 4.0, "ring_outer_diameter": 40.0 },
 *   "backend": { "type": "AUTO", "device_index": 0 },
 *   "logging": { "enabled": true, "path": "", "level": "INFO" }
 * }
 * @endcode
 */

#include <string>
#include <cstddef>

namespace field_prop_lib {

// ════════════════════════════════════════════════════════════════════════════
// Unit literals
// ════════════════════════════════════════════════════════════════════════════

constexpr double kCentimeter = 1e-2;
constexpr double kMillimeter = 1e-3;
constexpr double kMicrometer = 1e-6;
constexpr double kNanometer  = 1e-9;

// ════════════════════════════════════════════════════════════════════════════
// Sections
// ════════════════════════════════════════════════════════════════════════════

struct BeamSettings {
    int    p             = 0;                    ///< Radial index
    int    l             = 1;                    ///< Azimuthal index (topological charge)
    double beam_diameter = 0.6 * kCentimeter;    ///< Waist diameter (w0 = diameter / 2)
};

struct GridSettings {
    double      input_window = 1.28 * kCentimeter;  ///< L_in, side of the source window
    std::size_t samples      = 2048;                ///< M
    double      scale_factor = 1.0;                 ///< L_out = scale_factor * L_in
};

struct OpticsSettings {
    double wavelength          = 500 * kNanometer;
    double distance            = 30 * kCentimeter;   ///< Free-space distance z
    bool   use_lens            = true;
    double focal_distance      = 30 * kCentimeter;
    double lens_radius         = 2.54 * kCentimeter;
    bool   use_ring_aperture   = false;
    double ring_inner_diameter = 4.0;                ///< Samples; 0 means no hole
    double ring_outer_diameter = 40.0;               ///< Samples
};

struct BackendSettings {
    std::string type         = "AUTO";   ///< "CPU", "OPENCL" or "AUTO"
    int         device_index = 0;
};

struct LoggingSettings {
    bool        enabled = true;
    std::string path    = "";            ///< Empty = current directory
    std::string level   = "INFO";
};

struct SimulationConfigData {
    std::string     version = "1.0";
    BeamSettings    beam;
    GridSettings    grid;
    OpticsSettings  optics;
    BackendSettings backend;
    LoggingSettings logging;
};

} // namespace field_prop_lib
