/**
 * @file simulation_config.cpp
 * @brief SimulationConfig - nlohmann/json load / save
 */

#include "simulation_config.hpp"
#include "../common/errors.hpp"
#include "../logger/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace field_prop_lib {

// ============================================================================
// JSON helpers
// ============================================================================

namespace {

void ParseBeam(const json& j, BeamSettings& beam) {
    beam.p             = j.value("p", beam.p);
    beam.l             = j.value("l", beam.l);
    beam.beam_diameter = j.value("beam_diameter", beam.beam_diameter);
}

void ParseGrid(const json& j, GridSettings& grid) {
    grid.input_window = j.value("input_window", grid.input_window);
    grid.scale_factor = j.value("scale_factor", grid.scale_factor);

    // Negative sample counts would wrap in size_t; map them to 0 so that
    // Validate() reports them.
    long long samples = j.value("samples", static_cast<long long>(grid.samples));
    grid.samples = samples > 0 ? static_cast<std::size_t>(samples) : 0;
}

void ParseOptics(const json& j, OpticsSettings& optics) {
    optics.wavelength          = j.value("wavelength", optics.wavelength);
    optics.distance            = j.value("distance", optics.distance);
    optics.use_lens            = j.value("use_lens", optics.use_lens);
    optics.focal_distance      = j.value("focal_distance", optics.focal_distance);
    optics.lens_radius         = j.value("lens_radius", optics.lens_radius);
    optics.use_ring_aperture   = j.value("use_ring_aperture", optics.use_ring_aperture);
    optics.ring_inner_diameter = j.value("ring_inner_diameter", optics.ring_inner_diameter);
    optics.ring_outer_diameter = j.value("ring_outer_diameter", optics.ring_outer_diameter);
}

void ParseBackend(const json& j, BackendSettings& backend) {
    backend.type         = j.value("type", backend.type);
    backend.device_index = j.value("device_index", backend.device_index);
}

void ParseLogging(const json& j, LoggingSettings& logging) {
    logging.enabled = j.value("enabled", logging.enabled);
    logging.path    = j.value("path", logging.path);
    logging.level   = j.value("level", logging.level);
}

json Serialize(const SimulationConfigData& data) {
    json root;
    root["version"] = data.version;

    root["beam"] = {
        {"p", data.beam.p},
        {"l", data.beam.l},
        {"beam_diameter", data.beam.beam_diameter}
    };

    root["grid"] = {
        {"input_window", data.grid.input_window},
        {"samples", data.grid.samples},
        {"scale_factor", data.grid.scale_factor}
    };

    root["optics"] = {
        {"wavelength", data.optics.wavelength},
        {"distance", data.optics.distance},
        {"use_lens", data.optics.use_lens},
        {"focal_distance", data.optics.focal_distance},
        {"lens_radius", data.optics.lens_radius},
        {"use_ring_aperture", data.optics.use_ring_aperture},
        {"ring_inner_diameter", data.optics.ring_inner_diameter},
        {"ring_outer_diameter", data.optics.ring_outer_diameter}
    };

    root["backend"] = {
        {"type", data.backend.type},
        {"device_index", data.backend.device_index}
    };

    root["logging"] = {
        {"enabled", data.logging.enabled},
        {"path", data.logging.path},
        {"level", data.logging.level}
    };

    return root;
}

void RequirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream oss;
        oss << name << " must be positive and finite, got " << value;
        throw InvalidDimensionError(oss.str());
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

SimulationConfig::SimulationConfig()
    : data_(CreateDefaultConfig())
    , loaded_(false) {
}

SimulationConfigData SimulationConfig::CreateDefaultConfig() {
    return SimulationConfigData{};
}

// ============================================================================
// Loading and saving
// ============================================================================

bool SimulationConfig::ParseInto(const std::string& json_text, const std::string& source) {
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            std::cerr << "[SimulationConfig] ERROR: top level of " << source
                      << " is not an object\n";
            return false;
        }

        SimulationConfigData new_data = CreateDefaultConfig();
        new_data.version = root.value("version", new_data.version);

        if (root.contains("beam") && root["beam"].is_object()) {
            ParseBeam(root["beam"], new_data.beam);
        }
        if (root.contains("grid") && root["grid"].is_object()) {
            ParseGrid(root["grid"], new_data.grid);
        }
        if (root.contains("optics") && root["optics"].is_object()) {
            ParseOptics(root["optics"], new_data.optics);
        }
        if (root.contains("backend") && root["backend"].is_object()) {
            ParseBackend(root["backend"], new_data.backend);
        }
        if (root.contains("logging") && root["logging"].is_object()) {
            ParseLogging(root["logging"], new_data.logging);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::move(new_data);
        loaded_ = true;
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[SimulationConfig] JSON error in " << source << ": " << e.what() << "\n";
        return false;
    }
}

bool SimulationConfig::Load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        std::cerr << "[SimulationConfig] ERROR: Cannot open file: " << file_path << "\n";
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!ParseInto(buffer.str(), file_path)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = file_path;
    }
    FIELDPROP_LOG_INFO("Config", "Loaded " + file_path);
    return true;
}

bool SimulationConfig::LoadFromString(const std::string& json_text) {
    return ParseInto(json_text, "<string>");
}

bool SimulationConfig::LoadOrCreate(const std::string& file_path) {
    if (fs::exists(file_path)) {
        return Load(file_path);
    }

    std::cout << "[SimulationConfig] Config file not found, creating default: "
              << file_path << "\n";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = CreateDefaultConfig();
        file_path_ = file_path;
        loaded_ = true;
    }
    return Save(file_path);
}

bool SimulationConfig::Save(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = file_path.empty() ? file_path_ : file_path;
    if (path.empty()) {
        std::cerr << "[SimulationConfig] ERROR: No file path specified for Save()\n";
        return false;
    }

    try {
        fs::path dir = fs::path(path).parent_path();
        if (!dir.empty() && !fs::exists(dir)) {
            fs::create_directories(dir);
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[SimulationConfig] ERROR: Cannot write file: " << path << "\n";
            return false;
        }
        file << Serialize(data_).dump(2) << "\n";
        file_path_ = path;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[SimulationConfig] Save error: " << e.what() << "\n";
        return false;
    }
}

std::string SimulationConfig::ToJsonString() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Serialize(data_).dump(2);
}

std::string SimulationConfig::GetFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_path_;
}

BackendType SimulationConfig::GetBackendType() const {
    return BackendTypeFromString(data_.backend.type);
}

// ============================================================================
// Validation
// ============================================================================

void SimulationConfig::Validate() const {
    const auto& d = data_;

    if (d.beam.p < 0) {
        throw InvalidDimensionError("beam.p must be >= 0, got " + std::to_string(d.beam.p));
    }
    RequirePositive(d.beam.beam_diameter, "beam.beam_diameter");

    RequirePositive(d.grid.input_window, "grid.input_window");
    RequirePositive(d.grid.scale_factor, "grid.scale_factor");
    if (d.grid.samples == 0) {
        throw InvalidDimensionError("grid.samples must be positive");
    }

    RequirePositive(d.optics.wavelength, "optics.wavelength");
    RequirePositive(d.optics.lens_radius, "optics.lens_radius");
    if (d.optics.distance == 0.0 || !std::isfinite(d.optics.distance)) {
        throw DegenerateParameterError("optics.distance must be non-zero and finite");
    }
    if (d.optics.focal_distance == 0.0 || !std::isfinite(d.optics.focal_distance)) {
        throw DegenerateParameterError("optics.focal_distance must be non-zero and finite");
    }
    if (d.optics.ring_inner_diameter < 0.0) {
        throw InvalidDimensionError("optics.ring_inner_diameter must be >= 0");
    }
    RequirePositive(d.optics.ring_outer_diameter, "optics.ring_outer_diameter");

    BackendTypeFromString(d.backend.type);

    std::string upper = d.logging.level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper != "DEBUG" && upper != "INFO" && upper != "WARNING" && upper != "ERROR") {
        throw std::invalid_argument("Unknown log level: " + d.logging.level);
    }
}

} // namespace field_prop_lib
