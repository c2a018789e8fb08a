#pragma once

/**
 * @file simulation_config.hpp
 * @brief SimulationConfig - JSON configuration for a propagation run
 *
 * Unlike a process-wide singleton, each SimulationConfig owns its data, so
 * tests and tools can hold several configurations side by side.
 *
 * @code
 * SimulationConfig config;
 * if (!config.LoadOrCreate("configs/fieldprop_config.json")) { ... }
 * config.Validate();
 * const auto& optics = config.GetData().optics;
 * @endcode
 */

#include "config_types.hpp"
#include "../common/backend_type.hpp"

#include <mutex>
#include <string>

namespace field_prop_lib {

class SimulationConfig {
public:
    SimulationConfig();

    SimulationConfig(const SimulationConfig&) = delete;
    SimulationConfig& operator=(const SimulationConfig&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Loading and saving
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Parse a JSON file; missing keys keep their defaults
     * @return false if the file cannot be opened or parsed (data unchanged)
     */
    bool Load(const std::string& file_path);

    /**
     * @brief Parse JSON text (same rules as Load)
     */
    bool LoadFromString(const std::string& json_text);

    /**
     * @brief Load the file, or write the defaults to it when it is absent
     */
    bool LoadOrCreate(const std::string& file_path);

    /**
     * @brief Write the current data as pretty-printed JSON
     * @param file_path Target; empty means the path of the last Load
     */
    bool Save(const std::string& file_path = "");

    std::string ToJsonString() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Access
    // ═══════════════════════════════════════════════════════════════════════

    const SimulationConfigData& GetData() const { return data_; }
    SimulationConfigData& GetMutableData() { return data_; }

    bool IsLoaded() const { return loaded_; }
    std::string GetFilePath() const;

    /// backend.type parsed with BackendTypeFromString()
    BackendType GetBackendType() const;

    /**
     * @brief Reject values no run can use
     * @throws InvalidDimensionError for non-positive lengths, samples, or
     *         scale factor, negative p or ring diameters
     * @throws DegenerateParameterError for zero distance or focal distance
     * @throws std::invalid_argument for an unknown backend type or log level
     */
    void Validate() const;

    /// Built-in defaults
    static SimulationConfigData CreateDefaultConfig();

private:
    bool ParseInto(const std::string& json_text, const std::string& source);

    SimulationConfigData data_;
    std::string file_path_;
    bool loaded_;

    mutable std::mutex mutex_;
};

} // namespace field_prop_lib
