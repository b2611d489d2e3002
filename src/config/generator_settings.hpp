#pragma once

#include "heightfield/dimension_planner.hpp"
#include "image/exr_format.hpp"
#include "profile/profile_source.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ridgeline {

/**
 * @brief Everything one heightmap compile needs besides the input level.
 *
 * Defaults come from resetDefaults(), a JSON file can override them through
 * applyConfig(), and command-line flags are applied last.
 *
 * Config file layout:
 * {
 *   "heightmap":   { "pixelsPerMeter": 1.0, "height": 1024, "output": "out.exr",
 *                    "compression": "zip", "embedMetadata": true, "writeDescriptor": false },
 *   "levelServer": { "urlTemplate": "https://host/levels/{id}",
 *                    "connectTimeoutSeconds": 10, "readTimeoutSeconds": 30 }
 * }
 */
struct GeneratorSettings {
    double pixelsPerMeter = kDefaultPixelsPerMeter;
    int height = kDefaultRasterHeight;
    std::string outputPath; // empty: derived from the level name
    ExrCompression compression = ExrCompression::Zip;
    bool embedMetadata = true;
    bool writeDescriptor = false;
    FetchConfig fetch;

    void resetDefaults();
    // Throws std::invalid_argument for values of the wrong type or an unknown compression.
    void applyConfig(const nlohmann::json& config);
    void clamp();
};

// Loads a config file on top of the defaults; throws std::invalid_argument when unreadable.
GeneratorSettings loadGeneratorSettings(const std::string& path);

} // namespace ridgeline
