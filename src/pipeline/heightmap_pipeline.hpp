#pragma once

#include "config/generator_settings.hpp"
#include "heightfield/dimension_planner.hpp"
#include "metadata/terrain_metadata.hpp"
#include "profile/profile.hpp"
#include "profile/profile_source.hpp"

#include <cstddef>
#include <string>

namespace ridgeline {

constexpr const char* kDefaultOutputPath = "heightmap.exr";

struct PipelineResult {
    std::string outputPath;
    std::string descriptorPath; // empty unless a descriptor was written
    RasterDimensions dimensions;
    TerrainMetadata metadata;
    std::size_t pointCount = 0;
};

/**
 * @brief Compiles one level record into a heightmap file.
 *
 * Plans dimensions, resamples, encodes, and writes the descriptor when the
 * settings ask for one. Errors propagate unchanged as ridgeline::Error
 * subclasses (std::invalid_argument for bad settings).
 */
PipelineResult runPipeline(const ProfileRecord& record, const GeneratorSettings& settings);

// Resolves the input source first, then runs the pipeline on its record.
PipelineResult runPipeline(const InputSource& source, const GeneratorSettings& settings);

// settings.outputPath, else "<level name>.exr", else kDefaultOutputPath.
std::string deriveOutputPath(const GeneratorSettings& settings, const std::string& levelName);

// Output path with its extension replaced by ".json".
std::string descriptorPathFor(const std::string& outputPath);

// Level name reduced to characters safe in a file name; empty if nothing is left.
std::string sanitizeFileStem(const std::string& name);

} // namespace ridgeline
