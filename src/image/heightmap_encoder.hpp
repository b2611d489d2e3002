#pragma once

#include "heightfield/height_field.hpp"
#include "image/exr_format.hpp"
#include "metadata/terrain_metadata.hpp"

#include <optional>
#include <string>

namespace ridgeline {

/**
 * @brief Writes a height field as a single-channel float EXR.
 *
 * The grayscale value goes to channel "R" so engines sampling RGB read it
 * from red. When metadata is given, its keys are embedded as float header
 * attributes. The file at path is replaced. Throws IoError.
 */
void encodeHeightmap(const HeightField& field, const std::optional<TerrainMetadata>& metadata,
                     const std::string& path, ExrCompression compression = ExrCompression::Zip);

} // namespace ridgeline
