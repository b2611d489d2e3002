#pragma once

#include "image/exr_format.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>

namespace ridgeline {

/**
 * @brief Physical scale of a compiled heightmap.
 *
 * Engines use it to stretch the normalized raster back to world units.
 */
struct TerrainMetadata {
    double terrainWidth = 0.0;   // meters covered by the raster's columns
    double terrainHeight = 0.0;  // elevation range of the profile, meters
    double pixelsPerMeter = 0.0;
};

enum class MetadataKey {
    TerrainWidth,
    TerrainHeight,
    PixelsPerMeter,
};

constexpr std::array<MetadataKey, 3> kMetadataKeys = {
    MetadataKey::TerrainWidth, MetadataKey::TerrainHeight, MetadataKey::PixelsPerMeter};

// Namespaced attribute name, e.g. "ddgTerrainWidth".
const char* metadataKeyName(MetadataKey key);
std::optional<MetadataKey> parseMetadataKey(const std::string& name);

double metadataValue(const TerrainMetadata& metadata, MetadataKey key);

// One float attribute per key, in kMetadataKeys order. Values are narrowed
// to 32-bit float, about 7 significant digits.
AttributeList toAttributes(const TerrainMetadata& metadata);

/**
 * @brief Recovers metadata from raster attributes.
 *
 * Unknown names are ignored; int values are accepted for float keys,
 * string values are not. Returns std::nullopt unless every key is present.
 */
std::optional<TerrainMetadata> metadataFromAttributes(const AttributeList& attributes);

nlohmann::json toDescriptorJson(const TerrainMetadata& metadata);

// Writes the companion descriptor next to a raster. Throws IoError.
void writeDescriptor(const std::string& path, const TerrainMetadata& metadata);

} // namespace ridgeline
