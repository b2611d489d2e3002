#include "metadata/terrain_metadata.hpp"
#include "core/errors.hpp"

#include <fstream>

namespace ridgeline {

const char* metadataKeyName(MetadataKey key) {
    switch (key) {
    case MetadataKey::TerrainWidth:
        return "ddgTerrainWidth";
    case MetadataKey::TerrainHeight:
        return "ddgTerrainHeight";
    case MetadataKey::PixelsPerMeter:
        return "ddgPixelsPerMeter";
    }
    return "";
}

std::optional<MetadataKey> parseMetadataKey(const std::string& name) {
    for (MetadataKey key : kMetadataKeys) {
        if (name == metadataKeyName(key)) {
            return key;
        }
    }
    return std::nullopt;
}

double metadataValue(const TerrainMetadata& metadata, MetadataKey key) {
    switch (key) {
    case MetadataKey::TerrainWidth:
        return metadata.terrainWidth;
    case MetadataKey::TerrainHeight:
        return metadata.terrainHeight;
    case MetadataKey::PixelsPerMeter:
        return metadata.pixelsPerMeter;
    }
    return 0.0;
}

AttributeList toAttributes(const TerrainMetadata& metadata) {
    AttributeList attributes;
    for (MetadataKey key : kMetadataKeys) {
        attributes.push_back({metadataKeyName(key), static_cast<float>(metadataValue(metadata, key))});
    }
    return attributes;
}

std::optional<TerrainMetadata> metadataFromAttributes(const AttributeList& attributes) {
    TerrainMetadata metadata;
    int found = 0;
    for (const auto& attribute : attributes) {
        auto key = parseMetadataKey(attribute.name);
        if (!key) continue;

        double value = 0.0;
        if (const float* f = std::get_if<float>(&attribute.value)) {
            value = *f;
        } else if (const int* i = std::get_if<int>(&attribute.value)) {
            value = *i;
        } else {
            continue;
        }

        switch (*key) {
        case MetadataKey::TerrainWidth:
            metadata.terrainWidth = value;
            break;
        case MetadataKey::TerrainHeight:
            metadata.terrainHeight = value;
            break;
        case MetadataKey::PixelsPerMeter:
            metadata.pixelsPerMeter = value;
            break;
        }
        ++found;
    }
    if (found < static_cast<int>(kMetadataKeys.size())) {
        return std::nullopt;
    }
    return metadata;
}

nlohmann::json toDescriptorJson(const TerrainMetadata& metadata) {
    nlohmann::json descriptor = nlohmann::json::object();
    for (MetadataKey key : kMetadataKeys) {
        descriptor[metadataKeyName(key)] = metadataValue(metadata, key);
    }
    return descriptor;
}

void writeDescriptor(const std::string& path, const TerrainMetadata& metadata) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw IoError(path, "Failed to open descriptor for writing");
    }
    out << toDescriptorJson(metadata).dump(2) << "\n";
    if (!out) {
        throw IoError(path, "Failed to write descriptor");
    }
}

} // namespace ridgeline
