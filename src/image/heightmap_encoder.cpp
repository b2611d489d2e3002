#include "image/heightmap_encoder.hpp"
#include "image/exr_writer.hpp"

namespace ridgeline {

void encodeHeightmap(const HeightField& field, const std::optional<TerrainMetadata>& metadata,
                     const std::string& path, ExrCompression compression) {
    AttributeList attributes;
    if (metadata) {
        attributes = toAttributes(*metadata);
    }
    writeExr(path, field.width(), field.height(), field.values(), attributes, compression);
}

} // namespace ridgeline
