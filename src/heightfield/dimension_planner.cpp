#include "heightfield/dimension_planner.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace ridgeline {

namespace {
void validatePixelsPerMeter(double pixelsPerMeter) {
    if (!std::isfinite(pixelsPerMeter) || pixelsPerMeter <= 0.0) {
        throw std::invalid_argument("pixels per meter must be a positive number");
    }
}
} // namespace

RasterDimensions planDimensions(const Profile& profile, double pixelsPerMeter, int height) {
    validatePixelsPerMeter(pixelsPerMeter);
    if (height < 1) {
        throw std::invalid_argument("raster height must be at least 1");
    }

    ProfileBounds bounds = computeBounds(profile);
    double columns = std::floor(bounds.width() * pixelsPerMeter);
    if (columns * static_cast<double>(height) > static_cast<double>(kMaxHeightFieldSamples)) {
        throw OversizedRasterError(std::to_string(bounds.width()) + " m at " + std::to_string(pixelsPerMeter) +
                                   " px/m and " + std::to_string(height) + " rows exceeds " +
                                   std::to_string(kMaxHeightFieldSamples) + " samples");
    }

    RasterDimensions dims;
    dims.width = static_cast<int>(columns);
    dims.height = height;
    return dims;
}

TerrainMetadata planMetadata(const Profile& profile, double pixelsPerMeter) {
    validatePixelsPerMeter(pixelsPerMeter);
    ProfileBounds bounds = computeBounds(profile);
    TerrainMetadata meta;
    meta.terrainWidth = bounds.width();
    meta.terrainHeight = bounds.height();
    meta.pixelsPerMeter = pixelsPerMeter;
    return meta;
}

} // namespace ridgeline
