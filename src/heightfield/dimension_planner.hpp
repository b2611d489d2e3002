#pragma once

#include "heightfield/height_field.hpp"
#include "metadata/terrain_metadata.hpp"
#include "profile/profile.hpp"

namespace ridgeline {

constexpr int kDefaultRasterHeight = 1024;
constexpr double kDefaultPixelsPerMeter = 1.0;

struct RasterDimensions {
    int width = 0;
    int height = 0;
};

/**
 * @brief Derives raster width from the profile's horizontal extent.
 *
 * width = floor((max x - min x) * pixelsPerMeter); height passes through.
 * A profile without horizontal extent plans a width of 0, which the
 * resampler rejects. Throws std::invalid_argument for a non-positive or
 * non-finite pixelsPerMeter, or a height below 1, and OversizedRasterError
 * when width * height exceeds kMaxHeightFieldSamples.
 */
RasterDimensions planDimensions(const Profile& profile,
                                double pixelsPerMeter = kDefaultPixelsPerMeter,
                                int height = kDefaultRasterHeight);

// Physical scale of the terrain for the raster header and descriptor.
TerrainMetadata planMetadata(const Profile& profile, double pixelsPerMeter);

} // namespace ridgeline
