#pragma once

#include "image/exr_format.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ridgeline {

struct ExrImage {
    int width = 0;
    int height = 0;
    std::optional<ExrCompression> compression; // empty for codecs heightmapc does not write
    std::vector<float> red;      // row-major, top row first
    AttributeList attributes;    // custom string/float/int attributes only
};

/**
 * @brief Reads the "R" channel and custom attributes of an EXR file.
 *
 * Other channels are ignored. A missing or non-FLOAT "R" channel, and every
 * OpenEXR failure (missing file, truncated or foreign data), is IoError.
 */
ExrImage readExr(const std::string& path);

} // namespace ridgeline
