#pragma once

#include "image/exr_format.hpp"

#include <string>
#include <vector>

namespace ridgeline {

/**
 * @brief Writes a single-part scanline EXR holding one FLOAT channel "R".
 *
 * `red` holds width * height samples, row-major, top row first. Custom
 * attributes go into the header next to the standard ones; an empty name or
 * one that shadows a standard attribute is std::invalid_argument, as are
 * mismatched sizes. The file at path is replaced. OpenEXR failures are
 * reported as IoError.
 */
void writeExr(const std::string& path, int width, int height, const std::vector<float>& red,
              const AttributeList& attributes, ExrCompression compression = ExrCompression::Zip);

} // namespace ridgeline
