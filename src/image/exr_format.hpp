#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ridgeline {

// Scanline compressions heightmapc can be asked to write.
enum class ExrCompression : std::uint8_t {
    None,
    Zips, // zlib, one scanline per block
    Zip,  // zlib, sixteen scanlines per block
};

const char* compressionName(ExrCompression compression);
std::optional<ExrCompression> parseCompression(const std::string& name);

/**
 * @brief Value of a custom header attribute.
 *
 * Only the EXR "string", "float" and "int" attribute types are carried;
 * anything else in a file is skipped on read. Floats are 32-bit, as the
 * file stores them.
 */
using AttributeValue = std::variant<std::string, float, int>;

struct Attribute {
    std::string name;
    AttributeValue value;
};

using AttributeList = std::vector<Attribute>;

const Attribute* findAttribute(const AttributeList& attributes, const std::string& name);

// True for the attribute names every scanline file header defines itself.
bool isStandardAttribute(const std::string& name);

} // namespace ridgeline
