#include "image/exr_format.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace ridgeline {

const char* compressionName(ExrCompression compression) {
    switch (compression) {
    case ExrCompression::None:
        return "none";
    case ExrCompression::Zips:
        return "zips";
    case ExrCompression::Zip:
        return "zip";
    }
    return "unknown";
}

std::optional<ExrCompression> parseCompression(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "none") return ExrCompression::None;
    if (lower == "zips") return ExrCompression::Zips;
    if (lower == "zip") return ExrCompression::Zip;
    return std::nullopt;
}

const Attribute* findAttribute(const AttributeList& attributes, const std::string& name) {
    for (const auto& attribute : attributes) {
        if (attribute.name == name) {
            return &attribute;
        }
    }
    return nullptr;
}

bool isStandardAttribute(const std::string& name) {
    static const std::array<const char*, 8> kStandard = {
        "channels", "compression", "dataWindow", "displayWindow",
        "lineOrder", "pixelAspectRatio", "screenWindowCenter", "screenWindowWidth"};
    return std::find(kStandard.begin(), kStandard.end(), name) != kStandard.end();
}

} // namespace ridgeline
