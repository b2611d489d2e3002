#include "image/exr_writer.hpp"
#include "core/errors.hpp"

#include <IexBaseExc.h>
#include <ImfChannelList.h>
#include <ImfCompression.h>
#include <ImfFloatAttribute.h>
#include <ImfFrameBuffer.h>
#include <ImfHeader.h>
#include <ImfIntAttribute.h>
#include <ImfOutputFile.h>
#include <ImfStringAttribute.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace ridgeline {

namespace {
Imf::Compression toImfCompression(ExrCompression compression) {
    switch (compression) {
    case ExrCompression::None:
        return Imf::NO_COMPRESSION;
    case ExrCompression::Zips:
        return Imf::ZIPS_COMPRESSION;
    case ExrCompression::Zip:
        return Imf::ZIP_COMPRESSION;
    }
    return Imf::ZIP_COMPRESSION;
}

void insertAttribute(Imf::Header& header, const Attribute& attribute) {
    if (attribute.name.empty()) {
        throw std::invalid_argument("EXR attribute names must not be empty");
    }
    if (isStandardAttribute(attribute.name)) {
        throw std::invalid_argument("attribute '" + attribute.name + "' would replace a standard header field");
    }

    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
            header.insert(attribute.name, Imf::StringAttribute(value));
        } else if constexpr (std::is_same_v<T, float>) {
            header.insert(attribute.name, Imf::FloatAttribute(value));
        } else {
            header.insert(attribute.name, Imf::IntAttribute(value));
        }
    }, attribute.value);
}
} // namespace

void writeExr(const std::string& path, int width, int height, const std::vector<float>& red,
              const AttributeList& attributes, ExrCompression compression) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("EXR dimensions must be positive");
    }
    if (red.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height)) {
        throw std::invalid_argument("channel R does not hold width * height samples");
    }

    Imf::Header header(width, height);
    header.channels().insert("R", Imf::Channel(Imf::FLOAT));
    header.compression() = toImfCompression(compression);
    for (const auto& attribute : attributes) {
        insertAttribute(header, attribute);
    }

    // OpenEXR only reads through the slice pointer while writing.
    char* base = reinterpret_cast<char*>(const_cast<float*>(red.data()));
    Imf::FrameBuffer frameBuffer;
    frameBuffer.insert("R", Imf::Slice(Imf::FLOAT, base, sizeof(float),
                                       sizeof(float) * static_cast<std::size_t>(width)));

    try {
        Imf::OutputFile file(path.c_str(), header);
        file.setFrameBuffer(frameBuffer);
        file.writePixels(height);
    } catch (const Iex::BaseExc& e) {
        throw IoError(path, std::string("Failed to write raster (") + e.what() + ")");
    }
}

} // namespace ridgeline
