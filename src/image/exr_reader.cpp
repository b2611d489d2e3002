#include "image/exr_reader.hpp"
#include "core/errors.hpp"

#include <IexBaseExc.h>
#include <ImathBox.h>
#include <ImfChannelList.h>
#include <ImfCompression.h>
#include <ImfFloatAttribute.h>
#include <ImfFrameBuffer.h>
#include <ImfHeader.h>
#include <ImfInputFile.h>
#include <ImfIntAttribute.h>
#include <ImfStringAttribute.h>

#include <cstddef>

namespace ridgeline {

namespace {
std::optional<ExrCompression> fromImfCompression(Imf::Compression compression) {
    switch (compression) {
    case Imf::NO_COMPRESSION:
        return ExrCompression::None;
    case Imf::ZIPS_COMPRESSION:
        return ExrCompression::Zips;
    case Imf::ZIP_COMPRESSION:
        return ExrCompression::Zip;
    default:
        return std::nullopt;
    }
}

AttributeList customAttributes(const Imf::Header& header) {
    AttributeList attributes;
    for (Imf::Header::ConstIterator it = header.begin(); it != header.end(); ++it) {
        if (isStandardAttribute(it.name())) {
            continue;
        }
        const Imf::Attribute& attribute = it.attribute();
        if (const auto* s = dynamic_cast<const Imf::StringAttribute*>(&attribute)) {
            attributes.push_back({it.name(), s->value()});
        } else if (const auto* f = dynamic_cast<const Imf::FloatAttribute*>(&attribute)) {
            attributes.push_back({it.name(), f->value()});
        } else if (const auto* i = dynamic_cast<const Imf::IntAttribute*>(&attribute)) {
            attributes.push_back({it.name(), i->value()});
        }
    }
    return attributes;
}
} // namespace

ExrImage readExr(const std::string& path) {
    try {
        Imf::InputFile file(path.c_str());
        const Imf::Header& header = file.header();

        const Imf::Channel* channel = header.channels().findChannel("R");
        if (channel == nullptr) {
            throw IoError(path, "Raster has no R channel");
        }
        if (channel->type != Imf::FLOAT) {
            throw IoError(path, "Raster channel R is not FLOAT");
        }

        const Imath::Box2i dataWindow = header.dataWindow();
        ExrImage image;
        image.width = dataWindow.max.x - dataWindow.min.x + 1;
        image.height = dataWindow.max.y - dataWindow.min.y + 1;
        image.compression = fromImfCompression(header.compression());
        image.attributes = customAttributes(header);
        image.red.resize(static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height));

        // The slice origin is pixel (0, 0), which may lie outside the data window.
        const std::ptrdiff_t origin = static_cast<std::ptrdiff_t>(dataWindow.min.x) +
                                      static_cast<std::ptrdiff_t>(dataWindow.min.y) * image.width;
        Imf::FrameBuffer frameBuffer;
        frameBuffer.insert("R", Imf::Slice(Imf::FLOAT, reinterpret_cast<char*>(image.red.data() - origin),
                                           sizeof(float),
                                           sizeof(float) * static_cast<std::size_t>(image.width)));
        file.setFrameBuffer(frameBuffer);
        file.readPixels(dataWindow.min.y, dataWindow.max.y);
        return image;
    } catch (const Iex::BaseExc& e) {
        throw IoError(path, std::string("Failed to read raster (") + e.what() + ")");
    }
}

} // namespace ridgeline
