// tests/test_exr.cpp
//
// Writing height fields as scanline EXR files and reading them back.

#include <doctest/doctest.h>

#include "core/errors.hpp"
#include "heightfield/resampler.hpp"
#include "image/exr_reader.hpp"
#include "image/exr_writer.hpp"
#include "image/heightmap_encoder.hpp"
#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace ridgeline;

namespace {
HeightField makeRamp(int width, int height) {
    std::vector<float> values;
    const int count = width * height;
    for (int i = 0; i < count; ++i) {
        values.push_back(static_cast<float>(i) / static_cast<float>(count - 1));
    }
    return HeightField(width, height, values, linspace(0.0, 1.0, width), linspace(0.0, 1.0, height));
}

std::vector<float> wavyRows(int width, int height) {
    std::vector<float> values;
    for (int r = 0; r < height; ++r) {
        for (int c = 0; c < width; ++c) {
            values.push_back(0.5f + 0.5f * std::sin(0.05f * static_cast<float>(c)) +
                             0.001f * static_cast<float>(r));
        }
    }
    return values;
}
} // namespace

TEST_CASE("a 4x4 ramp survives encode and decode with its scale attribute") {
    test::TempDir dir("exr_ramp");
    const std::string path = dir.file("ramp.exr");
    HeightField ramp = makeRamp(4, 4);

    TerrainMetadata meta;
    meta.terrainWidth = 128.0;
    meta.terrainHeight = 17.5;
    meta.pixelsPerMeter = 2.5;
    encodeHeightmap(ramp, meta, path);

    ExrImage image = readExr(path);
    CHECK(image.width == 4);
    CHECK(image.height == 4);
    CHECK(image.compression == ExrCompression::Zip);
    REQUIRE(image.red.size() == 16);
    for (std::size_t i = 0; i < image.red.size(); ++i) {
        CHECK(image.red[i] == doctest::Approx(ramp.values()[i]).epsilon(1e-7));
    }
    CHECK(image.red.front() == 0.0f);
    CHECK(image.red.back() == 1.0f);

    const Attribute* ppm = findAttribute(image.attributes, "ddgPixelsPerMeter");
    REQUIRE(ppm != nullptr);
    REQUIRE(std::holds_alternative<float>(ppm->value));
    CHECK(std::get<float>(ppm->value) == doctest::Approx(2.5));
}

TEST_CASE("encodeHeightmap without metadata writes no custom attributes") {
    test::TempDir dir("exr_plain");
    const std::string path = dir.file("plain.exr");
    encodeHeightmap(makeRamp(3, 2), std::nullopt, path);

    ExrImage image = readExr(path);
    CHECK(image.attributes.empty());
    CHECK(image.width == 3);
    CHECK(image.height == 2);
}

TEST_CASE("every supported compression decodes to the same samples") {
    test::TempDir dir("exr_compressions");
    const int width = 300;
    const int height = 37; // not a multiple of the 16-line ZIP block
    std::vector<float> values = wavyRows(width, height);

    for (ExrCompression compression : {ExrCompression::None, ExrCompression::Zips, ExrCompression::Zip}) {
        CAPTURE(compressionName(compression));
        const std::string path = dir.file(std::string(compressionName(compression)) + ".exr");
        writeExr(path, width, height, values, {}, compression);
        ExrImage image = readExr(path);
        CHECK(image.compression == compression);
        CHECK(image.width == width);
        CHECK(image.height == height);
        CHECK(image.red == values);
    }
}

TEST_CASE("ZIP compression shrinks broadcast rows") {
    test::TempDir dir("exr_zip_size");
    const int width = 512;
    const int height = 64;
    std::vector<float> row(static_cast<std::size_t>(width));
    for (int c = 0; c < width; ++c) {
        row[static_cast<std::size_t>(c)] = static_cast<float>(c) / static_cast<float>(width - 1);
    }
    std::vector<float> values;
    for (int r = 0; r < height; ++r) {
        values.insert(values.end(), row.begin(), row.end());
    }

    const std::string zip = dir.file("zip.exr");
    const std::string none = dir.file("none.exr");
    writeExr(zip, width, height, values, {}, ExrCompression::Zip);
    writeExr(none, width, height, values, {}, ExrCompression::None);
    CHECK(std::filesystem::file_size(zip) < std::filesystem::file_size(none) / 4);
    CHECK(readExr(zip).red == values);
}

TEST_CASE("writeExr produces a file with the OpenEXR magic number") {
    test::TempDir dir("exr_magic");
    const std::string path = dir.file("one.exr");
    writeExr(path, 1, 1, {0.25f}, {}, ExrCompression::None);

    std::ifstream in(path, std::ios::binary);
    unsigned char magic[4] = {};
    in.read(reinterpret_cast<char*>(magic), 4);
    REQUIRE(in.gcount() == 4);
    CHECK(magic[0] == 0x76);
    CHECK(magic[1] == 0x2f);
    CHECK(magic[2] == 0x31);
    CHECK(magic[3] == 0x01);
}

TEST_CASE("custom attributes carry string, float and int values") {
    test::TempDir dir("exr_attributes");
    const std::string path = dir.file("attributes.exr");
    AttributeList attributes = {
        {"ddgLevelName", std::string("Cliffside")},
        {"ddgTerrainWidth", 640.0f},
        {"ddgRevision", 7},
    };
    writeExr(path, 2, 2, {0.0f, 0.5f, 0.5f, 1.0f}, attributes);
    ExrImage image = readExr(path);

    REQUIRE(image.attributes.size() == 3);
    CHECK(std::get<std::string>(findAttribute(image.attributes, "ddgLevelName")->value) == "Cliffside");
    CHECK(std::get<float>(findAttribute(image.attributes, "ddgTerrainWidth")->value) == 640.0f);
    CHECK(std::get<int>(findAttribute(image.attributes, "ddgRevision")->value) == 7);
    CHECK(findAttribute(image.attributes, "channels") == nullptr);
}

TEST_CASE("writeExr rejects attributes and sizes that would corrupt the file") {
    test::TempDir dir("exr_invalid");
    const std::string path = dir.file("invalid.exr");
    std::vector<float> one = {1.0f};
    CHECK_THROWS_AS(writeExr(path, 1, 1, one, {{"compression", 1}}), std::invalid_argument);
    CHECK_THROWS_AS(writeExr(path, 1, 1, one, {{"", 1}}), std::invalid_argument);
    CHECK_THROWS_AS(writeExr(path, 2, 2, one, {}), std::invalid_argument);
    CHECK_THROWS_AS(writeExr(path, 0, 1, {}, {}), std::invalid_argument);
    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("readExr rejects truncated and foreign files") {
    test::TempDir dir("exr_corrupt");
    const std::string path = dir.file("full.exr");
    writeExr(path, 8, 8, std::vector<float>(64, 0.5f), {});

    std::ifstream in(path, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(bytes.size() > 16);
    CHECK_THROWS_AS(readExr(dir.write("truncated.exr", bytes.substr(0, bytes.size() / 2))), IoError);

    const std::string png("\x89PNG\r\n\x1a\n", 8);
    CHECK_THROWS_AS(readExr(dir.write("image.exr", png)), IoError);
}

TEST_CASE("readExr reports problems as IoError with the path") {
    test::TempDir dir("exr_errors");

    const std::string missing = dir.file("missing.exr");
    try {
        readExr(missing);
        FAIL("expected IoError");
    } catch (const IoError& e) {
        CHECK(e.path() == missing);
    }

    const std::string garbage = dir.write("garbage.exr", "definitely not an image");
    CHECK_THROWS_AS(readExr(garbage), IoError);
}

TEST_CASE("writing into a missing directory fails with IoError") {
    test::TempDir dir("exr_unwritable");
    const std::string path = dir.file("no/such/dir/out.exr");
    CHECK_THROWS_AS(encodeHeightmap(makeRamp(2, 2), std::nullopt, path), IoError);
}
