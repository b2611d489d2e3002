// tests/test_metadata.cpp

#include <doctest/doctest.h>

#include "core/errors.hpp"
#include "image/exr_reader.hpp"
#include "image/heightmap_encoder.hpp"
#include "metadata/terrain_metadata.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

using namespace ridgeline;

TEST_CASE("metadata keys carry the ddg namespace") {
    CHECK(std::string(metadataKeyName(MetadataKey::TerrainWidth)) == "ddgTerrainWidth");
    CHECK(std::string(metadataKeyName(MetadataKey::TerrainHeight)) == "ddgTerrainHeight");
    CHECK(std::string(metadataKeyName(MetadataKey::PixelsPerMeter)) == "ddgPixelsPerMeter");

    CHECK(parseMetadataKey("ddgPixelsPerMeter") == MetadataKey::PixelsPerMeter);
    CHECK_FALSE(parseMetadataKey("PixelsPerMeter").has_value());
    CHECK_FALSE(parseMetadataKey("ddgSomethingElse").has_value());
}

TEST_CASE("toAttributes emits one float per key") {
    TerrainMetadata meta{250.0, 31.5, 4.0};
    AttributeList attributes = toAttributes(meta);

    REQUIRE(attributes.size() == 3);
    CHECK(attributes[0].name == "ddgTerrainWidth");
    CHECK(std::get<float>(attributes[0].value) == 250.0f);
    CHECK(std::get<float>(attributes[1].value) == 31.5f);
    CHECK(std::get<float>(attributes[2].value) == 4.0f);
}

TEST_CASE("embedded metadata reads back at single precision") {
    test::TempDir dir("metadata_precision");
    const std::string path = dir.file("precision.exr");
    TerrainMetadata meta{12345.678, 0.3, 0.1};
    HeightField field(2, 1, {0.0f, 1.0f}, {0.0, 12345.678}, {0.0});
    encodeHeightmap(field, meta, path);

    auto restored = metadataFromAttributes(readExr(path).attributes);
    REQUIRE(restored.has_value());
    CHECK(restored->terrainWidth == doctest::Approx(12345.678).epsilon(1e-7));
    CHECK(restored->terrainHeight == doctest::Approx(0.3).epsilon(1e-7));
    CHECK(restored->pixelsPerMeter == doctest::Approx(0.1).epsilon(1e-7));
    // Stored as 32-bit floats, so the doubles do not survive bit for bit.
    CHECK(restored->pixelsPerMeter == static_cast<double>(0.1f));
    CHECK(restored->pixelsPerMeter != 0.1);
    CHECK(restored->terrainWidth == static_cast<double>(12345.678f));
}

TEST_CASE("metadataFromAttributes ignores foreign and mistyped entries") {
    AttributeList attributes = {
        {"ddgTerrainWidth", 10.0f},
        {"ddgTerrainHeight", 3},
        {"ddgPixelsPerMeter", 0.5f},
        {"owner", std::string("someone")},
    };
    auto meta = metadataFromAttributes(attributes);
    REQUIRE(meta.has_value());
    CHECK(meta->terrainWidth == 10.0);
    CHECK(meta->terrainHeight == 3.0);
    CHECK(meta->pixelsPerMeter == 0.5);

    AttributeList stringValued = {
        {"ddgTerrainWidth", 10.0f},
        {"ddgTerrainHeight", std::string("3")},
        {"ddgPixelsPerMeter", 0.5f},
    };
    CHECK_FALSE(metadataFromAttributes(stringValued).has_value());
    CHECK_FALSE(metadataFromAttributes({}).has_value());
}

TEST_CASE("writeDescriptor mirrors the metadata keys as JSON") {
    test::TempDir dir("descriptor");
    const std::string path = dir.file("level.json");
    writeDescriptor(path, TerrainMetadata{812.25, 96.0, 1.0});

    std::ifstream in(path);
    REQUIRE(in.is_open());
    nlohmann::json descriptor;
    in >> descriptor;

    CHECK(descriptor.size() == 3);
    CHECK(descriptor["ddgTerrainWidth"].get<double>() == 812.25);
    CHECK(descriptor["ddgTerrainHeight"].get<double>() == 96.0);
    CHECK(descriptor["ddgPixelsPerMeter"].get<double>() == 1.0);
}

TEST_CASE("writeDescriptor reports unwritable paths") {
    test::TempDir dir("descriptor_fail");
    CHECK_THROWS_AS(writeDescriptor(dir.file("missing/level.json"), TerrainMetadata{}), IoError);
}
