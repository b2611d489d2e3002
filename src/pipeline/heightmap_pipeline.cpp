#include "pipeline/heightmap_pipeline.hpp"
#include "heightfield/resampler.hpp"
#include "image/heightmap_encoder.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>

namespace ridgeline {

std::string sanitizeFileStem(const std::string& name) {
    std::string stem;
    stem.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_') {
            stem.push_back(c);
        } else if (std::isspace(uc) || c == '.') {
            stem.push_back('_');
        }
    }
    // Leading separators would produce hidden or odd-looking files.
    std::size_t first = stem.find_first_not_of("_-");
    if (first == std::string::npos) {
        return {};
    }
    std::size_t last = stem.find_last_not_of("_-");
    return stem.substr(first, last - first + 1);
}

std::string deriveOutputPath(const GeneratorSettings& settings, const std::string& levelName) {
    if (!settings.outputPath.empty()) {
        return settings.outputPath;
    }
    std::string stem = sanitizeFileStem(levelName);
    if (stem.empty()) {
        return kDefaultOutputPath;
    }
    return stem + ".exr";
}

std::string descriptorPathFor(const std::string& outputPath) {
    std::filesystem::path path(outputPath);
    path.replace_extension(".json");
    return path.string();
}

PipelineResult runPipeline(const ProfileRecord& record, const GeneratorSettings& settings) {
    const Profile& profile = record.profile;
    std::cout << "[Pipeline] Found " << profile.size() << " points in polyline" << std::endl;

    ProfileBounds bounds = computeBounds(profile);
    std::cout << "[Pipeline] Delta X: " << bounds.width() << ", Delta Y: " << bounds.height() << std::endl;

    PipelineResult result;
    result.pointCount = profile.size();
    result.dimensions = planDimensions(profile, settings.pixelsPerMeter, settings.height);
    result.metadata = planMetadata(profile, settings.pixelsPerMeter);
    std::cout << "[Pipeline] Using calculated dimensions: " << result.dimensions.width << "x"
              << result.dimensions.height << " (" << settings.pixelsPerMeter << " px/m)" << std::endl;

    HeightField field = resample(profile, result.dimensions.width, result.dimensions.height);

    result.outputPath = deriveOutputPath(settings, record.name);
    std::cout << "[Pipeline] Saving heightmap to '" << result.outputPath << "' ("
              << compressionName(settings.compression) << ")..." << std::endl;
    std::optional<TerrainMetadata> embedded;
    if (settings.embedMetadata) {
        embedded = result.metadata;
    }
    encodeHeightmap(field, embedded, result.outputPath, settings.compression);

    if (settings.writeDescriptor) {
        result.descriptorPath = descriptorPathFor(result.outputPath);
        writeDescriptor(result.descriptorPath, result.metadata);
        std::cout << "[Pipeline] Wrote descriptor '" << result.descriptorPath << "'" << std::endl;
    }

    std::cout << "[Pipeline] Done! Heightmap saved to '" << result.outputPath << "'" << std::endl;
    return result;
}

PipelineResult runPipeline(const InputSource& source, const GeneratorSettings& settings) {
    ProfileRecord record = loadProfileRecord(source, settings.fetch);
    return runPipeline(record, settings);
}

} // namespace ridgeline
