#include "config/generator_settings.hpp"
#include "utils/json_file.hpp"

#include <algorithm>
#include <stdexcept>

namespace ridgeline {

void GeneratorSettings::resetDefaults() {
    pixelsPerMeter = kDefaultPixelsPerMeter;
    height = kDefaultRasterHeight;
    outputPath.clear();
    compression = ExrCompression::Zip;
    embedMetadata = true;
    writeDescriptor = false;
    fetch = FetchConfig{};
}

void GeneratorSettings::applyConfig(const nlohmann::json& config) {
    try {
        if (config.contains("heightmap") && config["heightmap"].is_object()) {
            const auto& heightmap = config["heightmap"];
            pixelsPerMeter = heightmap.value("pixelsPerMeter", pixelsPerMeter);
            height = heightmap.value("height", height);
            outputPath = heightmap.value("output", outputPath);
            embedMetadata = heightmap.value("embedMetadata", embedMetadata);
            writeDescriptor = heightmap.value("writeDescriptor", writeDescriptor);
            if (heightmap.contains("compression")) {
                std::string name = heightmap["compression"].get<std::string>();
                auto parsed = parseCompression(name);
                if (!parsed) {
                    throw std::invalid_argument("unknown compression '" + name + "'");
                }
                compression = *parsed;
            }
        }
        if (config.contains("levelServer") && config["levelServer"].is_object()) {
            const auto& server = config["levelServer"];
            fetch.urlTemplate = server.value("urlTemplate", fetch.urlTemplate);
            fetch.connectTimeoutSeconds = server.value("connectTimeoutSeconds", fetch.connectTimeoutSeconds);
            fetch.readTimeoutSeconds = server.value("readTimeoutSeconds", fetch.readTimeoutSeconds);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid configuration value: ") + e.what());
    }
}

void GeneratorSettings::clamp() {
    height = std::max(1, height);
    fetch.connectTimeoutSeconds = std::max(1, fetch.connectTimeoutSeconds);
    fetch.readTimeoutSeconds = std::max(1, fetch.readTimeoutSeconds);
}

GeneratorSettings loadGeneratorSettings(const std::string& path) {
    JsonFile config = loadJsonFile(path);
    if (!config) {
        throw std::invalid_argument("Unreadable config file " + path + ": " + config.message);
    }
    GeneratorSettings settings;
    settings.applyConfig(config.value);
    settings.clamp();
    return settings;
}

} // namespace ridgeline
