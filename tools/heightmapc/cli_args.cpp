#include "tools/heightmapc/cli_args.hpp"

#include <cmath>
#include <ostream>
#include <stdexcept>

namespace ridgeline {

void printUsage(std::ostream& out) {
    out << "Usage: heightmapc (--input <level.json> | --id <level id>) [--output <file.exr>]\n"
        << "                  [--ppm <pixels per meter>] [--height <pixels>]\n"
        << "                  [--config <config.json>] [--url-template <url with {id}>]\n"
        << "                  [--compression none|zips|zip] [--no-embed-metadata]\n"
        << "                  [--write-descriptor] [--help]\n"
        << "\n"
        << "Converts a level's terrain profile into a single-channel float EXR heightmap.\n"
        << "Defaults: --ppm 1.0, --height 1024, output <level name>.exr or heightmap.exr.\n";
}

bool parseArgs(int argc, const char* const* argv, CliOptions& options, std::string& error) {
    bool hasInput = false;
    bool hasId = false;
    std::string inputPath;
    long long id = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        try {
            if (arg == "-h" || arg == "--help") {
                options.showHelp = true;
            } else if (arg == "-i" || arg == "--input") {
                if (!next(inputPath)) return false;
                hasInput = true;
            } else if (arg == "-id" || arg == "--id" || arg == "--identifier") {
                std::string v;
                if (!next(v)) return false;
                std::size_t used = 0;
                id = std::stoll(v, &used);
                if (used != v.size()) {
                    error = "Level id must be an integer: " + v;
                    return false;
                }
                hasId = true;
            } else if (arg == "-o" || arg == "--output") {
                std::string v;
                if (!next(v)) return false;
                options.outputPath = v;
            } else if (arg == "-p" || arg == "--ppm") {
                std::string v;
                if (!next(v)) return false;
                double ppm = std::stod(v);
                if (!std::isfinite(ppm) || ppm <= 0.0) {
                    error = "Pixels per meter must be positive: " + v;
                    return false;
                }
                options.pixelsPerMeter = ppm;
            } else if (arg == "-t" || arg == "--height") {
                std::string v;
                if (!next(v)) return false;
                int height = std::stoi(v);
                if (height < 1) {
                    error = "Height must be at least 1: " + v;
                    return false;
                }
                options.height = height;
            } else if (arg == "-c" || arg == "--config") {
                if (!next(options.configPath)) return false;
            } else if (arg == "--url-template") {
                std::string v;
                if (!next(v)) return false;
                options.urlTemplate = v;
            } else if (arg == "--compression") {
                std::string v;
                if (!next(v)) return false;
                auto parsed = parseCompression(v);
                if (!parsed) {
                    error = "Unknown compression: " + v;
                    return false;
                }
                options.compression = *parsed;
            } else if (arg == "--no-embed-metadata") {
                options.noEmbedMetadata = true;
            } else if (arg == "--write-descriptor") {
                options.writeDescriptor = true;
            } else {
                error = "Unknown arg: " + arg;
                return false;
            }
        } catch (const std::logic_error&) {
            // std::stoi and friends report junk and overflow as invalid_argument / out_of_range
            error = "Invalid number for " + arg;
            return false;
        }
    }

    if (options.showHelp) {
        return true;
    }
    if (hasInput && hasId) {
        error = "--input and --id are mutually exclusive";
        return false;
    }
    if (!hasInput && !hasId) {
        error = "One of --input or --id is required";
        return false;
    }
    if (hasInput) {
        options.source = FileSource{inputPath};
    } else {
        options.source = IdentifierSource{id};
    }
    return true;
}

GeneratorSettings resolveSettings(const CliOptions& options) {
    GeneratorSettings settings;
    if (!options.configPath.empty()) {
        settings = loadGeneratorSettings(options.configPath);
    }
    if (options.outputPath) settings.outputPath = *options.outputPath;
    if (options.pixelsPerMeter) settings.pixelsPerMeter = *options.pixelsPerMeter;
    if (options.height) settings.height = *options.height;
    if (options.urlTemplate) settings.fetch.urlTemplate = *options.urlTemplate;
    if (options.compression) settings.compression = *options.compression;
    if (options.noEmbedMetadata) settings.embedMetadata = false;
    if (options.writeDescriptor) settings.writeDescriptor = true;
    settings.clamp();

    if (!std::isfinite(settings.pixelsPerMeter) || settings.pixelsPerMeter <= 0.0) {
        throw std::invalid_argument("pixelsPerMeter must be positive");
    }
    return settings;
}

} // namespace ridgeline
