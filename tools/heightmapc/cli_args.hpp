#pragma once

#include "config/generator_settings.hpp"
#include "image/exr_format.hpp"
#include "profile/profile_source.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace ridgeline {

// Command line as typed; unset options leave the config file's value alone.
struct CliOptions {
    std::optional<InputSource> source;
    std::string configPath;
    std::optional<std::string> outputPath;
    std::optional<double> pixelsPerMeter;
    std::optional<int> height;
    std::optional<std::string> urlTemplate;
    std::optional<ExrCompression> compression;
    bool noEmbedMetadata = false;
    bool writeDescriptor = false;
    bool showHelp = false;
};

void printUsage(std::ostream& out);

/**
 * @brief Parses heightmapc arguments.
 *
 * Exactly one of --input and --id is required unless --help is given.
 * Returns false with a message in error for unknown flags, missing or
 * malformed values, and conflicting inputs.
 */
bool parseArgs(int argc, const char* const* argv, CliOptions& options, std::string& error);

// Defaults, then --config, then the flags. Throws std::invalid_argument.
GeneratorSettings resolveSettings(const CliOptions& options);

} // namespace ridgeline
