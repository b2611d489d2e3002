#include <iostream>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "pipeline/heightmap_pipeline.hpp"
#include "tools/heightmapc/cli_args.hpp"

int main(int argc, char** argv) {
    ridgeline::CliOptions options;
    std::string error;
    if (!ridgeline::parseArgs(argc, argv, options, error)) {
        std::cerr << "[heightmapc] " << error << "\n";
        ridgeline::printUsage(std::cerr);
        return 2;
    }
    if (options.showHelp) {
        ridgeline::printUsage(std::cout);
        return 0;
    }

    ridgeline::GeneratorSettings settings;
    try {
        settings = ridgeline::resolveSettings(options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[heightmapc] " << e.what() << "\n";
        return 2;
    }

    std::cout << "[heightmapc] Compiling heightmap from " << ridgeline::describeSource(*options.source) << "\n";
    try {
        ridgeline::PipelineResult result = ridgeline::runPipeline(*options.source, settings);
        std::cout << "[heightmapc] " << result.dimensions.width << "x" << result.dimensions.height
                  << " heightmap covering " << result.metadata.terrainWidth << " m\n";
    } catch (const ridgeline::FetchError& e) {
        std::cerr << "[heightmapc] Error fetching data: " << e.what() << "\n";
        return 1;
    } catch (const ridgeline::Error& e) {
        std::cerr << "[heightmapc] Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[heightmapc] " << e.what() << "\n";
        return 2;
    }
    return 0;
}
