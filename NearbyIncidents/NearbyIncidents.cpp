// File: NearbyIncidents.cpp
// Command-line front end: recent incidents near a point in the configured region.

#include "Aggregator.hpp"
#include "ApiClient.hpp"
#include "ConfigLoader.hpp"
#include "Fetcher.hpp"
#include "IncidentCache.hpp"
#include "Logging.hpp"
#include "MonthMath.hpp"
#include "PlaceResolver.hpp"
#include "SummaryReport.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace IncidentFetching;

namespace {

    struct CliOptions {
        std::optional<PointLatLon> coordinate;
        int monthsBack = 6;
        std::optional<std::string> configPath;
        std::optional<std::string> savePrefix;
        bool parallel = false;
        bool debug = false;
    };

    void printUsage(const char* program) {
        std::cout << "Usage: " << program
            << " [lat lon] [--months N] [--config file.json] [--parallel] [--debug] [--save prefix]\n";
    }

    // Returns std::nullopt on bad arguments (usage already printed)
    std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
        CliOptions options;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--months" && i + 1 < argc) {
                try {
                    options.monthsBack = std::stoi(argv[++i]);
                }
                catch (const std::exception&) {
                    std::cerr << "Error: --months expects an integer.\n";
                    return std::nullopt;
                }
            }
            else if (arg == "--config" && i + 1 < argc) {
                options.configPath = argv[++i];
            }
            else if (arg == "--save" && i + 1 < argc) {
                options.savePrefix = argv[++i];
            }
            else if (arg == "--parallel") {
                options.parallel = true;
            }
            else if (arg == "--debug") {
                options.debug = true;
            }
            else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return std::nullopt;
            }
            else {
                positional.push_back(arg);
            }
        }

        if (positional.size() == 2) {
            try {
                options.coordinate = PointLatLon{ std::stod(positional[0]), std::stod(positional[1]) };
            }
            catch (const std::exception&) {
                std::cerr << "Error: latitude and longitude must be numbers.\n";
                return std::nullopt;
            }
        }
        else if (!positional.empty()) {
            printUsage(argv[0]);
            return std::nullopt;
        }
        return options;
    }

} // namespace

int main(int argc, char* argv[]) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        return EXIT_FAILURE;
    }

    // --- Configuration ---
    AppConfig config;
    if (options->configPath) {
        auto loaded = loadConfigFile(*options->configPath);
        if (!loaded) {
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    if (options->parallel) config.api.parallelTiles = true;
    if (options->debug) config.api.debugLogging = true;
    setDebugLogging(config.api.debugLogging);

    // --- Collaborators ---
    ApiClient source(config.api);
    IncidentCache cache;
    AggregatorOptions aggregator_options;
    aggregator_options.parallelTiles = config.api.parallelTiles;
    IncidentAggregator aggregator(source, cache, aggregator_options);

    NominatimGeocoder geocoder(config.api);
    PlaceResolver resolver(geocoder, config.region.fallbackPlaceName);

    NearbyIncidentPipeline pipeline(config.region, aggregator, resolver);

    logInfo("Fetching " + std::to_string(options->monthsBack) + " months across "
        + std::to_string(config.region.tiles.size()) + " tiles...");

    auto pending = fetchNearbyAsync(pipeline, options->coordinate, options->monthsBack, currentMonthAnchor());
    NearbyResult result = pending.get();

    printSummary(std::cout, result);

    if (options->savePrefix) {
        if (!saveSummaryJson(*options->savePrefix, result)) {
            return EXIT_FAILURE;
        }
    }
    return EXIT_SUCCESS;
}
