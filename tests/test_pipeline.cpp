// tests/test_pipeline.cpp
// End-to-end nearby fetch with a scripted source and geocoder.

#include <iostream>
#include <string>

#include "Aggregator.hpp"
#include "Fetcher.hpp"
#include "IncidentCache.hpp"
#include "TestFakes.hpp"

using namespace IncidentFetching;
using namespace testfakes;

int main() {
    const MonthAnchor anchor{ 2025, 6 };
    RegionConfig region;
    region.tiles = { makeTile("A", 53.55, -2.35), makeTile("B", 53.48, -2.24) };

    auto script = [](const SpatialSelector& selector, const std::string& month) -> FetchOutcome {
        if (selector.tile->name == "A") return notFound();
        return IncidentList{
            makeIncident("v-" + month, "violent-crime", month),
            makeIncident("s-" + month, "shoplifting", month),
            makeIncident("x-" + month, "not-a-real-category", month)
        };
    };

    // --- Healthy run, coordinate outside the region ---
    {
        FakeIncidentSource source(script);
        IncidentCache cache;
        IncidentAggregator aggregator(source, cache);
        Placemark placemark;
        placemark.locality = "Manchester City Centre";
        FakeGeocoder geocoder(FakeGeocoder::Mode::Answer, placemark);
        PlaceResolver resolver(geocoder, region.fallbackPlaceName);
        NearbyIncidentPipeline pipeline(region, aggregator, resolver);

        NearbyResult result = pipeline.fetchNearby(PointLatLon{ 51.5074, -0.1278 }, 2, anchor);
        if (result.resolvedCoordinate != region.fallbackCenter || !geocoder.lastPoint ||
            *geocoder.lastPoint != region.fallbackCenter) {
            std::cerr << "outside coordinate should be clamped before use\n";
            return 1;
        }
        if (result.totals.total != 6 || result.totals.serious != 2 || result.aggregation.monthsUsed.size() != 2) {
            std::cerr << "totals mismatch: " << result.totals.total << "/" << result.totals.serious << "\n";
            return 2;
        }
        if (result.byCategory.size() != 3 || result.byCategory[0].category != "Violence" ||
            result.byCategory[2].category != "Not A Real Category") {
            std::cerr << "category breakdown mismatch\n";
            return 3;
        }
        if (result.placeName != "Manchester City Centre" || result.headlineMonth != "2025-06" ||
            result.windowFailed || result.viewRadiusMeters != region.defaultRadiusMeters ||
            result.distanceFromCentreMeters != 0.0) {
            std::cerr << "result metadata mismatch\n";
            return 4;
        }
    }

    // --- Inside coordinate kept; async entry point ---
    {
        FakeIncidentSource source(script);
        IncidentCache cache;
        IncidentAggregator aggregator(source, cache);
        FakeGeocoder geocoder(FakeGeocoder::Mode::NoResult);
        PlaceResolver resolver(geocoder, region.fallbackPlaceName);
        NearbyIncidentPipeline pipeline(region, aggregator, resolver);

        PointLatLon inside{ 53.45, -2.30 };
        NearbyResult result = fetchNearbyAsync(pipeline, inside, 1, anchor).get();
        if (result.resolvedCoordinate != inside || result.totals.total != 3 || result.placeName != "Manchester" ||
            result.distanceFromCentreMeters <= 0.0) {
            std::cerr << "async inside run mismatch\n";
            return 5;
        }
    }

    // --- Window-level fault becomes an empty but valid result ---
    {
        FakeIncidentSource source(script);
        IncidentCache cache;
        IncidentAggregator aggregator(source, cache);
        FakeGeocoder geocoder(FakeGeocoder::Mode::Throw);
        PlaceResolver resolver(geocoder, "Manchester");

        RegionConfig no_tiles = region;
        no_tiles.tiles.clear();
        NearbyIncidentPipeline pipeline(no_tiles, aggregator, resolver);

        NearbyResult result = pipeline.fetchNearby(std::nullopt, 3, anchor);
        if (!result.windowFailed || result.totals.total != 0 || result.totals.serious != 0 ||
            !result.byCategory.empty() || !result.aggregation.monthsUsed.empty()) {
            std::cerr << "window fault should produce empty data\n";
            return 6;
        }
        if (result.placeName != "Manchester" || result.headlineMonth != "2025-06" ||
            result.resolvedCoordinate != no_tiles.fallbackCenter || source.callCount() != 0) {
            std::cerr << "window fault result metadata mismatch\n";
            return 7;
        }
    }

    // --- Every tile failing: zero totals, attempted months still reported ---
    {
        FakeIncidentSource source([](const SpatialSelector&, const std::string&) -> FetchOutcome {
            return httpError(500);
        });
        IncidentCache cache;
        IncidentAggregator aggregator(source, cache);
        FakeGeocoder geocoder(FakeGeocoder::Mode::Throw);
        PlaceResolver resolver(geocoder, "Manchester");
        NearbyIncidentPipeline pipeline(region, aggregator, resolver);

        NearbyResult result = pipeline.fetchNearby(std::nullopt, 3, anchor);
        if (result.windowFailed || result.totals.total != 0 || !result.byCategory.empty() ||
            result.aggregation.monthsUsed.size() != 3 || result.placeName != "Manchester") {
            std::cerr << "all-failing run mismatch\n";
            return 8;
        }
    }

    // --- Non-std faults from source and geocoder never reach the caller ---
    {
        FakeIncidentSource source([](const SpatialSelector& selector, const std::string& month) -> FetchOutcome {
            if (selector.tile->name == "A") throw ForeignFault{};
            return IncidentList{ makeIncident("b-" + month, "robbery", month) };
        });
        IncidentCache cache;
        IncidentAggregator aggregator(source, cache);
        FakeGeocoder geocoder(FakeGeocoder::Mode::ThrowForeign);
        PlaceResolver resolver(geocoder, "Manchester");
        NearbyIncidentPipeline pipeline(region, aggregator, resolver);

        NearbyResult result;
        try {
            result = fetchNearbyAsync(pipeline, std::nullopt, 2, anchor).get();
        }
        catch (...) {
            std::cerr << "non-std fault reached the caller\n";
            return 9;
        }
        if (result.windowFailed || result.totals.total != 2 || result.totals.serious != 2 ||
            result.placeName != "Manchester" || result.headlineMonth != "2025-06") {
            std::cerr << "non-std fault run mismatch\n";
            return 10;
        }
    }

    std::cout << "test_pipeline: OK\n";
    return 0;
}
