// File: Fetcher.cpp

#include "Fetcher.hpp"

#include "Categorizer.hpp"
#include "Geofence.hpp"
#include "GeoMath.hpp"
#include "Logging.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace IncidentFetching {

    NearbyIncidentPipeline::NearbyIncidentPipeline(RegionConfig region, IncidentAggregator& aggregator,
                                                   const PlaceResolver& resolver)
        : region_(std::move(region)), aggregator_(aggregator), resolver_(resolver) {
    }

    NearbyResult NearbyIncidentPipeline::fetchNearby(const std::optional<PointLatLon>& rawCoordinate, int monthsBack,
                                                     const MonthAnchor& anchor) {
        NearbyResult result;
        result.resolvedCoordinate = validateCoordinate(rawCoordinate, region_);
        result.viewRadiusMeters = region_.defaultRadiusMeters;
        result.distanceFromCentreMeters = haversineDistanceMeters(result.resolvedCoordinate, region_.fallbackCenter);

        const PointLatLon anchor_point = result.resolvedCoordinate;
        const PlaceResolver& resolver = resolver_;

        // Place lookup overlaps the window fetch; resolve() never throws
        std::future<std::string> place_future;
        try {
            place_future = std::async(std::launch::async, [&resolver, anchor_point]() {
                return resolver.resolve(anchor_point);
            });
        }
        catch (const std::system_error& e) {
            logWarning(std::string("Could not start place lookup thread, resolving inline: ") + e.what());
        }

        try {
            result.aggregation = aggregator_.fetchWindow(monthsBack, region_.tiles, anchor);
            result.totals = totalAndSerious(result.aggregation.incidents);
            result.byCategory = groupCounts(result.aggregation.incidents);
        }
        catch (const std::exception& e) {
            logError(std::string("Failed to fetch incident window: ") + e.what());
            result.aggregation = AggregationResult{};
            result.totals = Totals{};
            result.byCategory.clear();
            result.windowFailed = true;
        }
        catch (...) {
            logError("Failed to fetch incident window: unknown error");
            result.aggregation = AggregationResult{};
            result.totals = Totals{};
            result.byCategory.clear();
            result.windowFailed = true;
        }

        result.placeName = place_future.valid() ? place_future.get() : resolver.resolve(anchor_point);
        result.headlineMonth = result.aggregation.monthsUsed.empty()
            ? isoMonth(anchor)
            : result.aggregation.monthsUsed.front();

        logDebug("Months queried: " + std::to_string(result.aggregation.monthsUsed.size())
            + ", total incidents: " + std::to_string(result.totals.total));
        return result;
    }

    std::future<NearbyResult> fetchNearbyAsync(
        NearbyIncidentPipeline& pipeline,
        std::optional<PointLatLon> rawCoordinate,
        int monthsBack,
        MonthAnchor anchor
    ) {
        return std::async(
            std::launch::async,
            [&pipeline, rawCoordinate, monthsBack, anchor]() {
                return pipeline.fetchNearby(rawCoordinate, monthsBack, anchor);
            }
        );
    }

} // namespace IncidentFetching
