// File: Fetcher.hpp
#ifndef FETCHER_HPP
#define FETCHER_HPP

#include "IncidentFetchingCommon.hpp"
#include "Aggregator.hpp"
#include "MonthMath.hpp"
#include "PlaceResolver.hpp"

#include <future>
#include <optional>

namespace IncidentFetching {

    /**
     * @class NearbyIncidentPipeline
     * @brief End-to-end "recent incidents near a point": geofence, window fetch over
     *        the region's tiles, categorisation, and place-name lookup. The result is
     *        always well formed; window-level faults are turned into empty data.
     */
    class NearbyIncidentPipeline {
    public:
        NearbyIncidentPipeline(RegionConfig region, IncidentAggregator& aggregator, const PlaceResolver& resolver);

        /**
         * @param rawCoordinate Caller's position, absent when no fix is available.
         * @param monthsBack Number of calendar months to cover, anchor month included.
         * @param anchor Newest month of the window.
         */
        NearbyResult fetchNearby(const std::optional<PointLatLon>& rawCoordinate, int monthsBack,
                                 const MonthAnchor& anchor);

        const RegionConfig& region() const { return region_; }

    private:
        RegionConfig region_;
        IncidentAggregator& aggregator_;
        const PlaceResolver& resolver_;
    };

    /** @brief Runs pipeline.fetchNearby on its own thread. The pipeline must outlive the future. */
    std::future<NearbyResult> fetchNearbyAsync(
        NearbyIncidentPipeline& pipeline,
        std::optional<PointLatLon> rawCoordinate,
        int monthsBack,
        MonthAnchor anchor
    );

} // namespace IncidentFetching
#endif // FETCHER_HPP
