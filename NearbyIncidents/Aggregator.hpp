// File: Aggregator.hpp
#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "IncidentFetchingCommon.hpp"
#include "IncidentCache.hpp"
#include "IncidentSource.hpp"
#include "MonthMath.hpp"

#include <optional>
#include <string>
#include <vector>

namespace IncidentFetching {

    struct AggregatorOptions {
        bool parallelTiles = false; // fan tiles of one month out with std::async
    };

    /**
     * @class IncidentAggregator
     * @brief Fans source queries out over tiles x months, merging every successful
     *        response. A failed (tile, month) pair is logged and skipped; it never
     *        aborts the month or the window. No de-duplication is performed, so a
     *        record reported by two overlapping tiles is counted twice.
     */
    class IncidentAggregator {
    public:
        IncidentAggregator(IncidentSource& source, IncidentCache& cache, AggregatorOptions options = {});

        /**
         * @brief Queries every tile for each of the monthsBack months ending at anchor.
         *        Merge order is month (newest first), then tile order, then response order.
         *        monthsUsed lists every attempted month, with or without data.
         * @throws std::invalid_argument if monthsBack < 1 or tiles is empty.
         */
        AggregationResult fetchWindow(int monthsBack, const std::vector<Tile>& tiles, const MonthAnchor& anchor);

        /**
         * @brief Walks back from anchor for up to `window` months around a single point
         *        and returns the first month with any records. When none has data the
         *        oldest attempted month is returned with an empty list.
         * @throws std::invalid_argument if window < 1.
         */
        MonthSnapshot fetchFirstNonEmptyMonth(PointLatLon point, const MonthAnchor& anchor, int window = 6);

        /**
         * @brief Single-point variant of fetchWindow. Only months that produced at
         *        least one record are reported in monthsUsed.
         * @throws std::invalid_argument if monthsBack < 1.
         */
        AggregationResult fetchPointWindow(PointLatLon point, int monthsBack, const MonthAnchor& anchor);

    private:
        // Cache-first single query; std::nullopt when the pair failed.
        std::optional<IncidentList> fetchCell(const SpatialSelector& selector, PointLatLon cell,
                                              const std::string& label, const std::string& month);

        std::vector<std::optional<IncidentList>> fetchMonthTiles(const std::vector<Tile>& tiles,
                                                                 const std::string& month);

        IncidentSource& source_;
        IncidentCache& cache_;
        AggregatorOptions options_;
    };

} // namespace IncidentFetching

#endif // AGGREGATOR_HPP
