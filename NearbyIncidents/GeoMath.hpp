// File: GeoMath.hpp
#ifndef GEO_MATH_HPP
#define GEO_MATH_HPP

#include "IncidentFetchingCommon.hpp"
#include <optional>
#include <string>
#include <vector>

namespace IncidentFetching {

    /**
     * @brief Great-circle distance between two points using the haversine formula
     *        on a spherical Earth (radius 6371 km).
     * @return Distance in meters.
     */
    double haversineDistanceMeters(PointLatLon a, PointLatLon b);

    /**
     * @brief Mean of the ring's vertices. Used as the representative cell of a
     *        tile when keying the incident cache.
     * @return The centroid, or (0,0) for an empty ring.
     */
    PointLatLon tileCentroid(const Tile& tile);

    /** @brief Formats a ring as "lat1,lon1:lat2,lon2:..." (6 decimal places). */
    std::string formatPolyString(const std::vector<PointLatLon>& ring);

    /**
     * @brief Parses "lat1,lon1:lat2,lon2:..." into a ring.
     * @return std::nullopt if any component is not numeric or fewer than
     *         three vertices are given.
     */
    std::optional<std::vector<PointLatLon>> parsePolyString(const std::string& poly);

} // namespace IncidentFetching

#endif // GEO_MATH_HPP
