// File: Geofence.hpp
#ifndef GEOFENCE_HPP
#define GEOFENCE_HPP

#include "IncidentFetchingCommon.hpp"
#include <optional>

namespace IncidentFetching {

    /** @brief True if the point lies inside the box, edges included. */
    bool isInsideBounds(PointLatLon point, const BoundingBox& bounds);

    /**
     * @brief Clamps a raw coordinate to the supported region.
     *        An absent coordinate, or one outside region.bounds, becomes
     *        region.fallbackCenter; anything else is returned unchanged.
     * @param raw Coordinate from the caller, possibly absent (no location fix).
     * @param region Region whose bounds and fallback centre apply.
     */
    PointLatLon validateCoordinate(const std::optional<PointLatLon>& raw, const RegionConfig& region);

} // namespace IncidentFetching

#endif // GEOFENCE_HPP
