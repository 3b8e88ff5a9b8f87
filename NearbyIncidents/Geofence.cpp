// File: Geofence.cpp

#include "Geofence.hpp"

namespace IncidentFetching {

    bool isInsideBounds(PointLatLon point, const BoundingBox& bounds) {
        // NaN fails every comparison below, so it is treated as outside
        return point.lat >= bounds.minLat && point.lat <= bounds.maxLat &&
               point.lon >= bounds.minLon && point.lon <= bounds.maxLon;
    }

    PointLatLon validateCoordinate(const std::optional<PointLatLon>& raw, const RegionConfig& region) {
        if (!raw) {
            return region.fallbackCenter;
        }
        if (!isInsideBounds(raw.value(), region.bounds)) {
            return region.fallbackCenter;
        }
        return raw.value();
    }

} // namespace IncidentFetching
