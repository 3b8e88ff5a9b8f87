// File: IncidentFetchingCommon.hpp
#ifndef INCIDENT_FETCHING_COMMON_HPP
#define INCIDENT_FETCHING_COMMON_HPP

#include <vector>
#include <string>
#include <optional>
#include <variant>

namespace IncidentFetching {

    // --- Basic Point Types ---
    struct PointLatLon { double lat = 0.0, lon = 0.0; };

    inline bool operator==(const PointLatLon& a, const PointLatLon& b) {
        return a.lat == b.lat && a.lon == b.lon;
    }
    inline bool operator!=(const PointLatLon& a, const PointLatLon& b) { return !(a == b); }

    struct BoundingBox {
        double minLat = 0.0, maxLat = 0.0;
        double minLon = 0.0, maxLon = 0.0;
    };

    /**
     * @brief One polygon of the region decomposition. The ring is open: the last
     *        vertex is not a repeat of the first.
     */
    struct Tile {
        std::string name;
        std::vector<PointLatLon> ring;
    };

    /**
     * @brief Spatial part of a single source query. Exactly one selector is sent;
     *        the tile wins when both are set.
     */
    struct SpatialSelector {
        std::optional<PointLatLon> point;
        std::optional<Tile> tile;
    };

    // --- Region Configuration ---
    struct RegionConfig {
        BoundingBox bounds{ 53.35, 53.60, -2.40, -2.10 };
        PointLatLon fallbackCenter{ 53.4794, -2.2453 };
        std::string fallbackPlaceName = "Manchester";
        double defaultRadiusMeters = 1609.0; // passthrough for map views
        std::vector<Tile> tiles = {
            { "NW", { { 53.55, -2.35 }, { 53.55, -2.245 }, { 53.48, -2.245 }, { 53.48, -2.35 } } },
            { "NE", { { 53.55, -2.245 }, { 53.55, -2.14 }, { 53.48, -2.14 }, { 53.48, -2.245 } } },
            { "SW", { { 53.48, -2.35 }, { 53.48, -2.245 }, { 53.41, -2.245 }, { 53.41, -2.35 } } },
            { "SE", { { 53.48, -2.245 }, { 53.48, -2.14 }, { 53.41, -2.14 }, { 53.41, -2.245 } } }
        };
    };

    // --- API Configuration ---
    struct ApiConfig {
        std::string incidentBaseUrl = "https://data.police.uk";
        std::string incidentPath = "/api/crimes-street/all-crime";
        std::string geocoderBaseUrl = "https://nominatim.openstreetmap.org";
        std::string userAgent = "NearbyIncidents/1.0";
        int connectionTimeoutSec = 10;
        int readTimeoutSec = 30;
        bool parallelTiles = false;
        bool debugLogging = false;
    };

    // --- Incident Data ---
    struct Street {
        std::optional<long> id;
        std::optional<std::string> name;
    };

    struct IncidentRecord {
        std::string id;
        std::string category = "unknown";
        std::string month = "----";
        PointLatLon location;           // (0,0) when the source text did not parse
        std::optional<Street> street;
    };

    using IncidentList = std::vector<IncidentRecord>;

    // --- Source Client Outcome ---
    enum class FetchErrorKind {
        NoDataForMonth, // HTTP 404, the month is not published yet
        HttpError,      // any other non-2xx status
        MalformedBody,  // 2xx but not a JSON array of incidents
        Transport       // connection, TLS or timeout failure
    };

    struct FetchError {
        FetchErrorKind kind = FetchErrorKind::Transport;
        int httpStatus = 0;
        std::string detail; // body excerpt or transport message, bounded
    };

    using FetchOutcome = std::variant<IncidentList, FetchError>;

    // --- Aggregation Results ---
    struct CategoryCount {
        std::string category;
        int count = 0;
    };

    struct Totals {
        int total = 0;
        int serious = 0;
    };

    struct AggregationResult {
        std::vector<std::string> monthsUsed; // newest first
        IncidentList incidents;
    };

    struct MonthSnapshot {
        std::string month;
        IncidentList incidents;
    };

    struct NearbyResult {
        AggregationResult aggregation;
        Totals totals;
        std::vector<CategoryCount> byCategory;
        std::string placeName;
        PointLatLon resolvedCoordinate;
        std::string headlineMonth;
        double viewRadiusMeters = 0.0;
        double distanceFromCentreMeters = 0.0;
        bool windowFailed = false; // true when the window fetch faulted and empty data was substituted
    };

} // namespace IncidentFetching

#endif // INCIDENT_FETCHING_COMMON_HPP
