// File: GeoMath.cpp

#include "GeoMath.hpp"
#include <algorithm>
#include <cmath> // For M_PI, std::sin, std::asin
#include <iomanip>
#include <sstream>

#ifndef M_PI // Define M_PI if not defined (e.g., not included by <cmath> by default)
#define M_PI 3.14159265358979323846
#endif

namespace IncidentFetching {

    namespace {
        bool parseDouble(const std::string& text, double& out) {
            if (text.empty()) return false;
            std::istringstream iss(text);
            iss >> out;
            return !iss.fail() && iss.eof();
        }
    }

    double haversineDistanceMeters(PointLatLon a, PointLatLon b) {
        const double r_earth_m = 6371000.0;
        const double deg_to_rad = M_PI / 180.0;

        double d_lat = (b.lat - a.lat) * deg_to_rad;
        double d_lon = (b.lon - a.lon) * deg_to_rad;
        double lat1 = a.lat * deg_to_rad;
        double lat2 = b.lat * deg_to_rad;

        double h = std::sin(d_lat / 2) * std::sin(d_lat / 2)
            + std::sin(d_lon / 2) * std::sin(d_lon / 2) * std::cos(lat1) * std::cos(lat2);
        // Clamp guards against rounding pushing h just above 1 for antipodal points
        return 2.0 * r_earth_m * std::asin(std::min(1.0, std::sqrt(h)));
    }

    PointLatLon tileCentroid(const Tile& tile) {
        PointLatLon centroid;
        if (tile.ring.empty()) {
            return centroid;
        }
        for (const auto& vertex : tile.ring) {
            centroid.lat += vertex.lat;
            centroid.lon += vertex.lon;
        }
        centroid.lat /= static_cast<double>(tile.ring.size());
        centroid.lon /= static_cast<double>(tile.ring.size());
        return centroid;
    }

    std::string formatPolyString(const std::vector<PointLatLon>& ring) {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < ring.size(); ++i) {
            ss << ring[i].lat << "," << ring[i].lon << (i == ring.size() - 1 ? "" : ":");
        }
        return ss.str();
    }

    std::optional<std::vector<PointLatLon>> parsePolyString(const std::string& poly) {
        std::vector<PointLatLon> ring;
        std::stringstream pairs(poly);
        std::string pair;
        while (std::getline(pairs, pair, ':')) {
            size_t comma = pair.find(',');
            if (comma == std::string::npos) {
                return std::nullopt;
            }
            PointLatLon vertex;
            if (!parseDouble(pair.substr(0, comma), vertex.lat) ||
                !parseDouble(pair.substr(comma + 1), vertex.lon)) {
                return std::nullopt;
            }
            ring.push_back(vertex);
        }
        if (ring.size() < 3) {
            return std::nullopt;
        }
        return ring;
    }

} // namespace IncidentFetching
