// File: IncidentCache.cpp

#include "IncidentCache.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace IncidentFetching {

    std::string IncidentCache::makeKey(double lat, double lon, const std::string& month) {
        double rounded_lat = std::round(lat * 1000.0) / 1000.0;
        double rounded_lon = std::round(lon * 1000.0) / 1000.0;
        // -0.000 and 0.000 must share a cell
        if (rounded_lat == 0.0) rounded_lat = 0.0;
        if (rounded_lon == 0.0) rounded_lon = 0.0;

        std::stringstream ss;
        ss << std::fixed << std::setprecision(3) << rounded_lat << "," << rounded_lon << "," << month;
        return ss.str();
    }

    std::optional<IncidentList> IncidentCache::get(double lat, double lon, const std::string& month) const {
        std::string key = makeKey(lat, lon, month);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = store_.find(key);
        if (it == store_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void IncidentCache::set(double lat, double lon, const std::string& month, IncidentList incidents) {
        std::string key = makeKey(lat, lon, month);
        std::lock_guard<std::mutex> lock(mutex_);
        store_[key] = std::move(incidents);
    }

    std::size_t IncidentCache::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.size();
    }

    void IncidentCache::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.clear();
    }

} // namespace IncidentFetching
