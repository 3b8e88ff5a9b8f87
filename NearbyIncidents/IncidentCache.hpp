// File: IncidentCache.hpp
#ifndef INCIDENT_CACHE_HPP
#define INCIDENT_CACHE_HPP

#include "IncidentFetchingCommon.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace IncidentFetching {

    /**
     * @class IncidentCache
     * @brief Session-lifetime store of source results keyed by a ~110 m cell and a
     *        month. Coordinates are rounded to 3 decimal places; last write wins.
     *        No eviction. Safe to share between threads.
     */
    class IncidentCache {
    public:
        IncidentCache() = default;
        IncidentCache(const IncidentCache&) = delete;
        IncidentCache& operator=(const IncidentCache&) = delete;

        std::optional<IncidentList> get(double lat, double lon, const std::string& month) const;
        void set(double lat, double lon, const std::string& month, IncidentList incidents);

        std::size_t size() const;
        void clear();

        /** @brief Key for a cell, e.g. "53.479,-2.245,2025-06". */
        static std::string makeKey(double lat, double lon, const std::string& month);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, IncidentList> store_;
    };

} // namespace IncidentFetching

#endif // INCIDENT_CACHE_HPP
