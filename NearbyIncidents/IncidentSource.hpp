// File: IncidentSource.hpp
#ifndef INCIDENT_SOURCE_HPP
#define INCIDENT_SOURCE_HPP

#include "IncidentFetchingCommon.hpp"
#include <string>

namespace IncidentFetching {

    /**
     * @brief One query against the external incident data source: one spatial
     *        selector, one calendar month. Implementations never throw for the
     *        expected failure kinds; they return a FetchError instead.
     */
    class IncidentSource {
    public:
        virtual ~IncidentSource() = default;

        /**
         * @param selector Point or tile; the tile is used when both are present.
         * @param isoMonth Month in "YYYY-MM" form.
         */
        virtual FetchOutcome fetchMonth(const SpatialSelector& selector, const std::string& isoMonth) = 0;
    };

} // namespace IncidentFetching

#endif // INCIDENT_SOURCE_HPP
