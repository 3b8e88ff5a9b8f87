// File: IncidentParser.hpp
#ifndef INCIDENT_PARSER_HPP
#define INCIDENT_PARSER_HPP

#include "IncidentFetchingCommon.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace json { class JSON; }

namespace IncidentFetching {

    /** @brief Maximum number of body bytes kept in a MalformedBody diagnostic. */
    constexpr std::size_t kBodyExcerptLimit = 200;

    /**
     * @brief Parses a source response body (JSON array of incident objects).
     *        Individual fields are repaired with fallbacks; only a body that is not
     *        well-formed JSON, or not an array of objects, is rejected.
     * @return The records in response order, or std::nullopt if the body is malformed.
     */
    std::optional<IncidentList> parseIncidentList(const std::string& body);

    /**
     * @brief Builds one record from a decoded incident object.
     *        id: string id, else integer id, else persistent_id, else a synthetic id.
     *        category/month default to "unknown"/"----". A location whose latitude or
     *        longitude text does not parse becomes (0,0).
     */
    IncidentRecord incidentFromJson(const json::JSON& entry);

    /** @brief Fresh random identifier in 8-4-4-4-12 hex form; unique per call. */
    std::string generateSyntheticId();

    /** @brief First kBodyExcerptLimit bytes of body, for diagnostics. */
    std::string bodyExcerpt(const std::string& body);

} // namespace IncidentFetching

#endif // INCIDENT_PARSER_HPP
