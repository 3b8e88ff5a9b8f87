// File: ApiClient.hpp
#ifndef API_CLIENT_HPP
#define API_CLIENT_HPP

#include "IncidentFetchingCommon.hpp"
#include "IncidentSource.hpp"

#include <string>

// httplib stays out of this header; only ApiClient.cpp includes it

namespace IncidentFetching {

    /**
     * @class ApiClient
     * @brief IncidentSource backed by the police.uk street-level crime endpoint.
     *        Issues exactly one GET per call and performs no retries.
     */
    class ApiClient : public IncidentSource {
    public:
        explicit ApiClient(ApiConfig config);
        ~ApiClient() override;

        FetchOutcome fetchMonth(const SpatialSelector& selector, const std::string& isoMonth) override;

        /**
         * @brief Request path plus query: "date=YYYY-MM" and either "poly=..." or
         *        "lat=..&lng=..". Neither selector set yields a date-only query.
         */
        std::string buildRequestPath(const SpatialSelector& selector, const std::string& isoMonth) const;

        /**
         * @brief Maps an HTTP status and body onto the outcome variant:
         *        404 -> NoDataForMonth, other non-2xx -> HttpError,
         *        2xx with unparsable body -> MalformedBody (bounded excerpt).
         */
        static FetchOutcome classifyResponse(int status, const std::string& body);

    private:
        ApiConfig config_;
    };

} // namespace IncidentFetching
#endif // API_CLIENT_HPP
