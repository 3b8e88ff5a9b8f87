// File: ApiClient.cpp

#include "ApiClient.hpp"
#include "IncidentParser.hpp"
#include "Logging.hpp"
#include "GeoMath.hpp"

#include "httplib.h"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace IncidentFetching {

    ApiClient::ApiClient(ApiConfig config) : config_(std::move(config)) {
    }

    ApiClient::~ApiClient() = default;

    std::string ApiClient::buildRequestPath(const SpatialSelector& selector, const std::string& isoMonth) const {
        std::stringstream ss;
        ss << config_.incidentPath << "?date=" << isoMonth;

        if (selector.tile) {
            ss << "&poly=" << formatPolyString(selector.tile->ring);
        }
        else if (selector.point) {
            ss << std::fixed << std::setprecision(6)
                << "&lat=" << selector.point->lat
                << "&lng=" << selector.point->lon;
        }
        return ss.str();
    }

    FetchOutcome ApiClient::classifyResponse(int status, const std::string& body) {
        if (status == 404) {
            return FetchError{ FetchErrorKind::NoDataForMonth, status, "" };
        }
        if (status < 200 || status >= 300) {
            return FetchError{ FetchErrorKind::HttpError, status, bodyExcerpt(body) };
        }

        auto incidents = parseIncidentList(body);
        if (!incidents) {
            return FetchError{ FetchErrorKind::MalformedBody, status, bodyExcerpt(body) };
        }
        return std::move(*incidents);
    }

    FetchOutcome ApiClient::fetchMonth(const SpatialSelector& selector, const std::string& isoMonth) {
        std::string path = buildRequestPath(selector, isoMonth);
        logDebug("GET " + config_.incidentBaseUrl + path);

        httplib::Client cli(config_.incidentBaseUrl);
        cli.set_follow_location(true);
        cli.set_connection_timeout(config_.connectionTimeoutSec);
        cli.set_read_timeout(config_.readTimeoutSec);

        httplib::Headers headers = { { "User-Agent", config_.userAgent } };
        httplib::Result res = cli.Get(path, headers);

        // Connection/request errors come before any status code
        if (!res) {
            return FetchError{ FetchErrorKind::Transport, 0, "HTTP request failed: " + httplib::to_string(res.error()) };
        }
        return classifyResponse(res->status, res->body);
    }

} // namespace IncidentFetching
