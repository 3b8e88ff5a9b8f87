// File: PlaceResolver.cpp

#include "PlaceResolver.hpp"
#include "IncidentParser.hpp"
#include "JsonText.hpp"
#include "Logging.hpp"

#include "httplib.h"
#include "json.hpp"

#include <exception>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace IncidentFetching {

    namespace {
        std::optional<std::string> firstNonEmpty(const json::JSON& object, std::initializer_list<const char*> keys) {
            for (const char* key : keys) {
                if (!object.hasKey(key)) continue;
                const json::JSON& value = object.at(key);
                std::string text = stringValue(value);
                if (!text.empty()) {
                    return text;
                }
            }
            return std::nullopt;
        }
    }

    // --- NominatimGeocoder ---

    NominatimGeocoder::NominatimGeocoder(ApiConfig config) : config_(std::move(config)) {
    }

    std::optional<Placemark> NominatimGeocoder::parseReverseResponse(const std::string& body) {
        if (!isWellFormedJson(body)) {
            throw std::runtime_error("Reverse geocode: malformed body: " + bodyExcerpt(body));
        }
        json::JSON root = json::JSON::Load(body);
        if (root.JSONType() != json::JSON::Class::Object) {
            throw std::runtime_error("Reverse geocode: unexpected body: " + bodyExcerpt(body));
        }
        // Nominatim reports "Unable to geocode" as {"error": "..."}
        if (root.hasKey("error") || !root.hasKey("address")) {
            return std::nullopt;
        }
        const json::JSON& address = root.at("address");
        if (address.JSONType() != json::JSON::Class::Object) {
            return std::nullopt;
        }

        Placemark placemark;
        placemark.locality = firstNonEmpty(address, { "city", "town", "village", "suburb" });
        placemark.subAdministrativeArea = firstNonEmpty(address, { "county", "state_district" });
        placemark.administrativeArea = firstNonEmpty(address, { "state" });
        return placemark;
    }

    std::optional<Placemark> NominatimGeocoder::reverseGeocode(PointLatLon point) {
        std::stringstream path;
        path << std::fixed << std::setprecision(6)
            << "/reverse?format=jsonv2&lat=" << point.lat << "&lon=" << point.lon;

        httplib::Client cli(config_.geocoderBaseUrl);
        cli.set_follow_location(true);
        cli.set_connection_timeout(config_.connectionTimeoutSec);
        cli.set_read_timeout(config_.readTimeoutSec);

        // Nominatim's usage policy requires an identifying User-Agent
        httplib::Headers headers = { { "User-Agent", config_.userAgent } };
        httplib::Result res = cli.Get(path.str(), headers);
        if (!res) {
            throw std::runtime_error("Reverse geocode request failed: " + httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            throw std::runtime_error("Reverse geocode: status " + std::to_string(res->status));
        }
        return parseReverseResponse(res->body);
    }

    // --- PlaceResolver ---

    PlaceResolver::PlaceResolver(ReverseGeocoder& geocoder, std::string fallbackName)
        : geocoder_(geocoder), fallbackName_(std::move(fallbackName)) {
    }

    std::string PlaceResolver::resolve(PointLatLon point) const {
        try {
            auto placemark = geocoder_.reverseGeocode(point);
            if (placemark) {
                if (placemark->locality) return *placemark->locality;
                if (placemark->subAdministrativeArea) return *placemark->subAdministrativeArea;
                if (placemark->administrativeArea) return *placemark->administrativeArea;
            }
        }
        catch (const std::exception& e) {
            logDebug(std::string("Place lookup failed, using fallback: ") + e.what());
        }
        catch (...) {
            logDebug("Place lookup failed with an unknown error, using fallback");
        }
        return fallbackName_;
    }

} // namespace IncidentFetching
