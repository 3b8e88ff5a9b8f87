// File: PlaceResolver.hpp
#ifndef PLACE_RESOLVER_HPP
#define PLACE_RESOLVER_HPP

#include "IncidentFetchingCommon.hpp"

#include <optional>
#include <string>

namespace IncidentFetching {

    /** @brief Names from one reverse-geocode result; any of them may be missing. */
    struct Placemark {
        std::optional<std::string> locality;
        std::optional<std::string> subAdministrativeArea;
        std::optional<std::string> administrativeArea;
    };

    /**
     * @brief Reverse geocoding backend. Returns std::nullopt when there is no
     *        result; may throw on transport or decoding failures.
     */
    class ReverseGeocoder {
    public:
        virtual ~ReverseGeocoder() = default;
        virtual std::optional<Placemark> reverseGeocode(PointLatLon point) = 0;
    };

    /**
     * @class NominatimGeocoder
     * @brief ReverseGeocoder using the OpenStreetMap Nominatim /reverse endpoint.
     *        city/town/village/suburb -> locality, county -> sub-region, state -> region.
     */
    class NominatimGeocoder : public ReverseGeocoder {
    public:
        explicit NominatimGeocoder(ApiConfig config);

        std::optional<Placemark> reverseGeocode(PointLatLon point) override;

        /** @brief Decodes a jsonv2 /reverse body. @throws std::runtime_error if it is not an object. */
        static std::optional<Placemark> parseReverseResponse(const std::string& body);

    private:
        ApiConfig config_;
    };

    /**
     * @class PlaceResolver
     * @brief Coordinate -> display place name. Prefers locality, then sub-region, then
     *        region; every failure, including an exception from the geocoder, yields
     *        the fallback name. Never throws.
     */
    class PlaceResolver {
    public:
        PlaceResolver(ReverseGeocoder& geocoder, std::string fallbackName);

        std::string resolve(PointLatLon point) const;

        const std::string& fallbackName() const { return fallbackName_; }

    private:
        ReverseGeocoder& geocoder_;
        std::string fallbackName_;
    };

} // namespace IncidentFetching

#endif // PLACE_RESOLVER_HPP
