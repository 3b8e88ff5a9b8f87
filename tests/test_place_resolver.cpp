// tests/test_place_resolver.cpp

#include <iostream>
#include <stdexcept>
#include <string>

#include "PlaceResolver.hpp"
#include "TestFakes.hpp"

using namespace IncidentFetching;
using testfakes::FakeGeocoder;

int main() {
    const PointLatLon point{ 53.4794, -2.2453 };

    // --- Preference order: locality, then sub-region, then region ---
    {
        Placemark full;
        full.locality = "Salford";
        full.subAdministrativeArea = "Greater Manchester";
        full.administrativeArea = "England";
        FakeGeocoder geocoder(FakeGeocoder::Mode::Answer, full);
        PlaceResolver resolver(geocoder, "Manchester");
        if (resolver.resolve(point) != "Salford" || !geocoder.lastPoint || *geocoder.lastPoint != point) {
            std::cerr << "locality should win\n";
            return 1;
        }
    }
    {
        Placemark partial;
        partial.subAdministrativeArea = "Greater Manchester";
        partial.administrativeArea = "England";
        FakeGeocoder geocoder(FakeGeocoder::Mode::Answer, partial);
        PlaceResolver resolver(geocoder, "Manchester");
        if (resolver.resolve(point) != "Greater Manchester") {
            std::cerr << "sub-region should be second choice\n";
            return 2;
        }
    }
    {
        Placemark region_only;
        region_only.administrativeArea = "England";
        FakeGeocoder geocoder(FakeGeocoder::Mode::Answer, region_only);
        PlaceResolver resolver(geocoder, "Manchester");
        if (resolver.resolve(point) != "England") {
            std::cerr << "region should be third choice\n";
            return 3;
        }
    }

    // --- Every failure yields the fallback name ---
    {
        FakeGeocoder empty_placemark(FakeGeocoder::Mode::Answer, Placemark{});
        FakeGeocoder no_result(FakeGeocoder::Mode::NoResult);
        FakeGeocoder throwing(FakeGeocoder::Mode::Throw);
        if (PlaceResolver(empty_placemark, "Manchester").resolve(point) != "Manchester" ||
            PlaceResolver(no_result, "Manchester").resolve(point) != "Manchester" ||
            PlaceResolver(throwing, "Manchester").resolve(point) != "Manchester") {
            std::cerr << "failures should resolve to the fallback name\n";
            return 4;
        }
    }

    // --- Nominatim response decoding ---
    auto city = NominatimGeocoder::parseReverseResponse(
        R"({"place_id":1,"display_name":"x","address":{"road":"Market Street","city":"Manchester","county":"Greater Manchester","state":"England","country":"United Kingdom"}})");
    if (!city || !city->locality || *city->locality != "Manchester" ||
        !city->subAdministrativeArea || *city->subAdministrativeArea != "Greater Manchester" ||
        !city->administrativeArea || *city->administrativeArea != "England") {
        std::cerr << "city response mismatch\n";
        return 5;
    }

    auto town = NominatimGeocoder::parseReverseResponse(R"({"address":{"town":"Stockport","state":"England"}})");
    if (!town || !town->locality || *town->locality != "Stockport" || town->subAdministrativeArea) {
        std::cerr << "town response mismatch\n";
        return 6;
    }

    if (NominatimGeocoder::parseReverseResponse(R"({"error":"Unable to geocode"})")) {
        std::cerr << "error response should have no placemark\n";
        return 7;
    }

    bool threw = false;
    try {
        NominatimGeocoder::parseReverseResponse("<html>");
    }
    catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "non-JSON body should throw\n";
        return 8;
    }

    auto quoted = NominatimGeocoder::parseReverseResponse(R"({"address":{"suburb":"Moss \"Side\""}})");
    if (!quoted || !quoted->locality || *quoted->locality != "Moss \"Side\"") {
        std::cerr << "escaped place name should come back unescaped\n";
        return 9;
    }

    threw = false;
    try {
        NominatimGeocoder::parseReverseResponse(R"({"address":{"city":"Manch)");
    }
    catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "truncated body should throw\n";
        return 10;
    }

    std::cout << "test_place_resolver: OK\n";
    return 0;
}
