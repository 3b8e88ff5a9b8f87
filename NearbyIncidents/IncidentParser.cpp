// File: IncidentParser.cpp

#include "IncidentParser.hpp"
#include "JsonText.hpp"

#include "json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>

namespace IncidentFetching {

    namespace {
        // Coordinates arrive as text ("53.479412"); numbers are accepted too
        std::optional<double> coordinateValue(const json::JSON& value) {
            switch (value.JSONType()) {
            case json::JSON::Class::Floating:
                return value.ToFloat();
            case json::JSON::Class::Integral:
                return static_cast<double>(value.ToInt());
            case json::JSON::Class::String: {
                std::string text = stringValue(value);
                if (text.empty()) return std::nullopt;
                char* end = nullptr;
                double parsed = std::strtod(text.c_str(), &end);
                if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
                    return std::nullopt;
                }
                return parsed;
            }
            default:
                return std::nullopt;
            }
        }

        std::optional<std::string> nonEmptyString(const json::JSON& object, const std::string& key) {
            if (!object.hasKey(key)) return std::nullopt;
            const json::JSON& value = object.at(key);
            if (value.JSONType() != json::JSON::Class::String) return std::nullopt;
            std::string text = stringValue(value);
            if (text.empty()) return std::nullopt;
            return text;
        }

        PointLatLon parseLocation(const json::JSON& entry) {
            if (!entry.hasKey("location")) return PointLatLon{};
            const json::JSON& location = entry.at("location");
            if (!location.hasKey("latitude") || !location.hasKey("longitude")) {
                return PointLatLon{};
            }
            auto lat = coordinateValue(location.at("latitude"));
            auto lon = coordinateValue(location.at("longitude"));
            if (!lat || !lon) {
                return PointLatLon{};
            }
            return PointLatLon{ *lat, *lon };
        }

        std::optional<Street> parseStreet(const json::JSON& entry) {
            if (!entry.hasKey("location")) return std::nullopt;
            const json::JSON& location = entry.at("location");
            if (!location.hasKey("street")) return std::nullopt;
            const json::JSON& street_json = location.at("street");
            if (street_json.JSONType() != json::JSON::Class::Object) return std::nullopt;

            Street street;
            if (street_json.hasKey("id") && street_json.at("id").JSONType() == json::JSON::Class::Integral) {
                street.id = street_json.at("id").ToInt();
            }
            street.name = nonEmptyString(street_json, "name");
            return street;
        }
    }

    std::string generateSyntheticId() {
        thread_local std::mt19937_64 engine{ std::random_device{}() };
        std::uniform_int_distribution<std::uint64_t> dist;
        std::uint64_t hi = dist(engine);
        std::uint64_t lo = dist(engine);

        std::stringstream ss;
        ss << std::hex << std::setfill('0')
            << std::setw(8) << static_cast<std::uint32_t>(hi >> 32) << "-"
            << std::setw(4) << static_cast<std::uint32_t>((hi >> 16) & 0xFFFF) << "-"
            << std::setw(4) << static_cast<std::uint32_t>(hi & 0xFFFF) << "-"
            << std::setw(4) << static_cast<std::uint32_t>(lo >> 48) << "-"
            << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

    std::string bodyExcerpt(const std::string& body) {
        if (body.empty()) return "[empty]";
        return body.substr(0, kBodyExcerptLimit);
    }

    IncidentRecord incidentFromJson(const json::JSON& entry) {
        IncidentRecord record;

        // --- Identifier ---
        std::optional<std::string> id;
        if (entry.hasKey("id")) {
            const json::JSON& id_json = entry.at("id");
            if (id_json.JSONType() == json::JSON::Class::String && !stringValue(id_json).empty()) {
                id = stringValue(id_json);
            }
            else if (id_json.JSONType() == json::JSON::Class::Integral) {
                id = std::to_string(id_json.ToInt());
            }
        }
        if (!id) {
            id = nonEmptyString(entry, "persistent_id");
        }
        record.id = id ? *id : generateSyntheticId();

        // --- Classification and month ---
        if (entry.hasKey("category") && entry.at("category").JSONType() == json::JSON::Class::String) {
            record.category = stringValue(entry.at("category"));
        }
        if (entry.hasKey("month") && entry.at("month").JSONType() == json::JSON::Class::String) {
            record.month = stringValue(entry.at("month"));
        }

        record.location = parseLocation(entry);
        record.street = parseStreet(entry);
        return record;
    }

    std::optional<IncidentList> parseIncidentList(const std::string& body) {
        // Truncated or trailing-junk bodies must be rejected, not decoded as a short list
        if (!isWellFormedJson(body)) {
            return std::nullopt;
        }
        json::JSON root = json::JSON::Load(body);
        if (root.JSONType() != json::JSON::Class::Array) {
            return std::nullopt;
        }

        IncidentList incidents;
        incidents.reserve(static_cast<size_t>(root.length()));
        for (const json::JSON& entry : root.ArrayRange()) {
            if (entry.JSONType() != json::JSON::Class::Object) {
                return std::nullopt;
            }
            incidents.push_back(incidentFromJson(entry));
        }
        return incidents;
    }

} // namespace IncidentFetching
