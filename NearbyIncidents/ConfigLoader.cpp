// File: ConfigLoader.cpp

#include "ConfigLoader.hpp"
#include "GeoMath.hpp"
#include "JsonText.hpp"
#include "Logging.hpp"

#include "json.hpp"

#include <fstream>
#include <iterator>

namespace IncidentFetching {

    namespace {
        bool isNumber(const json::JSON& value) {
            return value.JSONType() == json::JSON::Class::Floating || value.JSONType() == json::JSON::Class::Integral;
        }

        double numberValue(const json::JSON& value) {
            return value.JSONType() == json::JSON::Class::Integral ? static_cast<double>(value.ToInt()) : value.ToFloat();
        }

        void readDouble(const json::JSON& object, const std::string& key, double& out) {
            if (object.hasKey(key) && isNumber(object.at(key))) {
                out = numberValue(object.at(key));
            }
        }

        void readInt(const json::JSON& object, const std::string& key, int& out) {
            if (object.hasKey(key) && object.at(key).JSONType() == json::JSON::Class::Integral) {
                out = static_cast<int>(object.at(key).ToInt());
            }
        }

        void readString(const json::JSON& object, const std::string& key, std::string& out) {
            if (object.hasKey(key) && object.at(key).JSONType() == json::JSON::Class::String) {
                out = stringValue(object.at(key));
            }
        }

        void readBool(const json::JSON& object, const std::string& key, bool& out) {
            if (object.hasKey(key) && object.at(key).JSONType() == json::JSON::Class::Boolean) {
                out = object.at(key).ToBool();
            }
        }

        std::optional<Tile> readTile(const json::JSON& value, size_t index) {
            Tile tile;
            std::string poly;
            if (value.JSONType() == json::JSON::Class::String) {
                tile.name = "tile" + std::to_string(index + 1);
                poly = stringValue(value);
            }
            else if (value.JSONType() == json::JSON::Class::Object) {
                tile.name = "tile" + std::to_string(index + 1);
                readString(value, "name", tile.name);
                readString(value, "poly", poly);
            }
            else {
                logError("Config: tile " + std::to_string(index + 1) + " is neither a string nor an object.");
                return std::nullopt;
            }

            auto ring = parsePolyString(poly);
            if (!ring) {
                logError("Config: tile '" + tile.name + "' has an invalid polygon: '" + poly + "'");
                return std::nullopt;
            }
            tile.ring = std::move(*ring);
            return tile;
        }

        bool readRegion(const json::JSON& region_json, RegionConfig& region) {
            if (region_json.hasKey("bounds")) {
                const json::JSON& bounds = region_json.at("bounds");
                readDouble(bounds, "minLat", region.bounds.minLat);
                readDouble(bounds, "maxLat", region.bounds.maxLat);
                readDouble(bounds, "minLon", region.bounds.minLon);
                readDouble(bounds, "maxLon", region.bounds.maxLon);
                if (region.bounds.minLat > region.bounds.maxLat || region.bounds.minLon > region.bounds.maxLon) {
                    logError("Config: bounding box minimum exceeds maximum.");
                    return false;
                }
            }
            if (region_json.hasKey("center")) {
                const json::JSON& center = region_json.at("center");
                readDouble(center, "lat", region.fallbackCenter.lat);
                readDouble(center, "lon", region.fallbackCenter.lon);
            }
            readString(region_json, "placeName", region.fallbackPlaceName);
            readDouble(region_json, "radiusMeters", region.defaultRadiusMeters);

            if (region_json.hasKey("tiles")) {
                const json::JSON& tiles_json = region_json.at("tiles");
                if (tiles_json.JSONType() != json::JSON::Class::Array) {
                    logError("Config: 'tiles' must be an array.");
                    return false;
                }
                std::vector<Tile> tiles;
                for (int i = 0; i < tiles_json.length(); ++i) {
                    auto tile = readTile(tiles_json.at(static_cast<unsigned>(i)), static_cast<size_t>(i));
                    if (!tile) return false;
                    tiles.push_back(std::move(*tile));
                }
                region.tiles = std::move(tiles);
            }
            return true;
        }

        void readApi(const json::JSON& api_json, ApiConfig& api) {
            readString(api_json, "incidentBaseUrl", api.incidentBaseUrl);
            readString(api_json, "incidentPath", api.incidentPath);
            readString(api_json, "geocoderBaseUrl", api.geocoderBaseUrl);
            readString(api_json, "userAgent", api.userAgent);
            readInt(api_json, "connectionTimeoutSec", api.connectionTimeoutSec);
            readInt(api_json, "readTimeoutSec", api.readTimeoutSec);
            readBool(api_json, "parallelTiles", api.parallelTiles);
            readBool(api_json, "debugLogging", api.debugLogging);
        }
    }

    std::optional<AppConfig> parseConfig(const std::string& text) {
        if (!isWellFormedJson(text)) {
            logError("Config: document is not valid JSON.");
            return std::nullopt;
        }
        json::JSON root = json::JSON::Load(text);
        if (root.JSONType() != json::JSON::Class::Object) {
            logError("Config: document is not a JSON object.");
            return std::nullopt;
        }

        AppConfig config;
        if (root.hasKey("region")) {
            if (!readRegion(root.at("region"), config.region)) {
                return std::nullopt;
            }
        }
        if (root.hasKey("api")) {
            readApi(root.at("api"), config.api);
        }
        return config;
    }

    std::optional<AppConfig> loadConfigFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            logError("Config: could not open '" + path + "'");
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (content.empty()) {
            logError("Config: file is empty: '" + path + "'");
            return std::nullopt;
        }
        return parseConfig(content);
    }

} // namespace IncidentFetching
