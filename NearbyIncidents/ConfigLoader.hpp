// File: ConfigLoader.hpp
#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "IncidentFetchingCommon.hpp"

#include <optional>
#include <string>

namespace IncidentFetching {

    struct AppConfig {
        RegionConfig region;
        ApiConfig api;
    };

    /**
     * @brief Reads a JSON configuration with optional "region" and "api" objects.
     *        Missing fields keep their built-in defaults. Tiles are either
     *        "lat,lon:lat,lon:..." strings or { "name": ..., "poly": ... } objects.
     * @return std::nullopt (with the reason logged) if the file cannot be read,
     *         is not a JSON object, or contains an invalid tile or bounding box.
     */
    std::optional<AppConfig> loadConfigFile(const std::string& path);

    /** @brief Same as loadConfigFile, from an in-memory document. */
    std::optional<AppConfig> parseConfig(const std::string& text);

} // namespace IncidentFetching

#endif // CONFIG_LOADER_HPP
