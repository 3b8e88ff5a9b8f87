// File: Aggregator.cpp

#include "Aggregator.hpp"
#include "GeoMath.hpp"
#include "Logging.hpp"

#include <exception>
#include <future>
#include <iterator>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace IncidentFetching {

    namespace {
        std::string pointLabel(PointLatLon point) {
            std::stringstream ss;
            ss << std::fixed << std::setprecision(4) << point.lat << "," << point.lon;
            return ss.str();
        }

        void logFailure(const std::string& month, const std::string& label, const FetchError& error) {
            switch (error.kind) {
            case FetchErrorKind::NoDataForMonth:
                logDebug(month + " -> 404 for " + label);
                break;
            case FetchErrorKind::HttpError:
                logWarning(month + " -> HTTP " + std::to_string(error.httpStatus) + " for " + label);
                break;
            case FetchErrorKind::MalformedBody:
                logWarning(month + " -> bad body for " + label + ": " + error.detail);
                break;
            case FetchErrorKind::Transport:
                logWarning(month + " -> request failed for " + label + ": " + error.detail);
                break;
            }
        }
    }

    IncidentAggregator::IncidentAggregator(IncidentSource& source, IncidentCache& cache, AggregatorOptions options)
        : source_(source), cache_(cache), options_(options) {
    }

    std::optional<IncidentList> IncidentAggregator::fetchCell(const SpatialSelector& selector, PointLatLon cell,
                                                              const std::string& label, const std::string& month) {
        if (auto cached = cache_.get(cell.lat, cell.lon, month)) {
            logDebug(month + " cache hit for " + label + " count=" + std::to_string(cached->size()));
            return cached;
        }

        FetchOutcome outcome;
        try {
            outcome = source_.fetchMonth(selector, month);
        }
        catch (const std::exception& e) {
            logWarning(month + " -> error for " + label + ": " + e.what());
            return std::nullopt;
        }
        catch (...) {
            logWarning(month + " -> unknown error for " + label);
            return std::nullopt;
        }

        if (const auto* error = std::get_if<FetchError>(&outcome)) {
            logFailure(month, label, *error);
            // A 404 is a known-empty cell for this session; other failures may be transient
            if (error->kind == FetchErrorKind::NoDataForMonth) {
                cache_.set(cell.lat, cell.lon, month, {});
            }
            return std::nullopt;
        }

        IncidentList& incidents = std::get<IncidentList>(outcome);
        logDebug(month + " count=" + std::to_string(incidents.size()) + " for " + label);
        cache_.set(cell.lat, cell.lon, month, incidents);
        return std::move(incidents);
    }

    std::vector<std::optional<IncidentList>> IncidentAggregator::fetchMonthTiles(const std::vector<Tile>& tiles,
                                                                                 const std::string& month) {
        std::vector<std::optional<IncidentList>> results;
        results.reserve(tiles.size());

        auto fetchTile = [this, &month](const Tile& tile) {
            SpatialSelector selector;
            selector.tile = tile;
            std::string label = "tile " + (tile.name.empty() ? formatPolyString(tile.ring) : tile.name);
            return fetchCell(selector, tileCentroid(tile), label, month);
        };

        if (!options_.parallelTiles || tiles.size() < 2) {
            for (const auto& tile : tiles) {
                results.push_back(fetchTile(tile));
            }
            return results;
        }

        // Launch all tiles, then collect in configured order so the merge stays canonical
        std::vector<std::future<std::optional<IncidentList>>> pending;
        pending.reserve(tiles.size());
        for (const auto& tile : tiles) {
            pending.push_back(std::async(std::launch::async, fetchTile, std::cref(tile)));
        }
        for (auto& future : pending) {
            results.push_back(future.get());
        }
        return results;
    }

    AggregationResult IncidentAggregator::fetchWindow(int monthsBack, const std::vector<Tile>& tiles,
                                                      const MonthAnchor& anchor) {
        if (monthsBack < 1) {
            throw std::invalid_argument("fetchWindow: monthsBack must be at least 1, got " + std::to_string(monthsBack));
        }
        if (tiles.empty()) {
            throw std::invalid_argument("fetchWindow: no tiles configured");
        }

        AggregationResult result;
        result.monthsUsed.reserve(static_cast<size_t>(monthsBack));

        for (int back = 0; back < monthsBack; ++back) {
            std::string month = isoMonth(anchor, back);

            size_t month_total = 0;
            for (auto& chunk : fetchMonthTiles(tiles, month)) {
                if (!chunk) continue;
                month_total += chunk->size();
                result.incidents.insert(result.incidents.end(),
                    std::make_move_iterator(chunk->begin()), std::make_move_iterator(chunk->end()));
            }

            // Attempted months are reported even when every tile failed
            result.monthsUsed.push_back(month);
            logInfo("Month " + month + ": " + std::to_string(month_total) + " incidents across "
                + std::to_string(tiles.size()) + " tiles");
        }
        return result;
    }

    MonthSnapshot IncidentAggregator::fetchFirstNonEmptyMonth(PointLatLon point, const MonthAnchor& anchor, int window) {
        if (window < 1) {
            throw std::invalid_argument("fetchFirstNonEmptyMonth: window must be at least 1, got " + std::to_string(window));
        }

        SpatialSelector selector;
        selector.point = point;
        std::string label = "point " + pointLabel(point);

        for (int back = 0; back < window; ++back) {
            std::string month = isoMonth(anchor, back);
            auto incidents = fetchCell(selector, point, label, month);
            if (incidents && !incidents->empty()) {
                return MonthSnapshot{ month, std::move(*incidents) };
            }
        }
        return MonthSnapshot{ isoMonth(anchor, window - 1), {} };
    }

    AggregationResult IncidentAggregator::fetchPointWindow(PointLatLon point, int monthsBack, const MonthAnchor& anchor) {
        if (monthsBack < 1) {
            throw std::invalid_argument("fetchPointWindow: monthsBack must be at least 1, got " + std::to_string(monthsBack));
        }

        SpatialSelector selector;
        selector.point = point;
        std::string label = "point " + pointLabel(point);

        AggregationResult result;
        for (int back = 0; back < monthsBack; ++back) {
            std::string month = isoMonth(anchor, back);
            auto incidents = fetchCell(selector, point, label, month);
            if (!incidents || incidents->empty()) continue;

            result.monthsUsed.push_back(month);
            result.incidents.insert(result.incidents.end(),
                std::make_move_iterator(incidents->begin()), std::make_move_iterator(incidents->end()));
        }
        return result;
    }

} // namespace IncidentFetching
