// File: SummaryReport.cpp

#include "SummaryReport.hpp"
#include "Logging.hpp"
#include "MonthMath.hpp"

#include "json.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace IncidentFetching {

    std::string headline(const NearbyResult& result) {
        std::stringstream ss;
        ss << result.totals.total << " reports in " << result.placeName
            << ", data from " << humanMonth(result.headlineMonth);
        return ss.str();
    }

    void printSummary(std::ostream& out, const NearbyResult& result) {
        out << headline(result) << "\n";
        out << "  Serious: " << result.totals.serious << " of " << result.totals.total << "\n";
        out << std::fixed << std::setprecision(4)
            << "  Anchor: " << result.resolvedCoordinate.lat << ", " << result.resolvedCoordinate.lon
            << std::setprecision(0) << " (" << result.distanceFromCentreMeters << " m from centre)\n";

        out << "  Months:";
        for (const auto& month : result.aggregation.monthsUsed) {
            out << " " << month;
        }
        out << "\n";

        for (const auto& entry : result.byCategory) {
            out << "  " << std::left << std::setw(24) << entry.category << std::right << entry.count << "\n";
        }
        if (result.windowFailed) {
            out << "  (incident data unavailable)\n";
        }
        out.flush();
    }

    std::string summaryJson(const NearbyResult& result) {
        json::JSON root = json::Object();

        root["place"] = result.placeName;
        root["headlineMonth"] = result.headlineMonth;
        root["windowFailed"] = result.windowFailed;

        json::JSON anchor = json::Object();
        anchor["lat"] = result.resolvedCoordinate.lat;
        anchor["lon"] = result.resolvedCoordinate.lon;
        root["anchor"] = anchor;
        root["radiusMeters"] = result.viewRadiusMeters;

        json::JSON months = json::Array();
        for (const auto& month : result.aggregation.monthsUsed) {
            months.append(month);
        }
        root["months"] = months;

        json::JSON totals = json::Object();
        totals["total"] = static_cast<long>(result.totals.total); // SimpleJSON stores integrals as long
        totals["serious"] = static_cast<long>(result.totals.serious);
        root["totals"] = totals;

        json::JSON categories = json::Array();
        for (const auto& entry : result.byCategory) {
            json::JSON item = json::Object();
            item["category"] = entry.category;
            item["count"] = static_cast<long>(entry.count);
            categories.append(item);
        }
        root["categories"] = categories;

        return root.dump();
    }

    std::optional<std::string> saveSummaryJson(const std::string& filenamePrefix, const NearbyResult& result) {
        auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm now_tm{};
#if defined(_WIN32)
        localtime_s(&now_tm, &now_c);
#else
        localtime_r(&now_c, &now_tm);
#endif
        std::stringstream ss_filename;
        ss_filename << filenamePrefix << "_" << std::put_time(&now_tm, "%Y%m%d_%H%M%S") << ".json";
        std::string filename = ss_filename.str();

        std::ofstream file(filename);
        if (!file.is_open()) {
            logError("Could not open summary file for writing: '" + filename + "'");
            return std::nullopt;
        }
        file << summaryJson(result);
        file.close();
        if (file.fail()) {
            logError("Failed to write summary file: '" + filename + "'");
            return std::nullopt;
        }
        logInfo("Saved summary to " + filename);
        return filename;
    }

} // namespace IncidentFetching
