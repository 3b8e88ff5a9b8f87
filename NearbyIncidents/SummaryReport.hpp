// File: SummaryReport.hpp
#ifndef SUMMARY_REPORT_HPP
#define SUMMARY_REPORT_HPP

#include "IncidentFetchingCommon.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace IncidentFetching {

    /** @brief "<total> reports in <place>, data from <Month YYYY>" */
    std::string headline(const NearbyResult& result);

    /** @brief Prints the headline, serious count and category breakdown. */
    void printSummary(std::ostream& out, const NearbyResult& result);

    /** @brief Summary document: place, coordinate, months, totals, categories. */
    std::string summaryJson(const NearbyResult& result);

    /**
     * @brief Writes summaryJson to "<prefix>_<YYYYmmdd_HHMMSS>.json".
     * @return The written filename, or std::nullopt if the file could not be written.
     */
    std::optional<std::string> saveSummaryJson(const std::string& filenamePrefix, const NearbyResult& result);

} // namespace IncidentFetching

#endif // SUMMARY_REPORT_HPP
