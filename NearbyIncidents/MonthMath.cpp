// File: MonthMath.cpp

#include "MonthMath.hpp"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace IncidentFetching {

    namespace {
        const char* const kMonthNames[12] = {
            "January", "February", "March", "April", "May", "June",
            "July", "August", "September", "October", "November", "December"
        };
    }

    MonthAnchor monthAnchorFromTime(std::time_t t) {
        std::tm utc{};
#if defined(_WIN32)
        gmtime_s(&utc, &t);
#else
        gmtime_r(&t, &utc);
#endif
        MonthAnchor anchor;
        anchor.year = utc.tm_year + 1900;
        anchor.month = utc.tm_mon + 1;
        return anchor;
    }

    MonthAnchor currentMonthAnchor() {
        return monthAnchorFromTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    }

    std::string isoMonth(const MonthAnchor& anchor, int back) {
        // Work in a zero-based month count so the year carry is a plain division
        long total = static_cast<long>(anchor.year) * 12 + (anchor.month - 1) - back;
        long year = total / 12;
        long month0 = total % 12;
        if (month0 < 0) {
            month0 += 12;
            year -= 1;
        }

        std::stringstream ss;
        ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << (month0 + 1);
        return ss.str();
    }

    std::string humanMonth(const std::string& iso) {
        if (iso.size() != 7 || iso[4] != '-') {
            return iso;
        }
        for (size_t i = 0; i < iso.size(); ++i) {
            if (i != 4 && !std::isdigit(static_cast<unsigned char>(iso[i]))) {
                return iso;
            }
        }
        int month = std::stoi(iso.substr(5, 2));
        if (month < 1 || month > 12) {
            return iso;
        }
        return std::string(kMonthNames[month - 1]) + " " + iso.substr(0, 4);
    }

} // namespace IncidentFetching
