// tests/test_month_math.cpp

#include <iostream>
#include <string>

#include "MonthMath.hpp"

using namespace IncidentFetching;

int main() {
    MonthAnchor june{ 2025, 6 };
    if (isoMonth(june) != "2025-06" || isoMonth(june, 5) != "2025-01") {
        std::cerr << "isoMonth within a year mismatch\n";
        return 1;
    }
    if (isoMonth(MonthAnchor{ 2025, 1 }, 1) != "2024-12" || isoMonth(MonthAnchor{ 2025, 3 }, 14) != "2024-01") {
        std::cerr << "isoMonth year carry mismatch: " << isoMonth(MonthAnchor{ 2025, 3 }, 14) << "\n";
        return 2;
    }
    if (isoMonth(MonthAnchor{ 2025, 12 }, 24) != "2023-12") {
        std::cerr << "isoMonth two-year step mismatch\n";
        return 3;
    }

    MonthAnchor epoch = monthAnchorFromTime(0);
    if (epoch.year != 1970 || epoch.month != 1) {
        std::cerr << "epoch anchor mismatch\n";
        return 4;
    }
    MonthAnchor mid_2024 = monthAnchorFromTime(1718000000); // 2024-06-10 UTC
    if (mid_2024.year != 2024 || mid_2024.month != 6) {
        std::cerr << "2024-06 anchor mismatch\n";
        return 5;
    }

    if (humanMonth("2025-06") != "June 2025" || humanMonth("2024-12") != "December 2024") {
        std::cerr << "humanMonth mismatch: " << humanMonth("2025-06") << "\n";
        return 6;
    }
    if (humanMonth("----") != "----" || humanMonth("2025-13") != "2025-13" || humanMonth("20a5-06") != "20a5-06") {
        std::cerr << "humanMonth should pass invalid input through\n";
        return 7;
    }

    std::cout << "test_month_math: OK\n";
    return 0;
}
