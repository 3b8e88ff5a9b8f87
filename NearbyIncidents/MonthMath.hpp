// File: MonthMath.hpp
#ifndef MONTH_MATH_HPP
#define MONTH_MATH_HPP

#include <ctime>
#include <string>

namespace IncidentFetching {

    /** @brief A calendar month; month is 1..12. */
    struct MonthAnchor {
        int year = 1970;
        int month = 1;
    };

    /** @brief Calendar month of the given instant, in UTC. */
    MonthAnchor monthAnchorFromTime(std::time_t t);

    /** @brief Calendar month of the current instant, in UTC. */
    MonthAnchor currentMonthAnchor();

    /**
     * @brief ISO "YYYY-MM" of the month that lies `back` whole months before anchor.
     *        back == 0 yields the anchor month itself.
     */
    std::string isoMonth(const MonthAnchor& anchor, int back = 0);

    /**
     * @brief "2025-06" -> "June 2025". Input that is not a valid ISO month is
     *        returned unchanged.
     */
    std::string humanMonth(const std::string& iso);

} // namespace IncidentFetching

#endif // MONTH_MATH_HPP
