// File: Categorizer.hpp
#ifndef CATEGORIZER_HPP
#define CATEGORIZER_HPP

#include "IncidentFetchingCommon.hpp"

#include <map>
#include <string>
#include <vector>

namespace IncidentFetching {

    /** @brief Display group and severity of a raw source category. */
    struct GroupSpec {
        std::string name;
        bool isSerious = false;
    };

    /** @brief Fixed raw-category -> display-group table. */
    const std::map<std::string, GroupSpec>& categoryMapping();

    /**
     * @brief Display name for an unmapped raw category: hyphens and underscores
     *        become spaces and each word is capitalised ("bogus-made-up" -> "Bogus Made Up").
     */
    std::string fallbackDisplayName(const std::string& rawCategory);

    /** @brief Mapped group name, or the fallback display name if unmapped. */
    std::string displayGroupFor(const std::string& rawCategory);

    /** @brief Membership in the fixed serious-groups set (Robbery, Violence, Drugs & Weapons). */
    bool isSeriousGroup(const std::string& displayName);

    /** @brief Mapped severity, or serious-group membership of the fallback name. */
    bool isSeriousCategory(const std::string& rawCategory);

    /**
     * @brief Counts per display group, sorted by count descending. Groups with
     *        equal counts keep the order in which they were first seen.
     */
    std::vector<CategoryCount> groupCounts(const IncidentList& incidents);

    Totals totalAndSerious(const IncidentList& incidents);

} // namespace IncidentFetching

#endif // CATEGORIZER_HPP
