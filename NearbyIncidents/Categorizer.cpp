// File: Categorizer.cpp

#include "Categorizer.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>

namespace IncidentFetching {

    const std::map<std::string, GroupSpec>& categoryMapping() {
        static const std::map<std::string, GroupSpec> mapping = {
            // Robbery
            { "robbery",               { "Robbery", true } },
            { "theft-from-the-person", { "Robbery", true } },

            // Theft & Shoplifting
            { "bicycle-theft",         { "Theft & Shoplifting", false } },
            { "shoplifting",           { "Theft & Shoplifting", false } },

            { "vehicle-crime",         { "Vehicle crime", false } },

            { "violent-crime",         { "Violence", true } },

            { "other-crime",           { "Other", false } },
            { "other-theft",           { "Other", false } },

            // Public order
            { "public-order",          { "Public order", false } },
            { "anti-social-behaviour", { "Public order", false } },

            // Drugs & Weapons
            { "drugs",                 { "Drugs & Weapons", true } },
            { "possession-of-weapons", { "Drugs & Weapons", true } },

            // Burglary & Arson
            { "burglary",              { "Burglary & Arson", false } },
            { "criminal-damage-arson", { "Burglary & Arson", false } }
        };
        return mapping;
    }

    std::string fallbackDisplayName(const std::string& rawCategory) {
        std::string name;
        name.reserve(rawCategory.size());
        bool word_start = true;
        for (char raw : rawCategory) {
            char c = (raw == '-' || raw == '_') ? ' ' : raw;
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isspace(uc)) {
                name.push_back(c);
                word_start = true;
                continue;
            }
            name.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
            word_start = false;
        }
        return name;
    }

    std::string displayGroupFor(const std::string& rawCategory) {
        const auto& mapping = categoryMapping();
        auto it = mapping.find(rawCategory);
        if (it != mapping.end()) {
            return it->second.name;
        }
        return fallbackDisplayName(rawCategory);
    }

    bool isSeriousGroup(const std::string& displayName) {
        static const std::set<std::string> serious_groups = { "Robbery", "Violence", "Drugs & Weapons" };
        return serious_groups.count(displayName) > 0;
    }

    bool isSeriousCategory(const std::string& rawCategory) {
        const auto& mapping = categoryMapping();
        auto it = mapping.find(rawCategory);
        if (it != mapping.end()) {
            return it->second.isSerious;
        }
        return isSeriousGroup(fallbackDisplayName(rawCategory));
    }

    std::vector<CategoryCount> groupCounts(const IncidentList& incidents) {
        std::vector<CategoryCount> buckets;
        std::unordered_map<std::string, size_t> bucket_index;

        for (const auto& incident : incidents) {
            std::string group = displayGroupFor(incident.category);
            auto it = bucket_index.find(group);
            if (it == bucket_index.end()) {
                bucket_index.emplace(group, buckets.size());
                buckets.push_back(CategoryCount{ group, 1 });
            }
            else {
                buckets[it->second].count += 1;
            }
        }

        std::stable_sort(buckets.begin(), buckets.end(),
            [](const CategoryCount& a, const CategoryCount& b) { return a.count > b.count; });
        return buckets;
    }

    Totals totalAndSerious(const IncidentList& incidents) {
        Totals totals;
        totals.total = static_cast<int>(incidents.size());
        for (const auto& incident : incidents) {
            if (isSeriousCategory(incident.category)) {
                totals.serious += 1;
            }
        }
        return totals;
    }

} // namespace IncidentFetching
