// tests/test_incident_parser.cpp
// Field fallbacks when decoding source responses.

#include <iostream>
#include <string>

#include "IncidentParser.hpp"

using namespace IncidentFetching;

int main() {
    const std::string body = R"([
        {"category":"violent-crime","persistent_id":"abc123","month":"2025-06",
         "location":{"latitude":"53.479412","longitude":"-2.245321","street":{"id":1234,"name":"On or near Market Street"}},
         "id":116208998},
        {"category":"burglary","id":"","persistent_id":"pid-2","month":"2025-06",
         "location":{"latitude":"53.48","longitude":"-2.24"}},
        {"location":{"latitude":"not-a-number","longitude":"-2.24"}},
        {"id":"s-4","category":"drugs"}
    ])";

    auto incidents = parseIncidentList(body);
    if (!incidents || incidents->size() != 4) {
        std::cerr << "expected 4 incidents\n";
        return 1;
    }
    const IncidentList& list = *incidents;

    // Integer id, street and coordinates
    if (list[0].id != "116208998" || list[0].category != "violent-crime" || list[0].month != "2025-06") {
        std::cerr << "first incident fields mismatch: id=" << list[0].id << "\n";
        return 2;
    }
    if (list[0].location.lat != 53.479412 || list[0].location.lon != -2.245321 ||
        !list[0].street || !list[0].street->id || *list[0].street->id != 1234 ||
        !list[0].street->name || *list[0].street->name != "On or near Market Street") {
        std::cerr << "first incident location/street mismatch\n";
        return 3;
    }

    // Empty id falls back to persistent_id
    if (list[1].id != "pid-2" || list[1].street) {
        std::cerr << "persistent_id fallback mismatch: " << list[1].id << "\n";
        return 4;
    }

    // Unparsable latitude -> (0,0); missing category/month -> sentinels; record kept
    if (list[2].location.lat != 0.0 || list[2].location.lon != 0.0 ||
        list[2].category != "unknown" || list[2].month != "----" || list[2].id.empty()) {
        std::cerr << "bad-coordinate record fallbacks mismatch\n";
        return 5;
    }

    // No location at all -> (0,0)
    if (list[3].id != "s-4" || list[3].location.lat != 0.0 || list[3].location.lon != 0.0) {
        std::cerr << "missing location fallback mismatch\n";
        return 6;
    }

    // --- Synthetic identifiers are non-empty and distinct within a batch ---
    auto anonymous = parseIncidentList(R"([{"category":"drugs"},{"category":"drugs"}])");
    if (!anonymous || anonymous->size() != 2) {
        std::cerr << "anonymous batch failed to parse\n";
        return 7;
    }
    if ((*anonymous)[0].id.empty() || (*anonymous)[0].id == (*anonymous)[1].id) {
        std::cerr << "synthetic ids must be non-empty and distinct\n";
        return 8;
    }
    if ((*anonymous)[0].id.size() != 36) {
        std::cerr << "synthetic id format unexpected: " << (*anonymous)[0].id << "\n";
        return 9;
    }

    // --- Whole-body rejection ---
    auto empty = parseIncidentList("[]");
    if (!empty || !empty->empty()) {
        std::cerr << "empty array should parse to an empty list\n";
        return 10;
    }
    if (parseIncidentList("<html>Service Unavailable</html>") || parseIncidentList("{\"error\":\"x\"}") ||
        parseIncidentList("[1,2]") || parseIncidentList("")) {
        std::cerr << "malformed bodies should be rejected\n";
        return 11;
    }

    // --- Truncated bodies and trailing junk are rejected, never read as short lists ---
    const char* broken[] = {
        R"([{"id":"1"})",
        R"([{"category":"dru)",
        R"([] x)",
        R"([{"id":"1","category":"drugs"},])",
        R"([{"id":"1" "category":"drugs"}])",
        R"([{"id":"1","location":{"latitude":"53.4"})",
        R"(["\q"])"
    };
    for (const char* text : broken) {
        if (parseIncidentList(text)) {
            std::cerr << "ill-formed body accepted: " << text << "\n";
            return 13;
        }
    }
    auto spaced = parseIncidentList(" \n[ ]\n ");
    if (!spaced || !spaced->empty()) {
        std::cerr << "whitespace around an empty array should still parse\n";
        return 14;
    }

    // --- Escaped characters come back as raw text ---
    auto escaped = parseIncidentList(R"([{"id":"q\"1","category":"other\\crime","month":"2025-06",
        "location":{"latitude":"53.48","longitude":"-2.24","street":{"id":7,"name":"On or near \"The Crescent\""}}}])");
    if (!escaped || escaped->size() != 1) {
        std::cerr << "escaped body failed to parse\n";
        return 15;
    }
    const IncidentRecord& quoted = (*escaped)[0];
    if (quoted.id != "q\"1" || quoted.category != "other\\crime" ||
        !quoted.street || !quoted.street->name || *quoted.street->name != "On or near \"The Crescent\"") {
        std::cerr << "escaped fields not unescaped: id=" << quoted.id << " category=" << quoted.category << "\n";
        return 16;
    }

    // --- Excerpts are bounded ---
    std::string huge(5000, 'x');
    if (bodyExcerpt(huge).size() != kBodyExcerptLimit || bodyExcerpt("") != "[empty]") {
        std::cerr << "body excerpt not bounded\n";
        return 12;
    }

    std::cout << "test_incident_parser: OK\n";
    return 0;
}
