#pragma once

#include <string>
#include <vector>

namespace duckdb {
namespace esid {
namespace idcheck {

// Province, keyed by the two leading digits of its postal codes
struct Province {
    std::string code;         // "01" - "52"
    std::string name;
    std::string region_code;  // Autonomous community or city
};

// Autonomous community or autonomous city
struct Region {
    std::string code;         // e.g. "AN", "M"
    std::string name;
};

// Static province and region tables
class ProvinceTable {
public:
    // All 52 provinces, ordered by code
    static const std::vector<Province>& Provinces();

    // All regions, ordered as the official list
    static const std::vector<Region>& Regions();

    // Look up a province by its two digit code
    static bool FindProvince(const std::string& code, Province& province);

    // Look up the province of a valid postal code.
    // Returns false if the postal code itself is invalid.
    static bool ProvinceForPostalCode(const std::string& postal_code, Province& province);

    // Look up a region by code
    static bool FindRegion(const std::string& code, Region& region);
};

} // namespace idcheck
} // namespace esid
} // namespace duckdb
