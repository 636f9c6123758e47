#include "provinces.hpp"
#include "pattern_validators.hpp"

namespace duckdb {
namespace esid {
namespace idcheck {

const std::vector<Province>& ProvinceTable::Provinces() {
    static const std::vector<Province> provinces = {
        {"01", "Araba", "PV"},        {"02", "Albacete", "CM"},      {"03", "Alacant", "VC"},
        {"04", "Almeria", "AN"},      {"05", "Avila", "CL"},         {"06", "Badajoz", "EX"},
        {"07", "Illes Balears", "IB"}, {"08", "Barcelona", "CT"},    {"09", "Burgos", "CL"},
        {"10", "Caceres", "EX"},      {"11", "Cadiz", "AN"},         {"12", "Castello", "VC"},
        {"13", "Ciudad Real", "CM"},  {"14", "Cordoba", "AN"},       {"15", "A Coruna", "GA"},
        {"16", "Cuenca", "CM"},       {"17", "Girona", "CT"},        {"18", "Granada", "AN"},
        {"19", "Guadalajara", "CM"},  {"20", "Gipuzkoa", "PV"},      {"21", "Huelva", "AN"},
        {"22", "Huesca", "AR"},       {"23", "Jaen", "AN"},          {"24", "Leon", "CL"},
        {"25", "Lleida", "CT"},       {"26", "La Rioja", "LO"},      {"27", "Lugo", "GA"},
        {"28", "Madrid", "M"},        {"29", "Malaga", "AN"},        {"30", "Murcia", "MU"},
        {"31", "Navarre", "NA"},      {"32", "Ourense", "GA"},       {"33", "Asturias", "O"},
        {"34", "Palencia", "CL"},     {"35", "Las Palmas", "CN"},    {"36", "Pontevedra", "GA"},
        {"37", "Salamanca", "CL"},    {"38", "Santa Cruz de Tenerife", "CN"},
        {"39", "Cantabria", "S"},     {"40", "Segovia", "CL"},       {"41", "Seville", "AN"},
        {"42", "Soria", "CL"},        {"43", "Tarragona", "CT"},     {"44", "Teruel", "AR"},
        {"45", "Toledo", "CM"},       {"46", "Valencia", "VC"},      {"47", "Valladolid", "CL"},
        {"48", "Bizkaia", "PV"},      {"49", "Zamora", "CL"},        {"50", "Zaragoza", "AR"},
        {"51", "Ceuta", "CE"},        {"52", "Melilla", "ML"}
    };
    return provinces;
}

const std::vector<Region>& ProvinceTable::Regions() {
    static const std::vector<Region> regions = {
        {"AN", "Andalusia"},
        {"AR", "Aragon"},
        {"O", "Principality of Asturias"},
        {"IB", "Balearic Islands"},
        {"PV", "Basque Country"},
        {"CN", "Canary Islands"},
        {"S", "Cantabria"},
        {"CM", "Castile-La Mancha"},
        {"CL", "Castile and Leon"},
        {"CT", "Catalonia"},
        {"EX", "Extremadura"},
        {"GA", "Galicia"},
        {"LO", "La Rioja"},
        {"M", "Madrid"},
        {"MU", "Region of Murcia"},
        {"NA", "Foral Community of Navarre"},
        {"VC", "Valencian Community"},
        // Autonomous cities
        {"CE", "Ceuta"},
        {"ML", "Melilla"}
    };
    return regions;
}

bool ProvinceTable::FindProvince(const std::string& code, Province& province) {
    for (const auto& entry : Provinces()) {
        if (entry.code == code) {
            province = entry;
            return true;
        }
    }
    return false;
}

bool ProvinceTable::ProvinceForPostalCode(const std::string& postal_code, Province& province) {
    if (!PostalCodeValidator::Validate(postal_code).IsValid()) {
        return false;
    }
    return FindProvince(postal_code.substr(0, 2), province);
}

bool ProvinceTable::FindRegion(const std::string& code, Region& region) {
    for (const auto& entry : Regions()) {
        if (entry.code == code) {
            region = entry;
            return true;
        }
    }
    return false;
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
