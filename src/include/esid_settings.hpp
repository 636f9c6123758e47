#pragma once

#include "duckdb.hpp"
#include <string>

namespace duckdb {
namespace esid {

// Default for the only_nif_nie flag when identity card functions are
// called without it
bool GetDefaultOnlyNifNie();
void SetDefaultOnlyNifNie(bool only_nif_nie);

// Read ESID_ONLY_NIF_NIE from the environment, if set
void LoadSettingsFromEnvironment();

// Accepts 1/true/yes/on and 0/false/no/off, case-insensitive
bool ParseBooleanSetting(const std::string& value, bool& out_result);

// Register esid_set_only_nif_nie / esid_get_only_nif_nie
void RegisterSettingsFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
