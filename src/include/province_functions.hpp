#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace esid {

// Register esid_provinces() and esid_regions() table functions
void RegisterProvinceFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
