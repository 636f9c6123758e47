#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace esid {

// Register postal code validation functions
void RegisterPostalCodeValidationFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
