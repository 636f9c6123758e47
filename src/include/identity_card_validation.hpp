#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace esid {

// Register NIF/NIE/CIF validation functions
void RegisterIdentityCardValidationFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
