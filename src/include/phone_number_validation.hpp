#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace esid {

// Register phone number validation functions
void RegisterPhoneNumberValidationFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
