#pragma once

#include "duckdb.hpp"

namespace duckdb {
namespace esid {

// Register CCC (Spanish bank account code) validation functions
void RegisterBankAccountValidationFunctions(ExtensionLoader &loader);

} // namespace esid
} // namespace duckdb
