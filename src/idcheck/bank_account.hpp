#pragma once

#include "validation_result.hpp"
#include <string>

namespace duckdb {
namespace esid {
namespace idcheck {

// Fixed-width fields of a Spanish bank account code
struct CccFields {
    std::string entity;        // 4 digits
    std::string office;        // 4 digits
    std::string check_digits;  // 2 digits
    std::string account;       // 10 digits

    std::string Joined() const { return entity + office + check_digits + account; }
};

// Spanish bank account (CCC, Codigo Cuenta Cliente) validator.
//
// Format EEEE-OOOO-CC-AAAAAAAAAA (entity, office, check digits, account).
// A single space or hyphen may separate each field, or nothing at all.
// The first check digit covers "00" + entity + office, the second one
// covers the account.
class BankAccountValidator {
public:
    // Empty input is valid. On success the value is the 20 digits without
    // separators.
    static ValidationResult Validate(const std::string& raw);

    // Structural split only, no checksum
    static bool Parse(const std::string& raw, CccFields& fields);

    // Expected two check digits for the given fields
    static std::string ComputeCheckDigits(const std::string& entity, const std::string& office,
                                          const std::string& account);

private:
    static bool ReadDigits(const std::string& raw, size_t& pos, size_t count, std::string& out);
    static void SkipSeparator(const std::string& raw, size_t& pos);
};

} // namespace idcheck
} // namespace esid
} // namespace duckdb
