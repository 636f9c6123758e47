#pragma once

#include "validation_result.hpp"
#include <string>

namespace duckdb {
namespace esid {
namespace idcheck {

// Spanish postal code: five digits, the first two (01-52) being the
// province code. Empty input is not special-cased.
class PostalCodeValidator {
public:
    static ValidationResult Validate(const std::string& raw);
};

// Spanish phone number: nine digits starting with 6 or 7 (mobile),
// 8 or 9 (landlines and special numbers). Information numbers are not
// accepted.
class PhoneNumberValidator {
public:
    static ValidationResult Validate(const std::string& raw);
};

} // namespace idcheck
} // namespace esid
} // namespace duckdb
