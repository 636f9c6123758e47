#include "pattern_validators.hpp"
#include <algorithm>
#include <cctype>

namespace duckdb {
namespace esid {
namespace idcheck {

static bool all_digits(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

ValidationResult PostalCodeValidator::Validate(const std::string& raw) {
    if (raw.length() != 5 || !all_digits(raw)) {
        return ValidationResult::Failure(ValidationError::INVALID);
    }

    int province = (raw[0] - '0') * 10 + (raw[1] - '0');
    if (province < 1 || province > 52) {
        return ValidationResult::Failure(ValidationError::INVALID);
    }

    return ValidationResult::Success(raw);
}

ValidationResult PhoneNumberValidator::Validate(const std::string& raw) {
    if (raw.length() != 9 || !all_digits(raw)) {
        return ValidationResult::Failure(ValidationError::INVALID);
    }

    if (raw[0] < '6') {
        return ValidationResult::Failure(ValidationError::INVALID);
    }

    return ValidationResult::Success(raw);
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
