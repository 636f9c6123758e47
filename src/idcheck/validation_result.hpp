#pragma once

#include <string>
#include <utility>

namespace duckdb {
namespace esid {
namespace idcheck {

// Result codes shared by all validators
enum class ValidationError {
    OK,                // Valid (or empty where the empty-pass convention applies)
    INVALID,           // No recognized structural pattern
    INVALID_ONLY_NIF,  // Structural failure while restricted to NIF/NIE
    INVALID_NIF,       // Well-formed NIF, wrong control letter
    INVALID_NIE,       // Well-formed NIE, wrong control letter
    INVALID_CIF,       // Well-formed CIF, wrong control character
    CHECKSUM           // Well-formed CCC, wrong check digits
};

// Validator a result came from; the 'invalid' wording differs per kind
enum class ValidatorKind {
    POSTAL_CODE,
    PHONE_NUMBER,
    IDENTITY_CARD,
    BANK_ACCOUNT
};

// Identifier class detected from the shape of an identity card number
enum class IdentifierClass {
    UNKNOWN,
    NIF,  // Individuals: 12345678Z
    NIE,  // Foreigners: X1234567L
    CIF   // Companies: A58818501
};

struct ValidationResult {
    ValidationError error;
    std::string value;  // Normalized value, only meaningful when error == OK

    ValidationResult() : error(ValidationError::OK) {}
    ValidationResult(ValidationError error_p, std::string value_p)
        : error(error_p), value(std::move(value_p)) {}

    bool IsValid() const { return error == ValidationError::OK; }

    static ValidationResult Success(std::string value) {
        return ValidationResult(ValidationError::OK, std::move(value));
    }
    static ValidationResult Failure(ValidationError error) {
        return ValidationResult(error, std::string());
    }
};

// Stable lower-case code ("invalid_nif", ...); "OK" for success
const char* ValidationErrorCode(ValidationError error);

// Default English message for a code raised by the given validator.
// Empty for OK and for codes the validator never raises. Localization
// happens elsewhere.
const char* ValidationErrorMessage(ValidatorKind kind, ValidationError error);

// "NIF", "NIE", "CIF" or "UNKNOWN"
const char* IdentifierClassName(IdentifierClass id_class);

} // namespace idcheck
} // namespace esid
} // namespace duckdb
