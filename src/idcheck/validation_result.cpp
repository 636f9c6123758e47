#include "validation_result.hpp"

namespace duckdb {
namespace esid {
namespace idcheck {

const char* ValidationErrorCode(ValidationError error) {
    switch (error) {
        case ValidationError::OK:               return "OK";
        case ValidationError::INVALID:          return "invalid";
        case ValidationError::INVALID_ONLY_NIF: return "invalid_only_nif";
        case ValidationError::INVALID_NIF:      return "invalid_nif";
        case ValidationError::INVALID_NIE:      return "invalid_nie";
        case ValidationError::INVALID_CIF:      return "invalid_cif";
        case ValidationError::CHECKSUM:         return "checksum";
    }
    return "UNKNOWN";
}

const char* ValidationErrorMessage(ValidatorKind kind, ValidationError error) {
    switch (kind) {
        case ValidatorKind::POSTAL_CODE:
            if (error == ValidationError::INVALID) {
                return "Enter a valid postal code in the range and format 01XXX - 52XXX.";
            }
            break;
        case ValidatorKind::PHONE_NUMBER:
            if (error == ValidationError::INVALID) {
                return "Enter a valid phone number in one of the formats 6XXXXXXXX, 8XXXXXXXX or 9XXXXXXXX.";
            }
            break;
        case ValidatorKind::IDENTITY_CARD:
            switch (error) {
                case ValidationError::INVALID:          return "Please enter a valid NIF, NIE, or CIF.";
                case ValidationError::INVALID_ONLY_NIF: return "Please enter a valid NIF or NIE.";
                case ValidationError::INVALID_NIF:      return "Invalid checksum for NIF.";
                case ValidationError::INVALID_NIE:      return "Invalid checksum for NIE.";
                case ValidationError::INVALID_CIF:      return "Invalid checksum for CIF.";
                default:                                break;
            }
            break;
        case ValidatorKind::BANK_ACCOUNT:
            if (error == ValidationError::INVALID) {
                return "Please enter a valid bank account number in format XXXX-XXXX-XX-XXXXXXXXXX.";
            }
            if (error == ValidationError::CHECKSUM) {
                return "Invalid checksum for bank account number.";
            }
            break;
    }
    return "";
}

const char* IdentifierClassName(IdentifierClass id_class) {
    switch (id_class) {
        case IdentifierClass::NIF:     return "NIF";
        case IdentifierClass::NIE:     return "NIE";
        case IdentifierClass::CIF:     return "CIF";
        case IdentifierClass::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
