#include "identity_card.hpp"
#include "check_digits.hpp"
#include <cctype>

namespace duckdb {
namespace esid {
namespace idcheck {

std::string IdentityCardValidator::Normalize(const std::string& raw) {
    std::string result;
    result.reserve(raw.length());

    for (char c : raw) {
        if (c == ' ' || c == '-') {
            continue;
        }
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    return result;
}

bool IdentityCardValidator::Parse(const std::string& normalized, ParsedIdentifier& parsed) {
    parsed = ParsedIdentifier();
    size_t pos = 0;

    // Optional leading type letter
    if (pos < normalized.length() &&
        (CheckDigits::IsCifType(normalized[pos]) || CheckDigits::IsNieType(normalized[pos]))) {
        parsed.prefix_letter = normalized[pos];
        pos++;
    }

    // One or more digits
    size_t digits_start = pos;
    while (pos < normalized.length() && std::isdigit(static_cast<unsigned char>(normalized[pos]))) {
        pos++;
    }
    if (pos == digits_start) {
        return false;
    }
    parsed.digits = normalized.substr(digits_start, pos - digits_start);

    // Optional trailing control letter
    if (pos < normalized.length() && CheckDigits::IsControlLetter(normalized[pos])) {
        parsed.suffix = normalized[pos];
        pos++;
    }

    return pos == normalized.length();
}

ValidationResult IdentityCardValidator::Validate(const std::string& raw, bool only_nif_nie) {
    IdentifierClass id_class;
    return Validate(raw, only_nif_nie, id_class);
}

ValidationResult IdentityCardValidator::Validate(const std::string& raw, bool only_nif_nie,
                                                 IdentifierClass& id_class) {
    id_class = IdentifierClass::UNKNOWN;

    if (raw.empty()) {
        return ValidationResult::Success(std::string());
    }

    const ValidationError shape_error =
        only_nif_nie ? ValidationError::INVALID_ONLY_NIF : ValidationError::INVALID;

    std::string value = Normalize(raw);
    ParsedIdentifier parsed;
    if (!Parse(value, parsed)) {
        return ValidationResult::Failure(shape_error);
    }

    // Order matters: CIF and NIE letters overlap with valid positions
    if (!parsed.HasPrefix() && parsed.HasSuffix()) {
        id_class = IdentifierClass::NIF;
        if (parsed.suffix != CheckDigits::NifLetter(parsed.digits)) {
            return ValidationResult::Failure(ValidationError::INVALID_NIF);
        }
        return ValidationResult::Success(value);
    }

    if (CheckDigits::IsNieType(parsed.prefix_letter) && parsed.HasSuffix()) {
        id_class = IdentifierClass::NIE;
        if (parsed.suffix != CheckDigits::NifLetter(parsed.digits)) {
            return ValidationResult::Failure(ValidationError::INVALID_NIE);
        }
        return ValidationResult::Success(value);
    }

    if (!only_nif_nie && CheckDigits::IsCifType(parsed.prefix_letter) &&
        (parsed.digits.length() == 7 || parsed.digits.length() == 8)) {
        id_class = IdentifierClass::CIF;
        ValidationError error = CheckCif(parsed);
        if (error != ValidationError::OK) {
            return ValidationResult::Failure(error);
        }
        return ValidationResult::Success(value);
    }

    return ValidationResult::Failure(shape_error);
}

ValidationError IdentityCardValidator::CheckCif(const ParsedIdentifier& parsed) {
    std::string body = parsed.digits;
    char control = parsed.suffix;

    // Without a trailing letter the last digit is the control digit
    if (!parsed.HasSuffix()) {
        control = body.back();
        body.pop_back();
    }

    int check_digit = CheckDigits::CifDigit(body);
    if (control == static_cast<char>('0' + check_digit) || control == CheckDigits::CIF_CONTROL[check_digit]) {
        return ValidationError::OK;
    }
    return ValidationError::INVALID_CIF;
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
