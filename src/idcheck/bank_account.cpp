#include "bank_account.hpp"
#include "check_digits.hpp"
#include <cctype>

namespace duckdb {
namespace esid {
namespace idcheck {

bool BankAccountValidator::ReadDigits(const std::string& raw, size_t& pos, size_t count, std::string& out) {
    if (pos + count > raw.length()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; i++) {
        if (!std::isdigit(static_cast<unsigned char>(raw[i]))) {
            return false;
        }
    }
    out = raw.substr(pos, count);
    pos += count;
    return true;
}

void BankAccountValidator::SkipSeparator(const std::string& raw, size_t& pos) {
    if (pos < raw.length() && (raw[pos] == ' ' || raw[pos] == '-')) {
        pos++;
    }
}

bool BankAccountValidator::Parse(const std::string& raw, CccFields& fields) {
    size_t pos = 0;

    if (!ReadDigits(raw, pos, 4, fields.entity)) {
        return false;
    }
    SkipSeparator(raw, pos);
    if (!ReadDigits(raw, pos, 4, fields.office)) {
        return false;
    }
    SkipSeparator(raw, pos);
    if (!ReadDigits(raw, pos, 2, fields.check_digits)) {
        return false;
    }
    SkipSeparator(raw, pos);
    if (!ReadDigits(raw, pos, 10, fields.account)) {
        return false;
    }

    return pos == raw.length();
}

std::string BankAccountValidator::ComputeCheckDigits(const std::string& entity, const std::string& office,
                                                     const std::string& account) {
    std::string result;
    result += static_cast<char>('0' + CheckDigits::CccDigit("00" + entity + office));
    result += static_cast<char>('0' + CheckDigits::CccDigit(account));
    return result;
}

ValidationResult BankAccountValidator::Validate(const std::string& raw) {
    if (raw.empty()) {
        return ValidationResult::Success(std::string());
    }

    CccFields fields;
    if (!Parse(raw, fields)) {
        return ValidationResult::Failure(ValidationError::INVALID);
    }

    // Compared as text so a leading zero in the check digits counts
    if (ComputeCheckDigits(fields.entity, fields.office, fields.account) != fields.check_digits) {
        return ValidationResult::Failure(ValidationError::CHECKSUM);
    }

    return ValidationResult::Success(fields.Joined());
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
