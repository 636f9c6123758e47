#include "check_digits.hpp"
#include <cstring>

namespace duckdb {
namespace esid {
namespace idcheck {

const char CheckDigits::NIF_CONTROL[24] = "TRWAGMYFPDXBNJZSQVHLCKE";
const char CheckDigits::CIF_CONTROL[11] = "JABCDEFGHI";
const char CheckDigits::CIF_TYPES[16] = "ABCDEFGHKLMNPQS";
const char CheckDigits::NIE_TYPES[3] = "XT";

const int CheckDigits::CCC_WEIGHTS[10] = {1, 2, 4, 8, 5, 10, 9, 7, 3, 6};

// ======================================================================
// Modulus 23 (NIF/NIE control letter)
// ======================================================================
int CheckDigits::Mod23(const std::string& digits) {
    int remainder = 0;
    for (char c : digits) {
        remainder = (remainder * 10 + (c - '0')) % 23;
    }
    return remainder;
}

char CheckDigits::NifLetter(const std::string& digits) {
    return NIF_CONTROL[Mod23(digits)];
}

// ======================================================================
// CIF check digit, Modulus 10 with cross-sum on even positions
// ======================================================================
int CheckDigits::CifDigit(const std::string& body) {
    int odd_sum = 0;
    int even_sum = 0;

    for (size_t i = 0; i < body.length(); i++) {
        int digit = body[i] - '0';
        if (i % 2) {
            odd_sum += digit;
        } else {
            // Cross-sum of the doubled digit: 7 -> 14 -> 1+4=5
            int doubled = digit * 2;
            even_sum += (doubled / 10) + (doubled % 10);
        }
    }

    return (10 - ((odd_sum + even_sum) % 10)) % 10;
}

// ======================================================================
// CCC check digit, Modulus 11 with weights 1, 2, 4, 8, 5, 10, 9, 7, 3, 6
// ======================================================================
int CheckDigits::CccDigit(const std::string& ten_digits) {
    int sum = 0;
    for (int i = 0; i < 10; i++) {
        sum += (ten_digits[i] - '0') * CCC_WEIGHTS[i];
    }

    int check_digit = 11 - (sum % 11);
    if (check_digit == 10) {
        return 1;
    }
    if (check_digit == 11) {
        return 0;
    }
    return check_digit;
}

bool CheckDigits::IsCifType(char c) {
    return c != '\0' && std::strchr(CIF_TYPES, c) != nullptr;
}

bool CheckDigits::IsNieType(char c) {
    return c != '\0' && std::strchr(NIE_TYPES, c) != nullptr;
}

bool CheckDigits::IsControlLetter(char c) {
    return c != '\0' && (std::strchr(NIF_CONTROL, c) != nullptr || std::strchr(CIF_CONTROL, c) != nullptr);
}

} // namespace idcheck
} // namespace esid
} // namespace duckdb
