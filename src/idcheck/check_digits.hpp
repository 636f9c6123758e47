#pragma once

#include <string>

namespace duckdb {
namespace esid {
namespace idcheck {

// Control character computations for Spanish identifiers.
// All inputs are assumed to be pure ASCII digit strings; callers validate
// the shape before computing.
class CheckDigits {
public:
    // NIF/NIE control letter: NIF_CONTROL[value(digits) mod 23].
    // Any number of digits, reduced one digit at a time.
    static char NifLetter(const std::string& digits);

    // value(digits) mod 23 without building the full integer
    static int Mod23(const std::string& digits);

    // CIF check digit (0-9). Odd positions (0-based) are summed as-is,
    // even positions are doubled and reduced to their digit sum.
    static int CifDigit(const std::string& body);

    // CCC check digit for a 10 digit value using CCC_WEIGHTS.
    // 11 - (sum mod 11), with 10 -> 1 and 11 -> 0.
    static int CccDigit(const std::string& ten_digits);

    // Control tables, index = computed value
    static const char NIF_CONTROL[24];  // "TRWAGMYFPDXBNJZSQVHLCKE"
    static const char CIF_CONTROL[11];  // "JABCDEFGHI"

    // Class membership letters
    static const char CIF_TYPES[16];    // "ABCDEFGHKLMNPQS"
    static const char NIE_TYPES[3];     // "XT"

    static const int CCC_WEIGHTS[10];

    static bool IsCifType(char c);
    static bool IsNieType(char c);
    static bool IsControlLetter(char c);  // NIF_CONTROL or CIF_CONTROL
};

} // namespace idcheck
} // namespace esid
} // namespace duckdb
