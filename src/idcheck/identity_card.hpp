#pragma once

#include "validation_result.hpp"
#include <string>

namespace duckdb {
namespace esid {
namespace idcheck {

// Fields of an identity card number after normalization.
// A '\0' letter means the position was empty.
struct ParsedIdentifier {
    char prefix_letter;  // CIF type or NIE type letter
    std::string digits;  // Digit run, leading zeros kept
    char suffix;         // NIF control or CIF control letter

    ParsedIdentifier() : prefix_letter('\0'), suffix('\0') {}

    bool HasPrefix() const { return prefix_letter != '\0'; }
    bool HasSuffix() const { return suffix != '\0'; }
};

// Spanish NIF/NIE/CIF (fiscal identification number) validator.
//
// Three formats are recognized:
//   NIF (individuals): 12345678Z
//   NIE (foreigners):  X1234567L
//   CIF (companies):   A58818501 or A5881850A
//
// Spaces and hyphens anywhere in the value are ignored. The number length
// is not checked for NIF/NIE: old values are shorter and future ones may be
// longer. The CIF control can be a digit or a letter depending on company
// type; since the rule is not public both forms are accepted for every type.
class IdentityCardValidator {
public:
    // Empty input is valid and normalizes to an empty string
    static ValidationResult Validate(const std::string& raw, bool only_nif_nie = false);

    // Same, also reporting the class that was matched (UNKNOWN on
    // structural failures and empty input)
    static ValidationResult Validate(const std::string& raw, bool only_nif_nie, IdentifierClass& id_class);

    // Upper-case and drop spaces and hyphens
    static std::string Normalize(const std::string& raw);

    // Split a normalized value into prefix, digits and suffix.
    // Returns false if the value does not have the expected shape.
    static bool Parse(const std::string& normalized, ParsedIdentifier& parsed);

private:
    static ValidationError CheckCif(const ParsedIdentifier& parsed);
};

} // namespace idcheck
} // namespace esid
} // namespace duckdb
