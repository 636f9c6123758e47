#include <gtest/gtest.h>
#include "idcheck/identity_card.hpp"
#include "idcheck/check_digits.hpp"
#include <cstdio>

using namespace duckdb::esid::idcheck;

namespace {

ValidationError check(const std::string& value, bool only_nif_nie = false) {
    return IdentityCardValidator::Validate(value, only_nif_nie).error;
}

TEST(IdentityCardTest, ValidNif) {
    EXPECT_EQ(check("12345678Z"), ValidationError::OK);
    EXPECT_EQ(check("00000000T"), ValidationError::OK);

    // Old, shorter numbers
    EXPECT_EQ(check("1234567L"), ValidationError::OK);
}

TEST(IdentityCardTest, NifWrongLetter) {
    EXPECT_EQ(check("12345678A"), ValidationError::INVALID_NIF);
    EXPECT_EQ(check("12345678I"), ValidationError::INVALID_NIF);
}

TEST(IdentityCardTest, NifSuffixMutationIsDetected) {
    const std::string letters = "TRWAGMYFPDXBNJZSQVHLCKE";
    for (char c : letters) {
        std::string value = std::string("12345678") + c;
        if (c == 'Z') {
            EXPECT_EQ(check(value), ValidationError::OK) << value;
        } else {
            EXPECT_EQ(check(value), ValidationError::INVALID_NIF) << value;
        }
    }
}

TEST(IdentityCardTest, Nie) {
    EXPECT_EQ(check("X1234567L"), ValidationError::OK);
    EXPECT_EQ(check("T1234567L"), ValidationError::OK);
    EXPECT_EQ(check("X1234567K"), ValidationError::INVALID_NIE);

    // Only X and T are NIE letters
    EXPECT_EQ(check("Y1234567L"), ValidationError::INVALID);
}

TEST(IdentityCardTest, CifAcceptsDigitOrLetterControl) {
    EXPECT_EQ(check("A58818501"), ValidationError::OK);
    EXPECT_EQ(check("A5881850A"), ValidationError::OK);
    EXPECT_EQ(check("B12345674"), ValidationError::OK);
    EXPECT_EQ(check("B1234567D"), ValidationError::OK);

    // Eight digit body with an explicit control letter
    EXPECT_EQ(check("A12345678F"), ValidationError::OK);
}

TEST(IdentityCardTest, CifDigitAndLetterControlAcrossBodies) {
    for (int number = 0; number <= 9999999; number += 9973) {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "B%07d", number);
        const std::string prefix(buffer);
        int d = CheckDigits::CifDigit(prefix.substr(1));

        EXPECT_EQ(check(prefix + static_cast<char>('0' + d)), ValidationError::OK) << prefix;
        EXPECT_EQ(check(prefix + CheckDigits::CIF_CONTROL[d]), ValidationError::OK) << prefix;
        EXPECT_EQ(check(prefix + static_cast<char>('0' + (d + 1) % 10)), ValidationError::INVALID_CIF) << prefix;
    }
}

TEST(IdentityCardTest, CifWrongControl) {
    EXPECT_EQ(check("A58818502"), ValidationError::INVALID_CIF);
    EXPECT_EQ(check("A5881850B"), ValidationError::INVALID_CIF);

    // Body digit off by one
    EXPECT_EQ(check("A58818601"), ValidationError::INVALID_CIF);
}

TEST(IdentityCardTest, CifOffByOneBodyDigitIsDetected) {
    const std::string valid = "A58818501";
    for (size_t pos = 1; pos < valid.length() - 1; pos++) {
        for (int delta = -1; delta <= 1; delta += 2) {
            char c = static_cast<char>(valid[pos] + delta);
            if (c < '0' || c > '9') {
                continue;
            }
            std::string value = valid;
            value[pos] = c;
            EXPECT_EQ(check(value), ValidationError::INVALID_CIF) << value;
        }
    }
}

TEST(IdentityCardTest, CifBodyLength) {
    EXPECT_EQ(check("A123456"), ValidationError::INVALID);
    EXPECT_EQ(check("A1234567890"), ValidationError::INVALID);
}

TEST(IdentityCardTest, StructuralFailures) {
    EXPECT_EQ(check("ABC"), ValidationError::INVALID);
    EXPECT_EQ(check("12345678"), ValidationError::INVALID);
    EXPECT_EQ(check("12345678ZZ"), ValidationError::INVALID);
    EXPECT_EQ(check("Z"), ValidationError::INVALID);
    EXPECT_EQ(check("1234.5678Z"), ValidationError::INVALID);
}

TEST(IdentityCardTest, EmptyInputIsValid) {
    ValidationResult result = IdentityCardValidator::Validate("");
    EXPECT_TRUE(result.IsValid());
    EXPECT_EQ(result.value, "");

    EXPECT_EQ(check("", true), ValidationError::OK);
}

TEST(IdentityCardTest, OnlyNifNieRejectsCif) {
    EXPECT_EQ(check("A58818501", true), ValidationError::INVALID_ONLY_NIF);
    EXPECT_EQ(check("ABC", true), ValidationError::INVALID_ONLY_NIF);

    // Checksum failures keep their own code
    EXPECT_EQ(check("12345678Z", true), ValidationError::OK);
    EXPECT_EQ(check("12345678A", true), ValidationError::INVALID_NIF);
    EXPECT_EQ(check("X1234567K", true), ValidationError::INVALID_NIE);
}

TEST(IdentityCardTest, NormalizesSeparatorsAndCase) {
    ValidationResult result = IdentityCardValidator::Validate("12345678-z");
    ASSERT_TRUE(result.IsValid());
    EXPECT_EQ(result.value, "12345678Z");

    result = IdentityCardValidator::Validate(" x-1234 567 l ");
    ASSERT_TRUE(result.IsValid());
    EXPECT_EQ(result.value, "X1234567L");

    EXPECT_EQ(IdentityCardValidator::Normalize("a-58 818-501"), "A58818501");
}

TEST(IdentityCardTest, ReportsIdentifierClass) {
    IdentifierClass id_class;

    IdentityCardValidator::Validate("12345678Z", false, id_class);
    EXPECT_EQ(id_class, IdentifierClass::NIF);

    IdentityCardValidator::Validate("X1234567K", false, id_class);
    EXPECT_EQ(id_class, IdentifierClass::NIE);

    IdentityCardValidator::Validate("A58818501", false, id_class);
    EXPECT_EQ(id_class, IdentifierClass::CIF);

    IdentityCardValidator::Validate("ABC", false, id_class);
    EXPECT_EQ(id_class, IdentifierClass::UNKNOWN);

    IdentityCardValidator::Validate("", false, id_class);
    EXPECT_EQ(id_class, IdentifierClass::UNKNOWN);
}

TEST(IdentityCardTest, Parse) {
    ParsedIdentifier parsed;

    ASSERT_TRUE(IdentityCardValidator::Parse("A5881850A", parsed));
    EXPECT_EQ(parsed.prefix_letter, 'A');
    EXPECT_EQ(parsed.digits, "5881850");
    EXPECT_EQ(parsed.suffix, 'A');

    ASSERT_TRUE(IdentityCardValidator::Parse("12345678", parsed));
    EXPECT_FALSE(parsed.HasPrefix());
    EXPECT_FALSE(parsed.HasSuffix());

    EXPECT_FALSE(IdentityCardValidator::Parse("", parsed));
    EXPECT_FALSE(IdentityCardValidator::Parse("AZ", parsed));
}

TEST(IdentityCardTest, ErrorCodes) {
    EXPECT_STREQ(ValidationErrorCode(ValidationError::OK), "OK");
    EXPECT_STREQ(ValidationErrorCode(ValidationError::INVALID_ONLY_NIF), "invalid_only_nif");
    EXPECT_STREQ(ValidationErrorCode(ValidationError::INVALID_CIF), "invalid_cif");
    EXPECT_STREQ(IdentifierClassName(IdentifierClass::CIF), "CIF");
}

} // namespace
