#include <gtest/gtest.h>
#include "idcheck/bank_account.hpp"

using namespace duckdb::esid::idcheck;

namespace {

TEST(BankAccountTest, ChecksumMismatch) {
    EXPECT_EQ(BankAccountValidator::Validate("2100-0418-46-0200051332").error, ValidationError::CHECKSUM);

    // Single digit changed in entity and in account
    EXPECT_EQ(BankAccountValidator::Validate("2101-0418-45-0200051332").error, ValidationError::CHECKSUM);
    EXPECT_EQ(BankAccountValidator::Validate("2100-0418-45-0200051333").error, ValidationError::CHECKSUM);
}

TEST(BankAccountTest, EverySeparatorCombinationIsAccepted) {
    const char* separators[] = {"", " ", "-"};
    for (const char* first : separators) {
        for (const char* second : separators) {
            for (const char* third : separators) {
                std::string value = std::string("2100") + first + "0418" + second + "45" + third + "0200051332";
                ValidationResult result = BankAccountValidator::Validate(value);
                EXPECT_TRUE(result.IsValid()) << value;
                EXPECT_EQ(result.value, "21000418450200051332") << value;
            }
        }
    }
}

TEST(BankAccountTest, AnyBodyDigitChangeIsDetected) {
    const std::string valid = "21000418450200051332";
    for (size_t pos = 0; pos < valid.length(); pos++) {
        // Positions 8 and 9 are the check digits themselves
        if (pos == 8 || pos == 9) {
            continue;
        }
        for (char c = '0'; c <= '9'; c++) {
            if (c == valid[pos]) {
                continue;
            }
            std::string value = valid;
            value[pos] = c;
            EXPECT_EQ(BankAccountValidator::Validate(value).error, ValidationError::CHECKSUM) << value;
        }
    }
}

TEST(BankAccountTest, StructuralFailures) {
    EXPECT_EQ(BankAccountValidator::Validate("2100-0418-45-020005133").error, ValidationError::INVALID);
    EXPECT_EQ(BankAccountValidator::Validate("2100-0418-45-02000513321").error, ValidationError::INVALID);
    EXPECT_EQ(BankAccountValidator::Validate("2100--0418-45-0200051332").error, ValidationError::INVALID);
    EXPECT_EQ(BankAccountValidator::Validate("2100/0418/45/0200051332").error, ValidationError::INVALID);
    EXPECT_EQ(BankAccountValidator::Validate("21OO-0418-45-0200051332").error, ValidationError::INVALID);
    EXPECT_EQ(BankAccountValidator::Validate(" 2100-0418-45-0200051332").error, ValidationError::INVALID);
}

TEST(BankAccountTest, EmptyInputIsValid) {
    ValidationResult result = BankAccountValidator::Validate("");
    EXPECT_TRUE(result.IsValid());
    EXPECT_EQ(result.value, "");
}

TEST(BankAccountTest, ParseSplitsFields) {
    CccFields fields;
    ASSERT_TRUE(BankAccountValidator::Parse("2100 0418 45 0200051332", fields));
    EXPECT_EQ(fields.entity, "2100");
    EXPECT_EQ(fields.office, "0418");
    EXPECT_EQ(fields.check_digits, "45");
    EXPECT_EQ(fields.account, "0200051332");

    // No checksum verification
    EXPECT_TRUE(BankAccountValidator::Parse("2100-0418-99-0200051332", fields));
    EXPECT_EQ(fields.check_digits, "99");

    EXPECT_FALSE(BankAccountValidator::Parse("", fields));
}

TEST(BankAccountTest, ComputeCheckDigits) {
    EXPECT_EQ(BankAccountValidator::ComputeCheckDigits("2100", "0418", "0200051332"), "45");
    EXPECT_EQ(BankAccountValidator::ComputeCheckDigits("0000", "0000", "0000000000"), "00");
}

} // namespace
