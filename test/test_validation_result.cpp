#include <gtest/gtest.h>
#include "idcheck/validation_result.hpp"

using namespace duckdb::esid::idcheck;

namespace {

TEST(ValidationMessageTest, InvalidWordingDependsOnValidator) {
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::POSTAL_CODE, ValidationError::INVALID),
                 "Enter a valid postal code in the range and format 01XXX - 52XXX.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::PHONE_NUMBER, ValidationError::INVALID),
                 "Enter a valid phone number in one of the formats 6XXXXXXXX, 8XXXXXXXX or 9XXXXXXXX.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::INVALID),
                 "Please enter a valid NIF, NIE, or CIF.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::BANK_ACCOUNT, ValidationError::INVALID),
                 "Please enter a valid bank account number in format XXXX-XXXX-XX-XXXXXXXXXX.");
}

TEST(ValidationMessageTest, IdentityCardCodes) {
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::INVALID_ONLY_NIF),
                 "Please enter a valid NIF or NIE.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::INVALID_NIF),
                 "Invalid checksum for NIF.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::INVALID_NIE),
                 "Invalid checksum for NIE.");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::INVALID_CIF),
                 "Invalid checksum for CIF.");
}

TEST(ValidationMessageTest, BankAccountChecksum) {
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::BANK_ACCOUNT, ValidationError::CHECKSUM),
                 "Invalid checksum for bank account number.");
}

TEST(ValidationMessageTest, EmptyForSuccessAndForeignCodes) {
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::IDENTITY_CARD, ValidationError::OK), "");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::POSTAL_CODE, ValidationError::CHECKSUM), "");
    EXPECT_STREQ(ValidationErrorMessage(ValidatorKind::BANK_ACCOUNT, ValidationError::INVALID_NIF), "");
}

} // namespace
