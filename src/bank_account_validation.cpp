#include "bank_account_validation.hpp"
#include "idcheck/bank_account.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace esid {

using idcheck::BankAccountValidator;
using idcheck::CccFields;

enum class CccPart { ENTITY, OFFICE, CHECK_DIGITS, ACCOUNT };

static const std::string& select_part(const CccFields& fields, CccPart part) {
    switch (part) {
        case CccPart::ENTITY:       return fields.entity;
        case CccPart::OFFICE:       return fields.office;
        case CccPart::CHECK_DIGITS: return fields.check_digits;
        case CccPart::ACCOUNT:      return fields.account;
    }
    return fields.account;
}

// DuckDB scalar function wrapper
static void EsidIsValidCccFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t ccc) -> bool {
            return BankAccountValidator::Validate(ccc.GetString()).IsValid();
        });
}

// Returns: 'OK', 'invalid', 'checksum'
static void EsidValidateCccFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t ccc) -> string_t {
            auto check = BankAccountValidator::Validate(ccc.GetString());
            return StringVector::AddString(result, idcheck::ValidationErrorCode(check.error));
        });
}

// Default English message, NULL for valid values
static void EsidCccErrorMessageFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t ccc, ValidityMask &mask, idx_t idx) -> string_t {
            auto check = BankAccountValidator::Validate(ccc.GetString());
            if (check.IsValid()) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result,
                idcheck::ValidationErrorMessage(idcheck::ValidatorKind::BANK_ACCOUNT, check.error));
        });
}

// Field extraction, NULL when the value is not a well-formed CCC
template <CccPart PART>
static void EsidGetCccPartFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t ccc, ValidityMask &mask, idx_t idx) -> string_t {
            CccFields fields;
            if (!BankAccountValidator::Parse(ccc.GetString(), fields)) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result, select_part(fields, PART));
        });
}

void RegisterBankAccountValidationFunctions(ExtensionLoader &loader) {
    // esid_is_valid_ccc(ccc) - Returns true if the CCC check digits match
    ScalarFunctionSet is_valid_ccc_set("esid_is_valid_ccc");
    auto is_valid_ccc = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, EsidIsValidCccFunction);
    is_valid_ccc.description = "Validates a Spanish bank account code (CCC) in format EEEE-OOOO-CC-AAAAAAAAAA.\n"
                               "Usage: SELECT esid_is_valid_ccc('2100 0418 45 0200051332');\n"
                               "Returns: BOOLEAN (empty string counts as valid)";
    is_valid_ccc_set.AddFunction(is_valid_ccc);
    loader.RegisterFunction(is_valid_ccc_set);

    // esid_validate_ccc(ccc) - Result code
    ScalarFunctionSet validate_ccc_set("esid_validate_ccc");
    auto validate_ccc = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, EsidValidateCccFunction);
    validate_ccc.description = "Validates a Spanish bank account code (CCC) and returns the result code.\n"
                               "Usage: SELECT esid_validate_ccc('2100-0418-45-0200051332');\n"
                               "Returns: VARCHAR (one of: 'OK', 'invalid', 'checksum')";
    validate_ccc_set.AddFunction(validate_ccc);
    loader.RegisterFunction(validate_ccc_set);

    // esid_ccc_error_message(ccc) - Message for invalid codes
    ScalarFunctionSet ccc_message_set("esid_ccc_error_message");
    auto ccc_message = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, EsidCccErrorMessageFunction);
    ccc_message.description = "Returns the error message for an invalid Spanish bank account code (CCC).\n"
                              "Usage: SELECT esid_ccc_error_message('2100-0418-46-0200051332');\n"
                              "Returns: VARCHAR (NULL if the value is valid)";
    ccc_message_set.AddFunction(ccc_message);
    loader.RegisterFunction(ccc_message_set);

    // esid_get_ccc_entity(ccc) - Extract entity (bank) code
    ScalarFunctionSet get_entity_set("esid_get_ccc_entity");
    get_entity_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                              EsidGetCccPartFunction<CccPart::ENTITY>));
    loader.RegisterFunction(get_entity_set);

    // esid_get_ccc_office(ccc) - Extract office (branch) code
    ScalarFunctionSet get_office_set("esid_get_ccc_office");
    get_office_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                              EsidGetCccPartFunction<CccPart::OFFICE>));
    loader.RegisterFunction(get_office_set);

    // esid_get_ccc_check_digits(ccc) - Extract the two check digits
    ScalarFunctionSet get_check_digits_set("esid_get_ccc_check_digits");
    get_check_digits_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                                    EsidGetCccPartFunction<CccPart::CHECK_DIGITS>));
    loader.RegisterFunction(get_check_digits_set);

    // esid_get_ccc_account(ccc) - Extract the 10 digit account number
    ScalarFunctionSet get_account_set("esid_get_ccc_account");
    get_account_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                               EsidGetCccPartFunction<CccPart::ACCOUNT>));
    loader.RegisterFunction(get_account_set);
}

} // namespace esid
} // namespace duckdb
