#include "phone_number_validation.hpp"
#include "idcheck/pattern_validators.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace esid {

static void EsidIsValidPhoneNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t phone) -> bool {
            return idcheck::PhoneNumberValidator::Validate(phone.GetString()).IsValid();
        });
}

static void EsidPhoneNumberErrorMessageFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t phone, ValidityMask &mask, idx_t idx) -> string_t {
            auto check = idcheck::PhoneNumberValidator::Validate(phone.GetString());
            if (check.IsValid()) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result,
                idcheck::ValidationErrorMessage(idcheck::ValidatorKind::PHONE_NUMBER, check.error));
        });
}

void RegisterPhoneNumberValidationFunctions(ExtensionLoader &loader) {
    ScalarFunctionSet phone_set("esid_is_valid_phone_number");
    auto is_valid = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, EsidIsValidPhoneNumberFunction);
    is_valid.description = "Validates a Spanish phone number: nine digits starting with 6, 7, 8 or 9.\n"
                           "Usage: SELECT esid_is_valid_phone_number('612345678');\n"
                           "Returns: BOOLEAN";
    phone_set.AddFunction(is_valid);
    loader.RegisterFunction(phone_set);

    ScalarFunctionSet message_set("esid_phone_number_error_message");
    auto message = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, EsidPhoneNumberErrorMessageFunction);
    message.description = "Returns the error message for an invalid Spanish phone number.\n"
                          "Usage: SELECT esid_phone_number_error_message('512345678');\n"
                          "Returns: VARCHAR (NULL if the phone number is valid)";
    message_set.AddFunction(message);
    loader.RegisterFunction(message_set);
}

} // namespace esid
} // namespace duckdb
