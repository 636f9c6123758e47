#include "postal_code_validation.hpp"
#include "idcheck/pattern_validators.hpp"
#include "idcheck/provinces.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace esid {

using idcheck::PostalCodeValidator;
using idcheck::Province;
using idcheck::ProvinceTable;

// esid_is_valid_postal_code(code VARCHAR) -> BOOLEAN
static void EsidIsValidPostalCodeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t code) -> bool {
            return PostalCodeValidator::Validate(code.GetString()).IsValid();
        });
}

// esid_postal_code_province(code VARCHAR) -> VARCHAR, NULL for invalid codes
static void EsidPostalCodeProvinceFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t code, ValidityMask &mask, idx_t idx) -> string_t {
            Province province;
            if (!ProvinceTable::ProvinceForPostalCode(code.GetString(), province)) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result, province.name);
        });
}

// esid_postal_code_error_message(code VARCHAR) -> VARCHAR, NULL for valid codes
static void EsidPostalCodeErrorMessageFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t code, ValidityMask &mask, idx_t idx) -> string_t {
            auto check = PostalCodeValidator::Validate(code.GetString());
            if (check.IsValid()) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result,
                idcheck::ValidationErrorMessage(idcheck::ValidatorKind::POSTAL_CODE, check.error));
        });
}

void RegisterPostalCodeValidationFunctions(ExtensionLoader &loader) {
    ScalarFunctionSet postal_code_set("esid_is_valid_postal_code");
    auto is_valid = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, EsidIsValidPostalCodeFunction);
    is_valid.description = "Validates a Spanish postal code: five digits, the first two a province code 01-52.\n"
                           "Usage: SELECT esid_is_valid_postal_code('28080');\n"
                           "Returns: BOOLEAN";
    postal_code_set.AddFunction(is_valid);
    loader.RegisterFunction(postal_code_set);

    ScalarFunctionSet province_set("esid_postal_code_province");
    auto province = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, EsidPostalCodeProvinceFunction);
    province.description = "Returns the province a Spanish postal code belongs to.\n"
                           "Usage: SELECT esid_postal_code_province('08001');\n"
                           "Returns: VARCHAR (NULL if the postal code is not valid)";
    province_set.AddFunction(province);
    loader.RegisterFunction(province_set);

    ScalarFunctionSet message_set("esid_postal_code_error_message");
    auto message = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, EsidPostalCodeErrorMessageFunction);
    message.description = "Returns the error message for an invalid Spanish postal code.\n"
                          "Usage: SELECT esid_postal_code_error_message('53000');\n"
                          "Returns: VARCHAR (NULL if the postal code is valid)";
    message_set.AddFunction(message);
    loader.RegisterFunction(message_set);
}

} // namespace esid
} // namespace duckdb
