#include "identity_card_validation.hpp"
#include "esid_settings.hpp"
#include "idcheck/identity_card.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace esid {

using idcheck::IdentifierClass;
using idcheck::IdentityCardValidator;
using idcheck::ValidationResult;

// Runs the validator over every row. The optional second argument is the
// only_nif_nie flag; when it is missing or NULL the configured default is
// used. OP writes the row result and returns false to emit NULL.
template <class T, class OP>
static void ExecuteIdentityCard(DataChunk &args, Vector &result, OP op) {
    auto count = args.size();
    bool has_flag = args.data.size() > 1;

    UnifiedVectorFormat id_data;
    UnifiedVectorFormat flag_data;
    args.data[0].ToUnifiedFormat(count, id_data);
    if (has_flag) {
        args.data[1].ToUnifiedFormat(count, flag_data);
    }

    auto id_ptr = UnifiedVectorFormat::GetData<string_t>(id_data);
    auto flag_ptr = has_flag ? UnifiedVectorFormat::GetData<bool>(flag_data) : nullptr;
    auto result_data = FlatVector::GetData<T>(result);
    auto &result_validity = FlatVector::Validity(result);

    bool default_only_nif_nie = GetDefaultOnlyNifNie();

    for (idx_t i = 0; i < count; i++) {
        auto id_idx = id_data.sel->get_index(i);
        if (!id_data.validity.RowIsValid(id_idx)) {
            result_validity.SetInvalid(i);
            continue;
        }

        bool only_nif_nie = default_only_nif_nie;
        if (has_flag) {
            auto flag_idx = flag_data.sel->get_index(i);
            if (flag_data.validity.RowIsValid(flag_idx)) {
                only_nif_nie = flag_ptr[flag_idx];
            }
        }

        IdentifierClass id_class;
        ValidationResult check = IdentityCardValidator::Validate(id_ptr[id_idx].GetString(), only_nif_nie, id_class);

        if (!op(check, id_class, result_data[i])) {
            result_validity.SetInvalid(i);
        }
    }
}

// esid_is_valid_identity_card(id VARCHAR [, only_nif_nie BOOLEAN]) -> BOOLEAN
static void EsidIsValidIdentityCardFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteIdentityCard<bool>(args, result,
        [](const ValidationResult& check, IdentifierClass, bool& out) -> bool {
            out = check.IsValid();
            return true;
        });
}

// esid_validate_identity_card(id VARCHAR [, only_nif_nie BOOLEAN]) -> VARCHAR
// Returns: 'OK', 'invalid', 'invalid_only_nif', 'invalid_nif', 'invalid_nie', 'invalid_cif'
static void EsidValidateIdentityCardFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteIdentityCard<string_t>(args, result,
        [&](const ValidationResult& check, IdentifierClass, string_t& out) -> bool {
            out = StringVector::AddString(result, idcheck::ValidationErrorCode(check.error));
            return true;
        });
}

// esid_normalize_identity_card(id VARCHAR [, only_nif_nie BOOLEAN]) -> VARCHAR
static void EsidNormalizeIdentityCardFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteIdentityCard<string_t>(args, result,
        [&](const ValidationResult& check, IdentifierClass, string_t& out) -> bool {
            if (!check.IsValid()) {
                return false;
            }
            out = StringVector::AddString(result, check.value);
            return true;
        });
}

// esid_identity_card_type(id VARCHAR) -> VARCHAR ('NIF', 'NIE', 'CIF' or NULL)
static void EsidIdentityCardTypeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteIdentityCard<string_t>(args, result,
        [&](const ValidationResult& check, IdentifierClass id_class, string_t& out) -> bool {
            if (!check.IsValid() || id_class == IdentifierClass::UNKNOWN) {
                return false;
            }
            out = StringVector::AddString(result, idcheck::IdentifierClassName(id_class));
            return true;
        });
}

// esid_identity_card_error_message(id VARCHAR [, only_nif_nie BOOLEAN]) -> VARCHAR, NULL if valid
static void EsidIdentityCardErrorMessageFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteIdentityCard<string_t>(args, result,
        [&](const ValidationResult& check, IdentifierClass, string_t& out) -> bool {
            if (check.IsValid()) {
                return false;
            }
            out = StringVector::AddString(result,
                idcheck::ValidationErrorMessage(idcheck::ValidatorKind::IDENTITY_CARD, check.error));
            return true;
        });
}

// Every overload may read the mutable default, so none can be folded at plan time
static void AddVolatile(ScalarFunctionSet &set, ScalarFunction function) {
    function.stability = FunctionStability::VOLATILE;
    set.AddFunction(function);
}

void RegisterIdentityCardValidationFunctions(ExtensionLoader &loader) {
    // esid_is_valid_identity_card - returns boolean
    ScalarFunctionSet is_valid_set("esid_is_valid_identity_card");
    auto is_valid = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN,
                                   EsidIsValidIdentityCardFunction);
    is_valid.description = "Validates a Spanish NIF, NIE or CIF including its control character.\n"
                           "Usage: SELECT esid_is_valid_identity_card('12345678Z');\n"
                           "Returns: BOOLEAN (empty string counts as valid)";
    AddVolatile(is_valid_set, is_valid);

    auto is_valid_restricted = ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::BOOLEAN,
                                              EsidIsValidIdentityCardFunction);
    is_valid_restricted.description = "Validates a Spanish NIF, NIE or CIF; with only_nif_nie = true CIF values are rejected.\n"
                                      "Usage: SELECT esid_is_valid_identity_card('X1234567L', true);\n"
                                      "Returns: BOOLEAN";
    AddVolatile(is_valid_set, is_valid_restricted);
    loader.RegisterFunction(is_valid_set);

    // esid_validate_identity_card - returns result code
    ScalarFunctionSet validate_set("esid_validate_identity_card");
    auto validate = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                   EsidValidateIdentityCardFunction);
    validate.description = "Validates a Spanish NIF, NIE or CIF and returns the result code.\n"
                           "Usage: SELECT esid_validate_identity_card('12345678A');\n"
                           "Returns: VARCHAR (one of: 'OK', 'invalid', 'invalid_only_nif', 'invalid_nif', 'invalid_nie', 'invalid_cif')";
    AddVolatile(validate_set, validate);
    AddVolatile(validate_set, ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::VARCHAR,
                                             EsidValidateIdentityCardFunction));
    loader.RegisterFunction(validate_set);

    // esid_normalize_identity_card - upper-cased value without separators, NULL if invalid
    ScalarFunctionSet normalize_set("esid_normalize_identity_card");
    auto normalize = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                    EsidNormalizeIdentityCardFunction);
    normalize.description = "Returns a valid NIF, NIE or CIF upper-cased and without spaces or hyphens.\n"
                            "Usage: SELECT esid_normalize_identity_card('12345678-z');\n"
                            "Returns: VARCHAR (NULL if the value is not valid)";
    AddVolatile(normalize_set, normalize);
    AddVolatile(normalize_set, ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::VARCHAR,
                                              EsidNormalizeIdentityCardFunction));
    loader.RegisterFunction(normalize_set);

    // esid_identity_card_type
    ScalarFunctionSet type_set("esid_identity_card_type");
    auto type = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                               EsidIdentityCardTypeFunction);
    type.description = "Classifies a valid identity card number.\n"
                       "Usage: SELECT esid_identity_card_type('A58818501');\n"
                       "Returns: VARCHAR ('NIF', 'NIE', 'CIF', or NULL if not valid)";
    AddVolatile(type_set, type);
    loader.RegisterFunction(type_set);

    // esid_identity_card_error_message - default English message, NULL if valid
    ScalarFunctionSet message_set("esid_identity_card_error_message");
    auto message = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                  EsidIdentityCardErrorMessageFunction);
    message.description = "Returns the error message for an invalid NIF, NIE or CIF.\n"
                          "Usage: SELECT esid_identity_card_error_message('12345678A');\n"
                          "Returns: VARCHAR (NULL if the value is valid)";
    AddVolatile(message_set, message);
    AddVolatile(message_set, ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::VARCHAR,
                                            EsidIdentityCardErrorMessageFunction));
    loader.RegisterFunction(message_set);
}

} // namespace esid
} // namespace duckdb
