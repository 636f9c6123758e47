#include "esid_settings.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace duckdb {
namespace esid {

// ============================================================================
// Global settings storage (thread-safe)
// ============================================================================

static std::mutex settings_mutex;
static bool default_only_nif_nie = false;

bool GetDefaultOnlyNifNie() {
    std::lock_guard<std::mutex> lock(settings_mutex);
    return default_only_nif_nie;
}

void SetDefaultOnlyNifNie(bool only_nif_nie) {
    std::lock_guard<std::mutex> lock(settings_mutex);
    default_only_nif_nie = only_nif_nie;
}

bool ParseBooleanSetting(const std::string& value, bool& out_result) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out_result = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out_result = false;
        return true;
    }
    return false;
}

void LoadSettingsFromEnvironment() {
    const char* env_value = std::getenv("ESID_ONLY_NIF_NIE");
    if (env_value == nullptr) {
        return;
    }

    bool only_nif_nie;
    if (!ParseBooleanSetting(env_value, only_nif_nie)) {
        std::cerr << "Ignoring ESID_ONLY_NIF_NIE: expected true/false, got '" << env_value << "'" << std::endl;
        return;
    }

    SetDefaultOnlyNifNie(only_nif_nie);
    std::cout << "Identity card default mode from ESID_ONLY_NIF_NIE: "
              << (only_nif_nie ? "NIF/NIE only" : "NIF/NIE/CIF") << std::endl;
}

// ============================================================================
// DuckDB scalar functions
// ============================================================================

static void EsidSetOnlyNifNieFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &flag_vec = args.data[0];

    UnifiedVectorFormat flag_data;
    flag_vec.ToUnifiedFormat(args.size(), flag_data);
    auto flag_idx = flag_data.sel->get_index(0);

    if (!flag_data.validity.RowIsValid(flag_idx)) {
        throw InvalidInputException("esid_set_only_nif_nie: value cannot be NULL");
    }

    bool only_nif_nie = UnifiedVectorFormat::GetData<bool>(flag_data)[flag_idx];
    SetDefaultOnlyNifNie(only_nif_nie);

    std::string msg = std::string("Identity card default mode set to: ") +
                      (only_nif_nie ? "NIF/NIE only" : "NIF/NIE/CIF");
    std::cout << msg << std::endl;

    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    ConstantVector::GetData<string_t>(result)[0] = StringVector::AddString(result, msg);
}

static void EsidGetOnlyNifNieFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    ConstantVector::GetData<bool>(result)[0] = GetDefaultOnlyNifNie();
}

void RegisterSettingsFunctions(ExtensionLoader &loader) {
    // esid_set_only_nif_nie(flag BOOLEAN) -> VARCHAR
    auto set_function = ScalarFunction(
        "esid_set_only_nif_nie",
        {LogicalType::BOOLEAN},
        LogicalType::VARCHAR,
        EsidSetOnlyNifNieFunction
    );
    set_function.stability = FunctionStability::VOLATILE;
    set_function.description = "Sets whether identity card functions reject CIF values when called without the only_nif_nie flag.\n"
                               "Usage: SELECT esid_set_only_nif_nie(true);\n"
                               "Returns: VARCHAR (confirmation message)";
    loader.RegisterFunction(set_function);

    // esid_get_only_nif_nie() -> BOOLEAN
    auto get_function = ScalarFunction(
        "esid_get_only_nif_nie",
        {},
        LogicalType::BOOLEAN,
        EsidGetOnlyNifNieFunction
    );
    get_function.stability = FunctionStability::VOLATILE;
    get_function.description = "Returns the default only_nif_nie mode for identity card functions.\n"
                               "Usage: SELECT esid_get_only_nif_nie();\n"
                               "Returns: BOOLEAN";
    loader.RegisterFunction(get_function);
}

} // namespace esid
} // namespace duckdb
