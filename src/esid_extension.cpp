#define DUCKDB_EXTENSION_MAIN
#include "duckdb.hpp"
#include "duckdb/main/extension.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

// Include all function registration headers
#include "esid_settings.hpp"
#include "postal_code_validation.hpp"
#include "phone_number_validation.hpp"
#include "identity_card_validation.hpp"
#include "bank_account_validation.hpp"
#include "province_functions.hpp"

namespace duckdb {

class EsidExtension : public Extension {
public:
    void Load(ExtensionLoader &loader) override {
        // Pick up ESID_ONLY_NIF_NIE before any function sees the default
        esid::LoadSettingsFromEnvironment();

        esid::RegisterSettingsFunctions(loader);
        esid::RegisterPostalCodeValidationFunctions(loader);
        esid::RegisterPhoneNumberValidationFunctions(loader);
        esid::RegisterIdentityCardValidationFunctions(loader);
        esid::RegisterBankAccountValidationFunctions(loader);

        // Province and region lookup tables
        esid::RegisterProvinceFunctions(loader);
    }

    std::string Name() override {
        return "esid";
    }

    std::string Version() const override {
#ifdef EXT_VERSION_ESID
        return EXT_VERSION_ESID;
#else
        return "v1.0.0";
#endif
    }
};

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(esid, loader) {
    duckdb::EsidExtension ext;
    ext.Load(loader);
}
}
