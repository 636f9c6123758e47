#include "province_functions.hpp"
#include "idcheck/provinces.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace esid {

using idcheck::Province;
using idcheck::ProvinceTable;
using idcheck::Region;

// Both tables are static; the global state only tracks the scan position
struct LookupTableGlobalState : public GlobalTableFunctionState {
    idx_t position = 0;

    idx_t MaxThreads() const override {
        return 1;
    }
};

static unique_ptr<GlobalTableFunctionState> LookupTableInit(ClientContext &context, TableFunctionInitInput &input) {
    return make_uniq<LookupTableGlobalState>();
}

// ============================================================================
// esid_provinces()
// ============================================================================

static unique_ptr<FunctionData> ProvincesBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
    names = {"code", "name", "region_code", "region_name"};
    return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR};
    return make_uniq<TableFunctionData>();
}

static void ProvincesScan(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
    auto &state = data_p.global_state->Cast<LookupTableGlobalState>();
    const auto &provinces = ProvinceTable::Provinces();

    idx_t count = 0;
    while (state.position < provinces.size() && count < STANDARD_VECTOR_SIZE) {
        const Province &province = provinces[state.position];

        output.SetValue(0, count, Value(province.code));
        output.SetValue(1, count, Value(province.name));
        output.SetValue(2, count, Value(province.region_code));

        Region region;
        if (ProvinceTable::FindRegion(province.region_code, region)) {
            output.SetValue(3, count, Value(region.name));
        } else {
            output.SetValue(3, count, Value());
        }

        state.position++;
        count++;
    }

    output.SetCardinality(count);
}

// ============================================================================
// esid_regions()
// ============================================================================

static unique_ptr<FunctionData> RegionsBind(ClientContext &context, TableFunctionBindInput &input,
                                            vector<LogicalType> &return_types, vector<string> &names) {
    names = {"code", "name"};
    return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR};
    return make_uniq<TableFunctionData>();
}

static void RegionsScan(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
    auto &state = data_p.global_state->Cast<LookupTableGlobalState>();
    const auto &regions = ProvinceTable::Regions();

    idx_t count = 0;
    while (state.position < regions.size() && count < STANDARD_VECTOR_SIZE) {
        const Region &region = regions[state.position];
        output.SetValue(0, count, Value(region.code));
        output.SetValue(1, count, Value(region.name));
        state.position++;
        count++;
    }

    output.SetCardinality(count);
}

void RegisterProvinceFunctions(ExtensionLoader &loader) {
    TableFunction provinces_func("esid_provinces", {}, ProvincesScan, ProvincesBind, LookupTableInit);
    loader.RegisterFunction(provinces_func);

    TableFunction regions_func("esid_regions", {}, RegionsScan, RegionsBind, LookupTableInit);
    loader.RegisterFunction(regions_func);
}

} // namespace esid
} // namespace duckdb
