#include <catch2/catch.hpp>
#include <sstream>
#include "io/json_writer.hpp"
#include "risk_batch.hpp"

using namespace seisrisk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

HazardCurveIndex scenario_hazard() {
    HazardCurveIndex index;
    index.add(HazardCurve("site-1", "PGA", {0.1, 0.3, 0.5}, {0.5, 0.1, 0.02}));
    return index;
}

VulnerabilityModel original_model() {
    VulnerabilityModel model("original");
    model.add(VulnerabilityFunction("RC", "PGA", {{0.1, 0.05, 0.0}, {0.3, 0.2, 0.0}, {0.5, 0.5, 0.0}}));
    model.add(VulnerabilityFunction("W", "SA(1.0)", {{0.1, 0.05, 0.0}}));
    return model;
}

VulnerabilityModel retrofitted_model() {
    VulnerabilityModel model("retrofitted");
    model.add(VulnerabilityFunction("RC", "PGA", {{0.1, 0.02, 0.0}, {0.3, 0.1, 0.0}, {0.5, 0.3, 0.0}}));
    model.add(VulnerabilityFunction("W", "SA(1.0)", {{0.1, 0.02, 0.0}}));
    return model;
}

Asset make_asset(const std::string& id, const std::string& site, const std::string& taxonomy,
                 double value = 10000.0, double cost = 1000.0) {
    Asset a;
    a.asset_id = id;
    a.site_id = site;
    a.taxonomy = taxonomy;
    a.value = value;
    a.retrofit_cost = cost;
    return a;
}

RiskBatchConfig scenario_config() {
    RiskBatchConfig config;
    config.interest_rate = 0.05;
    config.life_expectancy_years = 25;
    return config;
}

} // anonymous namespace

// ============================================================================
// Single asset
// ============================================================================

TEST_CASE("End-to-end reference scenario", "[batch]") {
    AssetRiskResult result = assess_asset(make_asset("asset-1", "site-1", "RC"), scenario_hazard(),
                                          original_model(), retrofitted_model(), scenario_config());

    REQUIRE_THAT(result.aal_ratio_original, WithinRel(0.088, 1e-12));
    REQUIRE_THAT(result.aal_ratio_retrofitted, WithinRel(0.046, 1e-12));
    REQUIRE_THAT(result.benefit_cost.aal_original, WithinRel(880.0, 1e-12));
    REQUIRE_THAT(result.benefit_cost.aal_retrofitted, WithinRel(460.0, 1e-12));
    REQUIRE(result.benefit_cost.aal_original > result.benefit_cost.aal_retrofitted);
    REQUIRE(result.benefit_cost.discounted_benefit > 0.0);
    REQUIRE_THAT(result.benefit_cost.benefit_cost_ratio, WithinRel(5.9194567177, 1e-6));
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Repeated runs reproduce the same numbers", "[batch]") {
    AssetSet assets;
    assets.add(make_asset("asset-1", "site-1", "RC"));

    RiskBatchResult first = run_risk_batch(assets, scenario_hazard(), original_model(),
                                           retrofitted_model(), scenario_config());
    RiskBatchResult second = run_risk_batch(assets, scenario_hazard(), original_model(),
                                            retrofitted_model(), scenario_config());

    REQUIRE(io::risk_batch_to_json(first).dump() == io::risk_batch_to_json(second).dump());
}

TEST_CASE("Conditional losses and curves are kept on request", "[batch]") {
    RiskBatchConfig config = scenario_config();
    config.conditional_loss_poes = {0.1, 0.05};
    config.keep_loss_curves = true;

    AssetRiskResult result = assess_asset(make_asset("asset-1", "site-1", "RC"), scenario_hazard(),
                                          original_model(), retrofitted_model(), config);

    REQUIRE_THAT(result.conditional_loss_original.at(0.1), WithinRel(1250.0, 1e-12));
    REQUIRE_THAT(result.conditional_loss_original.at(0.05), WithinRel(2656.25, 1e-12));
    REQUIRE(result.conditional_loss_retrofitted.at(0.1) < result.conditional_loss_original.at(0.1));
    REQUIRE(result.loss_curve_original.size() == 5);
    REQUIRE(result.loss_curve_retrofitted.size() == 5);
}

// ============================================================================
// Batch failure isolation
// ============================================================================

TEST_CASE("Failing assets are isolated and summarized", "[batch]") {
    AssetSet assets;
    assets.add(make_asset("good", "site-1", "RC"));
    assets.add(make_asset("wrong-imt", "site-1", "W"));
    assets.add(make_asset("no-hazard", "site-9", "RC"));
    assets.add(make_asset("no-function", "site-1", "Steel"));
    assets.add(make_asset("bad-cost", "site-1", "RC", 10000.0, 0.0));

    RiskBatchResult batch = run_risk_batch(assets, scenario_hazard(), original_model(),
                                           retrofitted_model(), scenario_config());

    REQUIRE(batch.outcomes.size() == 5);
    REQUIRE(batch.succeeded == 1);
    REQUIRE(batch.failed == 4);
    REQUIRE(batch.failures.size() == 4);

    REQUIRE(batch.outcomes.at("good").success);
    REQUIRE(batch.outcomes.at("wrong-imt").failure.kind == ErrorKind::IncompatibleIntensityMeasure);
    REQUIRE(batch.outcomes.at("no-hazard").failure.kind == ErrorKind::MissingInput);
    REQUIRE(batch.outcomes.at("no-function").failure.kind == ErrorKind::MissingInput);

    const AssetFailure& cost = batch.outcomes.at("bad-cost").failure;
    REQUIRE(cost.kind == ErrorKind::InvalidEconomics);
    REQUIRE(cost.parameter == "retrofit_cost");

    // Failures keep asset order
    REQUIRE(batch.failures[0].asset_id == "wrong-imt");
    REQUIRE(batch.failures[3].asset_id == "bad-cost");
}

TEST_CASE("Invalid shared economics fail every asset", "[batch]") {
    AssetSet assets;
    assets.add(make_asset("a", "site-1", "RC"));
    assets.add(make_asset("b", "site-1", "RC"));
    RiskBatchConfig config = scenario_config();
    config.life_expectancy_years = 0;

    RiskBatchResult batch = run_risk_batch(assets, scenario_hazard(), original_model(),
                                           retrofitted_model(), config);

    REQUIRE(batch.failed == 2);
    REQUIRE(batch.failures[0].parameter == "life_expectancy");
}

TEST_CASE("Strict validation turns a malformed hazard curve into a failure", "[batch]") {
    HazardCurveIndex bumpy;
    bumpy.add(HazardCurve("site-1", "PGA", {0.1, 0.3, 0.5}, {0.1, 0.2, 0.02}));
    AssetSet assets;
    assets.add(make_asset("a", "site-1", "RC"));

    RiskBatchResult lenient = run_risk_batch(assets, bumpy, original_model(), retrofitted_model(),
                                             scenario_config());
    REQUIRE(lenient.succeeded == 1);
    REQUIRE_FALSE(lenient.outcomes.at("a").result.warnings.empty());

    RiskBatchConfig strict = scenario_config();
    strict.convolution.strict_validation = true;
    RiskBatchResult failed = run_risk_batch(assets, bumpy, original_model(), retrofitted_model(), strict);
    REQUIRE(failed.outcomes.at("a").failure.kind == ErrorKind::MalformedCurve);
}

TEST_CASE("A failed hazard group reports its own error", "[batch]") {
    HazardCurveIndex hazard = scenario_hazard();
    hazard.mark_failed("site-2", "PGA", ErrorKind::MissingInput,
                       "Realization weights for site-2/PGA sum to 0.500000, expected 1");
    AssetSet assets;
    assets.add(make_asset("healthy", "site-1", "RC"));
    assets.add(make_asset("sparse", "site-2", "RC"));

    RiskBatchResult batch = run_risk_batch(assets, hazard, original_model(), retrofitted_model(),
                                           scenario_config());

    REQUIRE(batch.succeeded == 1);
    REQUIRE(batch.outcomes.at("healthy").success);

    const AssetFailure& failure = batch.outcomes.at("sparse").failure;
    REQUIRE(failure.kind == ErrorKind::MissingInput);
    REQUIRE(failure.message.find("sum to 0.500000") != std::string::npos);
    REQUIRE(failure.message.find("(asset sparse)") != std::string::npos);
}

TEST_CASE("Worker count does not change results", "[batch]") {
    AssetSet assets;
    for (int i = 0; i < 64; ++i) {
        assets.add(make_asset("asset-" + std::to_string(i), "site-1", i % 7 == 0 ? "W" : "RC",
                              1000.0 + i, 100.0 + i));
    }

    RiskBatchConfig single = scenario_config();
    single.max_workers = 1;
    RiskBatchConfig many = scenario_config();
    many.max_workers = 8;

    auto a = run_risk_batch(assets, scenario_hazard(), original_model(), retrofitted_model(), single);
    auto b = run_risk_batch(assets, scenario_hazard(), original_model(), retrofitted_model(), many);

    REQUIRE(io::risk_batch_to_json(a).dump() == io::risk_batch_to_json(b).dump());
}

// ============================================================================
// Asset input and JSON output
// ============================================================================

TEST_CASE("AssetSet loads CSV with optional location", "[batch][io]") {
    std::istringstream csv(
        "asset_id,site_id,taxonomy,value,retrofit_cost,lon,lat\n"
        "a1,site-1,RC,10000,1000,12.5,41.9\n"
        "a2,site-2,W,5000,400,,\n");

    AssetSet assets = AssetSet::load_from_csv(csv);

    REQUIRE(assets.size() == 2);
    REQUIRE(assets.get(0).lon == 12.5);
    REQUIRE(assets.find("a2")->retrofit_cost == 400.0);
    REQUIRE(assets.find("a2")->lat == 0.0);
    REQUIRE(assets.site_ids() == std::vector<std::string>{"site-1", "site-2"});
}

TEST_CASE("AssetSet rejects duplicate ids and bad numbers", "[batch][io]") {
    std::istringstream duplicate(
        "asset_id,site_id,taxonomy,value,retrofit_cost\n"
        "a1,site-1,RC,10000,1000\n"
        "a1,site-1,RC,10000,1000\n");
    REQUIRE_THROWS_AS(AssetSet::load_from_csv(duplicate), std::invalid_argument);

    std::istringstream bad(
        "asset_id,site_id,taxonomy,value,retrofit_cost\n"
        "a1,site-1,RC,lots,1000\n");
    REQUIRE_THROWS_AS(AssetSet::load_from_csv(bad), std::runtime_error);
}

TEST_CASE("Batch JSON carries results and failures", "[batch][io]") {
    AssetSet assets;
    assets.add(make_asset("good", "site-1", "RC"));
    assets.add(make_asset("bad-cost", "site-1", "RC", 10000.0, -1.0));

    RiskBatchResult batch = run_risk_batch(assets, scenario_hazard(), original_model(),
                                           retrofitted_model(), scenario_config());
    nlohmann::json j = io::risk_batch_to_json(batch);

    REQUIRE(j["summary"]["succeeded"] == 1);
    REQUIRE(j["summary"]["failed"] == 1);
    REQUIRE(j["results"].contains("good"));
    REQUIRE_FALSE(j["results"].contains("bad-cost"));
    REQUIRE(j["failures"][0]["kind"] == "InvalidEconomics");
    REQUIRE(j["failures"][0]["parameter"] == "retrofit_cost");
    REQUIRE_FALSE(j.contains("execution_time_ms"));

    std::ostringstream os;
    io::write_risk_batch_json(os, batch, false);
    REQUIRE(os.str().find("\"execution_time_ms\"") != std::string::npos);
}
