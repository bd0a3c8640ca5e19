/**
 * @file test_risk_calculation.cpp
 * @brief End-to-end tests of a retrofit risk run over the mock hazard
 */

#include <catch2/catch.hpp>
#include "risk_calculation.hpp"
#include "errors.hpp"
#include "mock_hazard_calculator.hpp"
#include "product_keys.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace seisrisk;
using namespace seisrisk::orchestrator;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using json = nlohmann::json;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = false;
    Logger::get_instance().configure(config);
}

AssetSet reference_assets() {
    std::istringstream csv(
        "asset_id,site_id,taxonomy,value,retrofit_cost\n"
        "asset-1,site-1,RC,10000,1000\n");
    return AssetSet::load_from_csv(csv);
}

AssetSet mixed_assets() {
    std::istringstream csv(
        "asset_id,site_id,taxonomy,value,retrofit_cost\n"
        "asset-1,site-1,RC,10000,1000\n"
        "asset-2,site-1,W,10000,1000\n"
        "asset-3,site-9,RC,10000,1000\n"
        "asset-4,site-1,RC,10000,0\n");
    return AssetSet::load_from_csv(csv);
}

struct Fixture {
    StoreRepository repository;
    testing::MockHazardCalculator calculator;
    ReuseController controller;
    RiskCalculation calculation;
    VulnerabilityModel original;
    VulnerabilityModel retrofitted;
    CancellationToken token;

    Fixture()
        : controller(repository, calculator),
          calculation(controller),
          original(testing::reference_original()),
          retrofitted(testing::reference_retrofitted()) {}

    RiskRunResult run(const std::string& run_id, const JobConfig& config, const AssetSet& assets) {
        return calculation.run(run_id, config, assets, original, retrofitted, token);
    }
};

std::vector<json> read_json_lines(const std::string& path) {
    std::vector<json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

size_t count_events(const std::vector<json>& lines, const std::string& event) {
    size_t count = 0;
    for (const auto& line : lines) {
        if (line.value("event", "") == event) {
            count++;
        }
    }
    return count;
}

} // anonymous namespace

TEST_CASE("Risk run over the reference scenario", "[risk]") {
    quiet_logger();
    Fixture fixture;
    JobConfig config = testing::reference_job();

    RiskRunResult result = fixture.run("run-1", config, reference_assets());

    REQUIRE(result.cache_key == make_cache_key(config, fixture.calculator.fingerprint()).hex());
    REQUIRE_FALSE(result.hazard_reused);
    REQUIRE(result.hazard.size() == 1);
    REQUIRE(result.hazard[0].realization_count == 2);
    REQUIRE(result.hazard[0].mean.poes() == std::vector<double>{0.5, 0.1, 0.02});

    REQUIRE(result.batch.succeeded == 1);
    REQUIRE(result.batch.failed == 0);

    const AssetRiskResult& asset = result.batch.outcomes.at("asset-1").result;
    REQUIRE_THAT(asset.aal_ratio_original, WithinAbs(0.088, 1e-12));
    REQUIRE_THAT(asset.aal_ratio_retrofitted, WithinAbs(0.046, 1e-12));
    REQUIRE_THAT(asset.benefit_cost.aal_original, WithinAbs(880.0, 1e-8));
    REQUIRE_THAT(asset.benefit_cost.aal_retrofitted, WithinAbs(460.0, 1e-8));
    REQUIRE_THAT(asset.benefit_cost.annuity_factor, WithinAbs(14.093944566044758, 1e-10));
    REQUIRE_THAT(asset.benefit_cost.benefit_cost_ratio, WithinAbs(5.9194567177387984, 1e-9));

    std::string map_key = mean_hazard_map_key(result.cache_key, "site-1", "PGA", 0.1);
    REQUIRE(result.hazard_maps.count(map_key) == 1);
    REQUIRE_THAT(result.hazard_maps.at(map_key), WithinRel(0.3, 1e-12));
    REQUIRE(result.hazard_maps.size() == 2);
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Risk run reports per-asset failures and continues", "[risk]") {
    quiet_logger();
    Fixture fixture;
    JobConfig config = testing::reference_job();

    RiskRunResult result = fixture.run("run-1", config, mixed_assets());

    REQUIRE(result.batch.succeeded == 1);
    REQUIRE(result.batch.failed == 3);
    REQUIRE(result.batch.outcomes.at("asset-1").success);

    const AssetFailure& unknown_taxonomy = result.batch.outcomes.at("asset-2").failure;
    REQUIRE(unknown_taxonomy.kind == ErrorKind::MissingInput);

    const AssetFailure& unknown_site = result.batch.outcomes.at("asset-3").failure;
    REQUIRE(unknown_site.kind == ErrorKind::MissingInput);

    const AssetFailure& free_retrofit = result.batch.outcomes.at("asset-4").failure;
    REQUIRE(free_retrofit.kind == ErrorKind::InvalidEconomics);
    REQUIRE(free_retrofit.parameter == "retrofit_cost");

    json j = risk_run_to_json(result, config);
    REQUIRE(j["failures"].size() == 3);
    REQUIRE(j["failures"][2]["parameter"] == "retrofit_cost");
    REQUIRE(j["summary"]["failed"] == 3);
    REQUIRE(j["results"].contains("asset-1"));
}

AssetSet two_site_assets() {
    std::istringstream csv(
        "asset_id,site_id,taxonomy,value,retrofit_cost\n"
        "asset-1,site-1,RC,10000,1000\n"
        "asset-2,site-2,RC,10000,1000\n");
    return AssetSet::load_from_csv(csv);
}

TEST_CASE("Risk run isolates a site with incomplete realizations", "[risk]") {
    quiet_logger();
    Fixture fixture;
    fixture.calculator.omit_realization("site-2", "rlz-1");
    JobConfig config = testing::reference_job();
    config.sites.push_back(Site("site-2", -122.2, 37.6));

    RiskRunResult result;
    REQUIRE_NOTHROW(result = fixture.run("run-1", config, two_site_assets()));

    REQUIRE(result.hazard.size() == 1);
    REQUIRE(result.hazard[0].site_id == "site-1");
    REQUIRE(result.hazard_failures.size() == 1);
    const HazardGroupFailure& group = result.hazard_failures[0];
    REQUIRE(group.site_id == "site-2");
    REQUIRE(group.imt == "PGA");
    REQUIRE(group.kind == ErrorKind::MissingInput);
    REQUIRE(group.message.find("site-2/PGA sum to 0.500000") != std::string::npos);

    REQUIRE(result.batch.succeeded == 1);
    REQUIRE_THAT(result.batch.outcomes.at("asset-1").result.aal_ratio_original, WithinAbs(0.088, 1e-12));

    const AssetFailure& failure = result.batch.outcomes.at("asset-2").failure;
    REQUIRE(failure.kind == ErrorKind::MissingInput);
    REQUIRE(failure.message.find("site-2/PGA sum to 0.500000") != std::string::npos);

    // Only the healthy site has hazard maps
    REQUIRE(result.hazard_maps.size() == 2);

    json j = risk_run_to_json(result, config);
    REQUIRE(j["hazard_failures"].size() == 1);
    REQUIRE(j["hazard_failures"][0]["kind"] == "MissingInput");
    REQUIRE(j["summary"]["failed"] == 1);
}

TEST_CASE("Non-monotone realization fails its site only under strict validation", "[risk][validation]") {
    quiet_logger();
    Fixture fixture;
    // Averages into the monotone mean {0.5, 0.2, 0.15}
    fixture.calculator.set_realization_poes("site-2", "rlz-0", {0.5, 0.1, 0.3});
    fixture.calculator.set_realization_poes("site-2", "rlz-1", {0.5, 0.3, 0.0});
    JobConfig config = testing::reference_job();
    config.sites.push_back(Site("site-2", -122.2, 37.6));

    SECTION("Lenient run warns and assesses every asset") {
        RiskRunResult result = fixture.run("run-1", config, two_site_assets());

        REQUIRE(result.hazard_failures.empty());
        REQUIRE(result.batch.succeeded == 2);
        REQUIRE(result.hazard.size() == 2);
        REQUIRE(result.hazard[0].warnings.empty());
        REQUIRE(result.hazard[1].site_id == "site-2");
        REQUIRE(result.hazard[1].warnings.size() == 1);
        REQUIRE(result.hazard[1].warnings[0].find("site-2/PGA/rlz-0") != std::string::npos);
    }

    SECTION("Strict run fails the assets at that site") {
        config.strict_validation = true;
        RiskRunResult result = fixture.run("run-1", config, two_site_assets());

        REQUIRE(result.hazard_failures.size() == 1);
        REQUIRE(result.hazard_failures[0].kind == ErrorKind::MalformedCurve);

        REQUIRE(result.batch.outcomes.at("asset-1").success);
        const AssetFailure& failure = result.batch.outcomes.at("asset-2").failure;
        REQUIRE(failure.kind == ErrorKind::MalformedCurve);
        REQUIRE(failure.message.find("site-2/PGA/rlz-0") != std::string::npos);
    }
}

TEST_CASE("Risk run reuses hazard when only downstream settings change", "[risk][reuse]") {
    quiet_logger();
    Fixture fixture;
    JobConfig config = testing::reference_job();

    RiskRunResult first = fixture.run("run-1", config, reference_assets());

    JobConfig individual = config;
    individual.individual_curves = true;
    individual.quantile_hazard_curves = {0.5};
    RiskRunResult second = fixture.run("run-2", individual, reference_assets());

    REQUIRE(fixture.calculator.calls() == 1);
    REQUIRE(second.hazard_reused);
    REQUIRE(second.cache_key == first.cache_key);
    REQUIRE(second.hazard[0].individual.size() == 2);
    REQUIRE(second.hazard[0].quantiles.count(0.5) == 1);

    // Downstream results are unaffected by the extra hazard products
    const AssetRiskResult& a = first.batch.outcomes.at("asset-1").result;
    const AssetRiskResult& b = second.batch.outcomes.at("asset-1").result;
    REQUIRE(a.aal_ratio_original == b.aal_ratio_original);
    REQUIRE(a.benefit_cost.benefit_cost_ratio == b.benefit_cost.benefit_cost_ratio);

    std::string quantile_key = quantile_hazard_map_key(second.cache_key, "site-1", "PGA", 0.1, 0.5);
    REQUIRE_THAT(second.hazard_maps.at(quantile_key), WithinRel(0.3, 1e-12));
}

TEST_CASE("Concurrent runs match a sequential run byte for byte", "[risk][concurrency]") {
    quiet_logger();
    JobConfig config = testing::reference_job();
    config.export_formats = {"json", "hazard_curves", "loss_curves"};
    AssetSet assets = mixed_assets();

    Fixture sequential;
    std::string expected = risk_run_to_json(sequential.run("run-seq", config, assets), config).dump();

    Fixture shared;
    shared.calculator.set_delay(100);

    const size_t runs = 4;
    std::vector<std::string> outputs(runs);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < runs; ++i) {
        threads.emplace_back([&, i]() {
            CancellationToken token;
            RiskRunResult result = shared.calculation.run("run-" + std::to_string(i), config, assets,
                                                          shared.original, shared.retrofitted, token);
            outputs[i] = risk_run_to_json(result, config).dump();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(shared.calculator.calls() == 1);
    for (const auto& output : outputs) {
        REQUIRE(output == expected);
    }
}

TEST_CASE("Risk run warns before a large individual export", "[risk]") {
    quiet_logger();
    Fixture fixture;
    JobConfig config = testing::reference_job();
    config.individual_curves = true;
    config.realization_warning_threshold = 1;

    RiskRunResult result = fixture.run("run-1", config, reference_assets());

    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings[0].find("2 realizations (threshold 1)") != std::string::npos);
    REQUIRE(result.batch.succeeded == 1);

    json j = risk_run_to_json(result, config);
    REQUIRE(j["warnings"].size() == 1);
}

TEST_CASE("Risk run JSON export formats", "[risk][export]") {
    quiet_logger();
    Fixture fixture;
    JobConfig config = testing::reference_job();

    SECTION("Default output") {
        json j = risk_run_to_json(fixture.run("run-1", config, reference_assets()), config);

        REQUIRE(j.contains("results"));
        REQUIRE(j.contains("hazard_maps"));
        REQUIRE_FALSE(j.contains("hazard_curves"));
        REQUIRE_FALSE(j.contains("loss_curves"));
        REQUIRE_FALSE(j.contains("run_id"));
        REQUIRE_FALSE(j["results"]["asset-1"].contains("loss_curve_original"));
    }

    SECTION("Hazard and loss curves under product keys") {
        config.export_formats = {"json", "hazard_curves", "loss_curves"};
        config.individual_curves = true;
        RiskRunResult result = fixture.run("run-1", config, reference_assets());
        json j = risk_run_to_json(result, config);

        // One mean plus two individual curves
        REQUIRE(j["hazard_curves"].size() == 3);
        REQUIRE(j["hazard_curves"].contains(mean_hazard_curve_key(result.cache_key, "site-1", "PGA")));
        REQUIRE(j["hazard_curves"].contains(hazard_curve_key(result.cache_key, "site-1", "PGA", "rlz-1")));

        REQUIRE(j["loss_curves"].size() == 2);
        for (auto it = j["loss_curves"].begin(); it != j["loss_curves"].end(); ++it) {
            ProductKey key = parse_product_key(it.key());
            REQUIRE(key.type == ProductType::LossCurve);
            REQUIRE(key.job_key == result.cache_key);
            REQUIRE(key.asset_id == "asset-1");
            REQUIRE_FALSE(it.value()["losses"].empty());
        }
        REQUIRE_FALSE(j["results"]["asset-1"].contains("loss_curve_original"));
    }

    SECTION("Written output carries the timing") {
        testing::TempDir dir("seisrisk-output");
        std::string path = (dir.path() / "result.json").string();
        write_risk_run_json(path, fixture.run("run-7", config, reference_assets()), config);

        std::ifstream file(path);
        json j = json::parse(file);
        REQUIRE(j["run_id"] == "run-7");
        REQUIRE(j["hazard_reused"] == false);
        REQUIRE(j.contains("total_time_ms"));
    }
}

TEST_CASE("Risk run logs cache decisions and failures", "[risk][logger]") {
    testing::TempDir dir("seisrisk-log");
    std::string path = (dir.path() / "run.log").string();

    LoggerConfig log_config;
    log_config.enable_console = false;
    log_config.enable_file = true;
    log_config.log_file_path = path;
    Logger::get_instance().configure(log_config);

    Fixture fixture;
    JobConfig config = testing::reference_job();
    fixture.run("run-1", config, mixed_assets());
    fixture.run("run-2", config, reference_assets());
    Logger::get_instance().flush();

    auto lines = read_json_lines(path);
    quiet_logger();

    REQUIRE(count_events(lines, "cache_miss") == 1);
    REQUIRE(count_events(lines, "hazard_start") == 1);
    REQUIRE(count_events(lines, "hazard_complete") == 1);
    REQUIRE(count_events(lines, "cache_hit") == 1);
    REQUIRE(count_events(lines, "asset_failure") == 3);
    REQUIRE(count_events(lines, "run_summary") == 2);

    for (const auto& line : lines) {
        if (line.value("event", "") == "cache_hit") {
            REQUIRE(line["run_id"] == "run-2");
            REQUIRE(line["cache_key"] == make_cache_key(config, fixture.calculator.fingerprint()).hex());
        }
    }
}
