/**
 * @file test_cache_key.cpp
 * @brief Unit tests for hazard cache keys
 */

#include <catch2/catch.hpp>
#include "cache_key.hpp"
#include "mock_hazard_calculator.hpp"
#include <nlohmann/json.hpp>
#include <set>

using namespace seisrisk;
using namespace seisrisk::orchestrator;
using json = nlohmann::json;

namespace {

// A valid value different from the reference job for every parameter
json changed_values() {
    return json{
        {"source_model_logic_tree", "other_source_model.xml"},
        {"gsim_logic_tree", "other_gmpe_logic_tree.xml"},
        {"sites", json::array({
            {{"site_id", "site-1"}, {"lon", -122.1}, {"lat", 37.5}},
            {{"site_id", "site-2"}, {"lon", -122.0}, {"lat", 37.6}}
        })},
        {"intensity_measure_types_and_levels", {{"PGA", json::array({0.1, 0.2, 0.3, 0.5})}}},
        {"truncation_level", 2.0},
        {"investigation_time", 1.0},
        {"number_of_logic_tree_samples", 10},
        {"random_seed", 7},
        {"maximum_distance", 300.0},

        {"description", "changed description"},
        {"poes", json::array({0.5})},
        {"individual_curves", true},
        {"quantile_hazard_curves", json::array({0.15, 0.85})},
        {"export_formats", json::array({"json", "loss_curves"})},
        {"export_dir", "/tmp/seisrisk-out"},
        {"vulnerability_original", "other_original.csv"},
        {"vulnerability_retrofitted", "other_retrofitted.csv"},
        {"interest_rate", 0.07},
        {"asset_life_expectancy", 50},
        {"loss_curve_resolution", 1e-3},
        {"loss_ratio_samples", 20},
        {"bin_representative", "right_edge"},
        {"integration_rule", "trapezoidal"},
        {"below_minimum_policy", "zero_below_minimum"},
        {"strict_validation", true},
        {"realization_warning_threshold", 5},
        {"max_workers", 2}
    };
}

} // anonymous namespace

TEST_CASE("Fnv1a64 matches the reference vectors", "[cache]") {
    Fnv1a64 empty;
    REQUIRE(empty.value() == 14695981039346656037ull);

    Fnv1a64 a;
    a.update_bytes("a", 1);
    REQUIRE(a.value() == 0xaf63dc4c8601ec8cull);
    REQUIRE(hash_to_hex(a.value()) == "af63dc4c8601ec8c");
}

TEST_CASE("Fnv1a64 canonicalizes floating point", "[cache]") {
    Fnv1a64 zero;
    zero.update_f64(0.0);
    Fnv1a64 negative_zero;
    negative_zero.update_f64(-0.0);
    REQUIRE(zero.value() == negative_zero.value());

    Fnv1a64 one;
    one.update_f64(1.0);
    REQUIRE(one.value() != zero.value());
}

TEST_CASE("Cache key is deterministic", "[cache]") {
    CacheKey first = make_cache_key(testing::reference_job());
    CacheKey second = make_cache_key(testing::reference_job());

    REQUIRE(first == second);
    REQUIRE(first.hex().size() == 16);
    REQUIRE(first.canonical.find("source_model_logic_tree.xml") != std::string::npos);
}

TEST_CASE("Cache key ignores site order", "[cache]") {
    JobConfig a = testing::reference_job();
    a.sites.push_back(Site("site-2", -122.0, 37.6));
    JobConfig b = a;
    std::swap(b.sites[0], b.sites[1]);

    REQUIRE(make_cache_key(a) == make_cache_key(b));
}

TEST_CASE("Cache key covers the hazard source", "[cache]") {
    JobConfig config = testing::reference_job();

    CacheKey original = make_cache_key(config, "fnv1a64:0000000000000001");
    CacheKey regenerated = make_cache_key(config, "fnv1a64:0000000000000002");

    REQUIRE(original != regenerated);
    REQUIRE(original.digest != regenerated.digest);
    REQUIRE(original == make_cache_key(config, "fnv1a64:0000000000000001"));
    REQUIRE(original.canonical.find("\"hazard_source\":\"fnv1a64:0000000000000001\"") != std::string::npos);
}

TEST_CASE("Cache key separates neighbouring string fields", "[cache]") {
    JobConfig a = testing::reference_job();
    a.source_model_logic_tree = "ab";
    a.gsim_logic_tree = "c";
    JobConfig b = testing::reference_job();
    b.source_model_logic_tree = "a";
    b.gsim_logic_tree = "bc";

    REQUIRE(make_cache_key(a).digest != make_cache_key(b).digest);
}

TEST_CASE("Every parameter is classified correctly by the cache key", "[cache]") {
    json base = json::parse(testing::reference_job_json());
    json changes = changed_values();

    // The fixture must cover the whole table, so a new parameter cannot skip this test
    std::set<std::string> covered;
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        covered.insert(it.key());
    }
    std::set<std::string> classified;
    for (const auto& entry : parameter_table()) {
        classified.insert(entry.first);
    }
    REQUIRE(covered == classified);

    CacheKey base_key = make_cache_key(parse_job_config_from_string(base.dump()));

    for (const auto& [name, scope] : parameter_table()) {
        json variant = base;
        variant[name] = changes[name];
        CacheKey key = make_cache_key(parse_job_config_from_string(variant.dump()));

        INFO("parameter: " << name << " (" << scope_to_string(scope) << ")");
        if (scope == ParameterScope::Hazard) {
            REQUIRE(key != base_key);
        } else {
            REQUIRE(key == base_key);
        }
    }
}
