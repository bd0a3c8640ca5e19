#include <catch2/catch.hpp>
#include <cmath>
#include <sstream>
#include "hazard_curve.hpp"
#include "io/hazard_table.hpp"

using namespace seisrisk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

HazardCurve make_scenario_curve() {
    return HazardCurve("site-1", "PGA", {0.1, 0.3, 0.5}, {0.5, 0.1, 0.02});
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("HazardCurve defaults to the mean realization", "[hazard]") {
    HazardCurve curve = make_scenario_curve();

    REQUIRE(curve.site_id() == "site-1");
    REQUIRE(curve.imt() == "PGA");
    REQUIRE(curve.is_mean());
    REQUIRE(curve.size() == 3);
    REQUIRE(curve.is_monotone());
}

TEST_CASE("HazardCurve rejects malformed tables", "[hazard]") {
    SECTION("no levels") {
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {}, {}), std::invalid_argument);
    }
    SECTION("size mismatch") {
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {0.1, 0.2}, {0.5}), std::invalid_argument);
    }
    SECTION("levels not strictly increasing") {
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {0.1, 0.1}, {0.5, 0.4}), std::invalid_argument);
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {0.3, 0.1}, {0.5, 0.4}), std::invalid_argument);
    }
    SECTION("probability outside [0, 1]") {
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {0.1, 0.2}, {1.5, 0.4}), std::invalid_argument);
        REQUIRE_THROWS_AS(HazardCurve("s", "PGA", {0.1, 0.2}, {0.5, -0.1}), std::invalid_argument);
    }
}

TEST_CASE("Non-monotone probabilities are accepted but detectable", "[hazard]") {
    HazardCurve curve("s", "PGA", {0.1, 0.2, 0.3}, {0.5, 0.6, 0.1});
    REQUIRE_FALSE(curve.is_monotone());
}

// ============================================================================
// Interpolation and resampling
// ============================================================================

TEST_CASE("poe_at interpolates linearly and is flat outside the table", "[hazard]") {
    HazardCurve curve = make_scenario_curve();

    REQUIRE(curve.poe_at(0.1) == 0.5);
    REQUIRE(curve.poe_at(0.3) == 0.1);
    REQUIRE_THAT(curve.poe_at(0.2), WithinAbs(0.3, 1e-12));
    REQUIRE_THAT(curve.poe_at(0.4), WithinAbs(0.06, 1e-12));
    REQUIRE(curve.poe_at(0.01) == 0.5);
    REQUIRE(curve.poe_at(2.0) == 0.02);
}

TEST_CASE("union_levels merges and deduplicates", "[hazard]") {
    std::vector<double> levels = union_levels({0.1, 0.3, 0.5}, {0.2, 0.3, 0.6});
    REQUIRE(levels == std::vector<double>{0.1, 0.2, 0.3, 0.5, 0.6});
}

TEST_CASE("resample_to_common_support returns curves on identical levels", "[hazard]") {
    HazardCurve a("s", "PGA", {0.1, 0.3, 0.5}, {0.5, 0.1, 0.02}, "rlz-0");
    HazardCurve b("s", "PGA", {0.2, 0.4}, {0.4, 0.05}, "rlz-1");

    auto [ra, rb] = resample_to_common_support(a, b);

    REQUIRE(ra.imls() == rb.imls());
    REQUIRE(ra.imls() == std::vector<double>{0.1, 0.2, 0.3, 0.4, 0.5});
    REQUIRE(ra.realization() == "rlz-0");
    REQUIRE(rb.realization() == "rlz-1");
    REQUIRE_THAT(ra.poes()[1], WithinAbs(0.3, 1e-12));
    REQUIRE(rb.poes()[0] == 0.4);
    REQUIRE(rb.poes()[4] == 0.05);
    REQUIRE(ra.is_monotone());
    REQUIRE(rb.is_monotone());
}

TEST_CASE("Resampling onto the same levels is the identity", "[hazard]") {
    HazardCurve curve = make_scenario_curve();
    REQUIRE(curve.resampled(curve.imls()) == curve);
}

// ============================================================================
// Hazard maps
// ============================================================================

TEST_CASE("hazard_map_value interpolates in log-log space", "[hazard][maps]") {
    HazardCurve curve = make_scenario_curve();

    SECTION("tabulated probability returns its level") {
        REQUIRE_THAT(hazard_map_value(curve, 0.1), WithinRel(0.3, 1e-12));
    }
    SECTION("between levels") {
        double expected = std::exp(std::log(0.1) +
                                   (std::log(0.5) - std::log(0.2)) / (std::log(0.5) - std::log(0.1)) *
                                       (std::log(0.3) - std::log(0.1)));
        REQUIRE_THAT(hazard_map_value(curve, 0.2), WithinRel(expected, 1e-12));
    }
    SECTION("clamped to the tabulated range") {
        REQUIRE(hazard_map_value(curve, 0.9) == 0.1);
        REQUIRE(hazard_map_value(curve, 0.001) == 0.5);
    }
    SECTION("probability outside (0, 1) is rejected") {
        REQUIRE_THROWS_AS(hazard_map_value(curve, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(hazard_map_value(curve, 1.0), std::invalid_argument);
    }
}

// ============================================================================
// Index
// ============================================================================

TEST_CASE("HazardCurveIndex looks curves up by site and IMT", "[hazard]") {
    HazardCurveIndex index;
    index.add(make_scenario_curve());
    index.add(HazardCurve("site-1", "SA(0.3)", {0.1, 0.2}, {0.3, 0.1}));
    index.add(HazardCurve("site-2", "PGA", {0.1, 0.2}, {0.2, 0.1}));

    REQUIRE(index.size() == 3);
    REQUIRE(index.find("site-1", "PGA") != nullptr);
    REQUIRE(index.find("site-1", "SA(0.3)")->poes().front() == 0.3);
    REQUIRE(index.find("site-2", "SA(0.3)") == nullptr);
    REQUIRE(index.any_for_site("site-2")->imt() == "PGA");
    REQUIRE(index.any_for_site("site-3") == nullptr);

    index.mark_failed("site-3", "PGA", ErrorKind::MalformedCurve, "bad realization");
    REQUIRE(index.find("site-3", "PGA") == nullptr);
    REQUIRE(index.failure("site-3", "PGA")->kind == ErrorKind::MalformedCurve);
    REQUIRE(index.failure("site-1", "PGA") == nullptr);
}

// ============================================================================
// Hazard table input
// ============================================================================

TEST_CASE("Hazard table CSV groups rows into per-realization curves", "[hazard][io]") {
    std::istringstream csv(
        "site_id,imt,realization,weight,iml,poe\n"
        "# two realizations, rows out of order\n"
        "site-1,PGA,rlz-0,0.6,0.3,0.1\n"
        "site-1,PGA,rlz-0,0.6,0.1,0.5\n"
        "site-1,PGA,rlz-1,0.4,0.1,0.4\n"
        "site-1,PGA,rlz-1,0.4,0.3,0.2\n");

    io::HazardTable table = io::load_hazard_table_csv(csv);

    REQUIRE(table.curves.size() == 2);
    REQUIRE(table.realization_count() == 2);
    REQUIRE(table.weights.at("rlz-0") == 0.6);
    REQUIRE(table.curves[0].realization() == "rlz-0");
    REQUIRE(table.curves[0].imls() == std::vector<double>{0.1, 0.3});
    REQUIRE(table.curves[0].poes() == std::vector<double>{0.5, 0.1});
}

TEST_CASE("Hazard table CSV rejects inconsistent weights", "[hazard][io]") {
    std::istringstream csv(
        "site_id,imt,realization,weight,iml,poe\n"
        "site-1,PGA,rlz-0,0.6,0.1,0.5\n"
        "site-2,PGA,rlz-0,0.5,0.1,0.5\n");

    REQUIRE_THROWS_AS(io::load_hazard_table_csv(csv), std::runtime_error);
}

TEST_CASE("Hazard table CSV requires every column", "[hazard][io]") {
    std::istringstream csv("site_id,imt,iml,poe\nsite-1,PGA,0.1,0.5\n");
    REQUIRE_THROWS_AS(io::load_hazard_table_csv(csv), std::runtime_error);
}
