/**
 * @file test_file_hazard_calculator.cpp
 * @brief Unit tests for the file-backed hazard calculator
 */

#include <catch2/catch.hpp>
#include "file_hazard_calculator.hpp"
#include "errors.hpp"
#include "mock_hazard_calculator.hpp"
#include <filesystem>
#include <fstream>

using namespace seisrisk;
using namespace seisrisk::orchestrator;
using Catch::Matchers::WithinAbs;

namespace {

std::string write_hazard_csv(const testing::TempDir& dir) {
    std::string path = (dir.path() / "hazard.csv").string();
    std::ofstream file(path);
    file << "site_id,imt,realization,weight,iml,poe\n"
         << "site-1,PGA,rlz-0,0.5,0.1,0.5\n"
         << "site-1,PGA,rlz-0,0.5,0.5,0.02\n"
         << "site-1,PGA,rlz-1,0.5,0.1,0.6\n"
         << "site-1,PGA,rlz-1,0.5,0.5,0.04\n"
         << "site-1,SA(1.0),rlz-0,0.5,0.1,0.2\n"
         << "site-1,SA(1.0),rlz-0,0.5,0.5,0.01\n"
         << "site-2,PGA,rlz-0,0.5,0.1,0.3\n"
         << "site-2,PGA,rlz-0,0.5,0.5,0.01\n";
    return path;
}

} // anonymous namespace

TEST_CASE("FileHazardCalculator serves the configured slice", "[hazard]") {
    testing::TempDir dir("seisrisk-hazard");
    FileHazardCalculator calculator(write_hazard_csv(dir));
    CancellationToken token;

    REQUIRE(calculator.name().rfind("file:", 0) == 0);

    JobConfig config = testing::reference_job();
    io::HazardTable table = calculator.compute(config, token);

    // site-2 and SA(1.0) are not part of the job
    REQUIRE(table.curves.size() == 2);
    REQUIRE(table.weights.size() == 2);
    for (const HazardCurve& curve : table.curves) {
        REQUIRE(curve.site_id() == "site-1");
        REQUIRE(curve.imt() == "PGA");
        REQUIRE(curve.imls() == std::vector<double>{0.1, 0.3, 0.5});
    }

    // Resampled onto the job's levels by linear interpolation
    REQUIRE_THAT(table.curves[0].poes()[1], WithinAbs(0.26, 1e-12));
}

TEST_CASE("FileHazardCalculator errors", "[hazard]") {
    testing::TempDir dir("seisrisk-hazard");
    std::string path = write_hazard_csv(dir);
    JobConfig config = testing::reference_job();

    SECTION("No matching curves") {
        config.sites = {Site("site-9", 0.0, 0.0)};
        FileHazardCalculator calculator(path);
        CancellationToken token;
        REQUIRE_THROWS_AS(calculator.compute(config, token), std::runtime_error);
    }

    SECTION("Cancelled before reading") {
        FileHazardCalculator calculator(path);
        CancellationToken token;
        token.cancel();
        REQUIRE_THROWS_AS(calculator.compute(config, token), ComputationCancelled);
    }
}

TEST_CASE("FileHazardCalculator fingerprints the file contents", "[hazard][cache]") {
    testing::TempDir dir("seisrisk-hazard");
    std::string path = write_hazard_csv(dir);
    FileHazardCalculator calculator(path);

    std::string first = calculator.fingerprint();
    REQUIRE(first.rfind("fnv1a64:", 0) == 0);
    REQUIRE(calculator.fingerprint() == first);

    SECTION("Same bytes under another path") {
        std::string copy = (dir.path() / "copy.csv").string();
        std::filesystem::copy_file(path, copy);
        REQUIRE(FileHazardCalculator(copy).fingerprint() == first);
    }

    SECTION("Rewritten file") {
        {
            std::ofstream file(path, std::ios::app);
            file << "site-2,SA(1.0),rlz-0,0.5,0.1,0.1\n";
        }
        REQUIRE(calculator.fingerprint() != first);
    }

    SECTION("Missing file") {
        FileHazardCalculator missing((dir.path() / "absent.csv").string());
        REQUIRE_THROWS_AS(missing.fingerprint(), std::runtime_error);
    }
}
