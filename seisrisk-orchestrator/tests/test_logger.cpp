/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace seisrisk;

// Helper function to parse JSON log line
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    // Very simple JSON parser for test purposes (flat string values only)
    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, bool json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json;
    Logger::get_instance().configure(config);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "seisrisk.log");
    }

    SECTION("Log level filtering") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::WARN);
    }

    SECTION("Level names round-trip") {
        REQUIRE(string_to_level(level_to_string(LogLevel::DEBUG)) == LogLevel::DEBUG);
        REQUIRE(string_to_level(level_to_string(LogLevel::ERROR)) == LogLevel::ERROR);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }
}

TEST_CASE("Logger cache decision events", "[logger]") {
    const std::string path = "test_cache_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    RunContext ctx("run-7", "00ff00ff00ff00ff");
    ctx.phase = "hazard";

    logger.log_cache_miss(ctx, "not_found");
    logger.log_hazard_computation_start(ctx);
    logger.log_hazard_computation_complete(ctx, 12, 5.5);
    logger.log_cache_hit(ctx, 12);
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 4);

    auto miss = parse_json_log(lines[0]);
    REQUIRE(miss["event"] == "cache_miss");
    REQUIRE(miss["reason"] == "not_found");
    REQUIRE(miss["run_id"] == "run-7");
    REQUIRE(miss["cache_key"] == "00ff00ff00ff00ff");
    REQUIRE(miss["phase"] == "hazard");
    REQUIRE(miss["level"] == "INFO");
    REQUIRE_FALSE(miss["timestamp"].empty());

    REQUIRE(parse_json_log(lines[1])["event"] == "hazard_start");

    auto complete = parse_json_log(lines[2]);
    REQUIRE(complete["event"] == "hazard_complete");
    REQUIRE(complete["curve_count"] == "12");

    auto hit = parse_json_log(lines[3]);
    REQUIRE(hit["event"] == "cache_hit");
    REQUIRE(hit["curve_count"] == "12");

    std::filesystem::remove(path);
}

TEST_CASE("Logger warning and failure events", "[logger]") {
    const std::string path = "test_warning_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    RunContext ctx("run-8");

    AssetFailure failure;
    failure.asset_id = "asset-3";
    failure.kind = ErrorKind::InvalidEconomics;
    failure.message = "Invalid retrofit_cost: must be > 0";
    failure.parameter = "retrofit_cost";

    logger.log_asset_failure(ctx, failure);
    logger.log_resource_warning(ctx, "Exporting individual curves for 500 realizations", 500, 4096);
    logger.log_data_quality(ctx, "asset-1", "non-monotone hazard curve");
    logger.log_cache_inconsistency(ctx, "checksum mismatch");
    logger.log_computation_cancelled(ctx);
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 5);

    auto failed = parse_json_log(lines[0]);
    REQUIRE(failed["event"] == "asset_failure");
    REQUIRE(failed["level"] == "ERROR");
    REQUIRE(failed["asset_id"] == "asset-3");
    REQUIRE(failed["kind"] == "InvalidEconomics");
    REQUIRE(failed["parameter"] == "retrofit_cost");
    REQUIRE(failed.count("cache_key") == 0);

    auto resource = parse_json_log(lines[1]);
    REQUIRE(resource["event"] == "resource_warning");
    REQUIRE(resource["level"] == "WARN");
    REQUIRE(resource["realizations"] == "500");
    REQUIRE(resource["estimated_bytes"] == "4096");

    auto quality = parse_json_log(lines[2]);
    REQUIRE(quality["event"] == "data_quality");
    REQUIRE(quality["subject"] == "asset-1");

    REQUIRE(parse_json_log(lines[3])["event"] == "cache_inconsistency");
    REQUIRE(parse_json_log(lines[4])["event"] == "hazard_cancelled");

    std::filesystem::remove(path);
}

TEST_CASE("Logger drops events below the minimum level", "[logger]") {
    const std::string path = "test_level_filter.log";
    log_to_file(path, LogLevel::WARN);
    Logger& logger = Logger::get_instance();

    RunContext ctx("run-9");
    logger.log_cache_hit(ctx, 3);             // INFO
    logger.log_warning(ctx, "kept warning");  // WARN
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(parse_json_log(lines[0])["event"] == "warning");

    std::filesystem::remove(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    const std::string path = "test_plain.log";
    log_to_file(path, LogLevel::DEBUG, false);
    Logger& logger = Logger::get_instance();

    RunSummary summary;
    summary.assets = 3;
    summary.succeeded = 2;
    summary.failed = 1;
    logger.log_run_summary(RunContext("run-10"), summary);
    logger.flush();

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] Risk run completed") != std::string::npos);
    REQUIRE(lines[0].find("failed=1") != std::string::npos);
    REQUIRE(lines[0].find("event=run_summary") != std::string::npos);

    std::filesystem::remove(path);
}
