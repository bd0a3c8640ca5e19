#include <iostream>
#include <fstream>
#include <string>
#include "asset.hpp"
#include "benefit_cost.hpp"
#include "vulnerability.hpp"
#include "file_hazard_calculator.hpp"
#include "job_config.hpp"
#include "logger.hpp"
#include "reuse_controller.hpp"
#include "risk_calculation.hpp"
#include "store_repository.hpp"

using namespace seisrisk;
using namespace seisrisk::orchestrator;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string assets_path;
    std::string hazard_path;
    std::string cache_dir;
    std::string output_path;
    std::string run_id = "seisrisk-run";
    std::string log_level = "INFO";
    std::string log_file;
    bool plain_log = false;
    bool invalidate = false;
    bool summary = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "SeisRisk v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>       Job configuration (JSON)\n";
    std::cerr << "  --assets <path>       Assets CSV: asset_id,site_id,taxonomy,value,retrofit_cost[,lon,lat]\n";
    std::cerr << "  --hazard <path>       Hazard curves from the PSHA run (CSV or Parquet):\n";
    std::cerr << "                        site_id,imt,realization,weight,iml,poe\n\n";
    std::cerr << "Cache options:\n";
    std::cerr << "  --cache-dir <path>    Persist hazard stores here and reuse them across runs\n";
    std::cerr << "  --invalidate          Drop the stored hazard for this job before running\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>       JSON output file (default: stdout)\n";
    std::cerr << "  --summary             Print one line per asset to stderr\n";
    std::cerr << "  --run-id <id>         Identifier attached to log events (default: seisrisk-run)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>   DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>     Also write log events to this file\n";
    std::cerr << "  --plain-log           Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                Show this help message\n\n";
    std::cerr << "Exit status: 0 all assets succeeded, 2 some assets failed, 1 run failed\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config job.json --assets assets.csv \\\n";
    std::cerr << "      --hazard hazard_curves.csv --cache-dir ~/.seisrisk/cache \\\n";
    std::cerr << "      --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--assets" && i + 1 < argc) {
            args.assets_path = argv[++i];
        } else if (arg == "--hazard" && i + 1 < argc) {
            args.hazard_path = argv[++i];
        } else if (arg == "--cache-dir" && i + 1 < argc) {
            args.cache_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--run-id" && i + 1 < argc) {
            args.run_id = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--plain-log") {
            args.plain_log = true;
        } else if (arg == "--invalidate") {
            args.invalidate = true;
        } else if (arg == "--summary") {
            args.summary = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.assets_path.empty()) {
        std::cerr << "Error: --assets is required\n";
        valid = false;
    } else if (!file_exists(args.assets_path)) {
        std::cerr << "Error: Assets file not found: " << args.assets_path << "\n";
        valid = false;
    }

    if (args.hazard_path.empty()) {
        std::cerr << "Error: --hazard is required\n";
        valid = false;
    } else if (!file_exists(args.hazard_path)) {
        std::cerr << "Error: Hazard file not found: " << args.hazard_path << "\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    LoggerConfig log_config;
    log_config.min_level = string_to_level(args.log_level);
    log_config.enable_json = !args.plain_log;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    Logger& logger = Logger::get_instance();
    logger.configure(log_config);

    try {
        std::cerr << "Loading job config from " << args.config_path << "..." << std::flush;
        JobConfig config = parse_job_config_from_file(args.config_path);
        std::cerr << " done\n";

        if (config.vulnerability_original.empty() || config.vulnerability_retrofitted.empty()) {
            std::cerr << "Error: vulnerability_original and vulnerability_retrofitted must be set in the job config\n";
            return 1;
        }

        std::cerr << "Loading assets from " << args.assets_path << "..." << std::flush;
        AssetSet assets = AssetSet::load_from_csv(args.assets_path);
        std::cerr << " loaded " << assets.size() << " assets\n";

        std::cerr << "Loading vulnerability models..." << std::flush;
        VulnerabilityModel original = VulnerabilityModel::load_from_csv(config.vulnerability_original);
        VulnerabilityModel retrofitted = VulnerabilityModel::load_from_csv(config.vulnerability_retrofitted);
        std::cerr << " " << original.size() << " original, " << retrofitted.size() << " retrofitted functions\n";

        StoreRepository repository(args.cache_dir);
        FileHazardCalculator calculator(args.hazard_path);
        ReuseController controller(repository, calculator);

        if (args.invalidate) {
            controller.invalidate(config);
        }

        CancellationToken token;
        RiskCalculation calculation(controller);
        RiskRunResult result = calculation.run(args.run_id, config, assets, original, retrofitted, token);

        if (args.output_path.empty()) {
            write_risk_run_json(std::cout, result, config);
        } else {
            write_risk_run_json(args.output_path, result, config);
            std::cerr << "Results written to " << args.output_path << "\n";
        }

        std::cerr << "\nHazard: " << (result.hazard_reused ? "reused" : "computed")
                  << " (key " << result.cache_key << ")\n";
        std::cerr << "Assets: " << result.batch.succeeded << " succeeded, "
                  << result.batch.failed << " failed\n";

        if (args.summary) {
            for (const auto& entry : result.batch.outcomes) {
                if (entry.second.success) {
                    std::cerr << "  " << format_benefit_cost(entry.second.result.benefit_cost) << "\n";
                }
            }
        }

        logger.flush();

        if (result.batch.failed == 0) {
            return 0;
        }
        return result.batch.succeeded > 0 ? 2 : 1;

    } catch (const std::exception& e) {
        RunContext ctx(args.run_id);
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
