#include "job_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace seisrisk {
namespace orchestrator {

namespace {

const std::vector<std::string> kExportFormats = {"json", "hazard_curves", "loss_curves"};

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::vector<double> parse_double_list(const json& j, const std::string& key) {
    if (!j.is_array()) {
        throw ConfigParseError("Field '" + key + "' must be an array of numbers");
    }
    std::vector<double> values;
    for (const auto& v : j) {
        values.push_back(v.get<double>());
    }
    return values;
}

std::vector<Site> parse_sites(const json& j) {
    if (!j.is_array()) {
        throw ConfigParseError("Field 'sites' must be an array");
    }
    std::vector<Site> sites;
    for (const auto& site_json : j) {
        if (!site_json.contains("site_id")) {
            throw ConfigParseError("Site missing required field: site_id");
        }
        Site site;
        site.site_id = site_json["site_id"].get<std::string>();
        if (site_json.contains("lon")) {
            site.lon = site_json["lon"].get<double>();
        }
        if (site_json.contains("lat")) {
            site.lat = site_json["lat"].get<double>();
        }
        sites.push_back(site);
    }
    return sites;
}

bool strictly_increasing(const std::vector<double>& values) {
    for (size_t i = 1; i < values.size(); ++i) {
        if (!(values[i] > values[i - 1])) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string scope_to_string(ParameterScope scope) {
    switch (scope) {
        case ParameterScope::Hazard: return "hazard";
        case ParameterScope::Downstream: return "downstream";
        default: return "unknown";
    }
}

JobConfig::JobConfig()
    : truncation_level(3.0),
      investigation_time(50.0),
      number_of_logic_tree_samples(0),
      random_seed(42),
      maximum_distance(200.0),
      individual_curves(false),
      export_formats{"json"},
      interest_rate(0.0),
      asset_life_expectancy(0),
      loss_curve_resolution(1e-4),
      loss_ratio_samples(10),
      bin_representative("midpoint"),
      integration_rule("left_riemann"),
      below_minimum_policy("constant_first_probability"),
      strict_validation(false),
      realization_warning_threshold(100),
      max_workers(0) {}

AggregationConfig JobConfig::to_aggregation_config() const {
    AggregationConfig config;
    config.individual_curves = individual_curves;
    config.quantiles = quantile_hazard_curves;
    config.realization_warning_threshold = static_cast<size_t>(realization_warning_threshold);
    config.strict_validation = strict_validation;
    return config;
}

RiskBatchConfig JobConfig::to_batch_config() const {
    RiskBatchConfig config;
    config.convolution.representative = bin_representative_from_string(bin_representative);
    config.convolution.loss_resolution = loss_curve_resolution;
    config.convolution.loss_ratio_samples = static_cast<size_t>(loss_ratio_samples);
    config.convolution.strict_validation = strict_validation;
    config.integration.rule = integration_rule_from_string(integration_rule);
    config.integration.below_minimum = below_minimum_policy_from_string(below_minimum_policy);
    config.integration.strict_validation = strict_validation;
    config.interest_rate = interest_rate;
    config.life_expectancy_years = asset_life_expectancy;
    config.conditional_loss_poes = poes;
    config.keep_loss_curves = contains(export_formats, "loss_curves");
    config.max_workers = max_workers;
    return config;
}

const std::map<std::string, ParameterScope>& parameter_table() {
    static const std::map<std::string, ParameterScope> table = {
        {"source_model_logic_tree", ParameterScope::Hazard},
        {"gsim_logic_tree", ParameterScope::Hazard},
        {"sites", ParameterScope::Hazard},
        {"intensity_measure_types_and_levels", ParameterScope::Hazard},
        {"truncation_level", ParameterScope::Hazard},
        {"investigation_time", ParameterScope::Hazard},
        {"number_of_logic_tree_samples", ParameterScope::Hazard},
        {"random_seed", ParameterScope::Hazard},
        {"maximum_distance", ParameterScope::Hazard},

        {"description", ParameterScope::Downstream},
        {"poes", ParameterScope::Downstream},
        {"individual_curves", ParameterScope::Downstream},
        {"quantile_hazard_curves", ParameterScope::Downstream},
        {"export_formats", ParameterScope::Downstream},
        {"export_dir", ParameterScope::Downstream},
        {"vulnerability_original", ParameterScope::Downstream},
        {"vulnerability_retrofitted", ParameterScope::Downstream},
        {"interest_rate", ParameterScope::Downstream},
        {"asset_life_expectancy", ParameterScope::Downstream},
        {"loss_curve_resolution", ParameterScope::Downstream},
        {"loss_ratio_samples", ParameterScope::Downstream},
        {"bin_representative", ParameterScope::Downstream},
        {"integration_rule", ParameterScope::Downstream},
        {"below_minimum_policy", ParameterScope::Downstream},
        {"strict_validation", ParameterScope::Downstream},
        {"realization_warning_threshold", ParameterScope::Downstream},
        {"max_workers", ParameterScope::Downstream},
    };
    return table;
}

ParameterScope parameter_scope(const std::string& name) {
    const auto& table = parameter_table();
    auto it = table.find(name);
    if (it == table.end()) {
        throw std::invalid_argument("Unknown configuration parameter: " + name);
    }
    return it->second;
}

std::vector<std::string> parameters_with_scope(ParameterScope scope) {
    std::vector<std::string> names;
    for (const auto& [name, s] : parameter_table()) {
        if (s == scope) {
            names.push_back(name);
        }
    }
    return names;
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

void validate_job_config(const JobConfig& config) {
    if (config.sites.empty()) {
        throw JobConfigError("At least one site is required");
    }
    for (size_t i = 0; i < config.sites.size(); ++i) {
        if (config.sites[i].site_id.empty()) {
            throw JobConfigError("Site " + std::to_string(i) + " has an empty site_id");
        }
        for (size_t k = 0; k < i; ++k) {
            if (config.sites[k].site_id == config.sites[i].site_id) {
                throw JobConfigError("Duplicate site: " + config.sites[i].site_id);
            }
        }
    }

    if (config.intensity_measure_types_and_levels.empty()) {
        throw JobConfigError("At least one intensity measure type is required");
    }
    for (const auto& [imt, levels] : config.intensity_measure_types_and_levels) {
        if (levels.size() < 2) {
            throw JobConfigError("IMT '" + imt + "' needs at least two intensity levels");
        }
        if (levels.front() <= 0.0 || !strictly_increasing(levels)) {
            throw JobConfigError("Levels of IMT '" + imt + "' must be positive and strictly increasing");
        }
    }

    if (config.truncation_level < 0.0) {
        throw JobConfigError("truncation_level must be >= 0");
    }
    if (config.investigation_time <= 0.0) {
        throw JobConfigError("investigation_time must be > 0");
    }
    if (config.number_of_logic_tree_samples < 0) {
        throw JobConfigError("number_of_logic_tree_samples must be >= 0");
    }
    if (config.maximum_distance <= 0.0) {
        throw JobConfigError("maximum_distance must be > 0");
    }

    for (double poe : config.poes) {
        if (!(poe > 0.0 && poe < 1.0)) {
            throw JobConfigError("poes must lie in (0, 1), got " + std::to_string(poe));
        }
    }
    for (double q : config.quantile_hazard_curves) {
        if (!(q >= 0.0 && q <= 1.0)) {
            throw JobConfigError("quantile_hazard_curves must lie in [0, 1], got " + std::to_string(q));
        }
    }
    for (const auto& format : config.export_formats) {
        if (!contains(kExportFormats, format)) {
            throw JobConfigError("Unknown export format: " + format);
        }
    }

    if (config.loss_curve_resolution < 0.0) {
        throw JobConfigError("loss_curve_resolution must be >= 0");
    }
    if (config.loss_ratio_samples < 1) {
        throw JobConfigError("loss_ratio_samples must be >= 1");
    }
    if (config.realization_warning_threshold < 0) {
        throw JobConfigError("realization_warning_threshold must be >= 0");
    }
    if (config.max_workers < 0) {
        throw JobConfigError("max_workers must be >= 0");
    }

    try {
        bin_representative_from_string(config.bin_representative);
        integration_rule_from_string(config.integration_rule);
        below_minimum_policy_from_string(config.below_minimum_policy);
    } catch (const std::invalid_argument& e) {
        throw JobConfigError(e.what());
    }
}

JobConfig parse_job_config_from_string(const std::string& json_string) {
    JobConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Job configuration must be a JSON object");
        }

        // Every key must be classified
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (parameter_table().count(it.key()) == 0) {
                throw ConfigParseError("Unknown configuration parameter: " + it.key());
            }
        }

        // Hazard-affecting
        if (j.contains("source_model_logic_tree")) {
            config.source_model_logic_tree =
                expand_environment_variables(j["source_model_logic_tree"].get<std::string>());
        }
        if (j.contains("gsim_logic_tree")) {
            config.gsim_logic_tree = expand_environment_variables(j["gsim_logic_tree"].get<std::string>());
        }
        if (j.contains("sites")) {
            config.sites = parse_sites(j["sites"]);
        }
        if (j.contains("intensity_measure_types_and_levels")) {
            const json& imtls = j["intensity_measure_types_and_levels"];
            if (!imtls.is_object()) {
                throw ConfigParseError("Field 'intensity_measure_types_and_levels' must be an object");
            }
            for (auto it = imtls.begin(); it != imtls.end(); ++it) {
                config.intensity_measure_types_and_levels[it.key()] = parse_double_list(it.value(), it.key());
            }
        }
        if (j.contains("truncation_level")) {
            config.truncation_level = j["truncation_level"].get<double>();
        }
        if (j.contains("investigation_time")) {
            config.investigation_time = j["investigation_time"].get<double>();
        }
        if (j.contains("number_of_logic_tree_samples")) {
            config.number_of_logic_tree_samples = j["number_of_logic_tree_samples"].get<int>();
        }
        if (j.contains("random_seed")) {
            config.random_seed = j["random_seed"].get<long long>();
        }
        if (j.contains("maximum_distance")) {
            config.maximum_distance = j["maximum_distance"].get<double>();
        }

        // Downstream-only
        if (j.contains("description")) {
            config.description = j["description"].get<std::string>();
        }
        if (j.contains("poes")) {
            config.poes = parse_double_list(j["poes"], "poes");
        }
        if (j.contains("individual_curves")) {
            config.individual_curves = j["individual_curves"].get<bool>();
        }
        if (j.contains("quantile_hazard_curves")) {
            config.quantile_hazard_curves = parse_double_list(j["quantile_hazard_curves"], "quantile_hazard_curves");
        }
        if (j.contains("export_formats")) {
            config.export_formats.clear();
            for (const auto& format : j["export_formats"]) {
                config.export_formats.push_back(format.get<std::string>());
            }
        }
        if (j.contains("export_dir")) {
            config.export_dir = expand_environment_variables(j["export_dir"].get<std::string>());
        }
        if (j.contains("vulnerability_original")) {
            config.vulnerability_original =
                expand_environment_variables(j["vulnerability_original"].get<std::string>());
        }
        if (j.contains("vulnerability_retrofitted")) {
            config.vulnerability_retrofitted =
                expand_environment_variables(j["vulnerability_retrofitted"].get<std::string>());
        }
        if (j.contains("interest_rate")) {
            config.interest_rate = j["interest_rate"].get<double>();
        }
        if (j.contains("asset_life_expectancy")) {
            config.asset_life_expectancy = j["asset_life_expectancy"].get<int>();
        }
        if (j.contains("loss_curve_resolution")) {
            config.loss_curve_resolution = j["loss_curve_resolution"].get<double>();
        }
        if (j.contains("loss_ratio_samples")) {
            config.loss_ratio_samples = j["loss_ratio_samples"].get<int>();
        }
        if (j.contains("bin_representative")) {
            config.bin_representative = j["bin_representative"].get<std::string>();
        }
        if (j.contains("integration_rule")) {
            config.integration_rule = j["integration_rule"].get<std::string>();
        }
        if (j.contains("below_minimum_policy")) {
            config.below_minimum_policy = j["below_minimum_policy"].get<std::string>();
        }
        if (j.contains("strict_validation")) {
            config.strict_validation = j["strict_validation"].get<bool>();
        }
        if (j.contains("realization_warning_threshold")) {
            config.realization_warning_threshold = j["realization_warning_threshold"].get<int>();
        }
        if (j.contains("max_workers")) {
            config.max_workers = j["max_workers"].get<int>();
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON value out of range: ") + e.what());
    }

    validate_job_config(config);

    return config;
}

JobConfig parse_job_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    JobConfig config = parse_job_config_from_string(buffer.str());

    // Resolve relative paths
    if (!config.vulnerability_original.empty()) {
        config.vulnerability_original = resolve_relative_path(config.vulnerability_original, file_path);
    }
    if (!config.vulnerability_retrofitted.empty()) {
        config.vulnerability_retrofitted = resolve_relative_path(config.vulnerability_retrofitted, file_path);
    }
    if (!config.export_dir.empty()) {
        config.export_dir = resolve_relative_path(config.export_dir, file_path);
    }

    return config;
}

} // namespace orchestrator
} // namespace seisrisk
