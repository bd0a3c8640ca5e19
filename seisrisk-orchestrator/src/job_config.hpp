#ifndef SEISRISK_ORCHESTRATOR_JOB_CONFIG_HPP
#define SEISRISK_ORCHESTRATOR_JOB_CONFIG_HPP

#include "aggregation.hpp"
#include "risk_batch.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a parsed configuration has invalid values
 */
class JobConfigError : public std::runtime_error {
public:
    explicit JobConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Stage a configuration parameter feeds into
 *
 * Hazard parameters change the contents of the hazard curve store and are
 * part of the cache key. Downstream parameters only change aggregation,
 * risk or export, so a rerun that differs only in them reuses stored hazard.
 */
enum class ParameterScope {
    Hazard,
    Downstream
};

std::string scope_to_string(ParameterScope scope);

/**
 * @brief Site at which hazard is computed
 */
struct Site {
    std::string site_id;
    double lon;
    double lat;

    Site() : lon(0.0), lat(0.0) {}
    Site(const std::string& id, double lon_, double lat_)
        : site_id(id), lon(lon_), lat(lat_) {}
};

/**
 * @brief Complete job configuration
 *
 * Every field corresponds to exactly one entry of parameter_table().
 */
struct JobConfig {
    // Hazard-affecting
    std::string source_model_logic_tree;                                  ///< Source model logic tree reference
    std::string gsim_logic_tree;                                          ///< Ground-motion logic tree reference
    std::vector<Site> sites;                                              ///< Hazard sites
    std::map<std::string, std::vector<double>> intensity_measure_types_and_levels;  ///< IMT -> levels
    double truncation_level;                                              ///< GMPE truncation in standard deviations
    double investigation_time;                                            ///< Years covered by the hazard
    int number_of_logic_tree_samples;                                     ///< 0 = full enumeration
    long long random_seed;                                                ///< Sampling seed
    double maximum_distance;                                              ///< Source-site cutoff in km

    // Downstream-only
    std::string description;
    std::vector<double> poes;                                             ///< Hazard-map targets and conditional-loss poes
    bool individual_curves;                                               ///< Export every realization
    std::vector<double> quantile_hazard_curves;                           ///< Quantiles to aggregate
    std::vector<std::string> export_formats;                              ///< e.g. "json"
    std::string export_dir;
    std::string vulnerability_original;                                   ///< CSV path
    std::string vulnerability_retrofitted;                                ///< CSV path
    double interest_rate;
    int asset_life_expectancy;
    double loss_curve_resolution;
    int loss_ratio_samples;
    std::string bin_representative;                                       ///< left_edge, midpoint, right_edge
    std::string integration_rule;                                         ///< left_riemann, trapezoidal
    std::string below_minimum_policy;                                     ///< constant_first_probability, zero_below_minimum
    bool strict_validation;
    int realization_warning_threshold;
    int max_workers;                                                      ///< 0 = OpenMP default

    JobConfig();

    /**
     * @brief Aggregation settings derived from the downstream parameters
     */
    AggregationConfig to_aggregation_config() const;

    /**
     * @brief Per-asset batch settings derived from the downstream parameters
     */
    RiskBatchConfig to_batch_config() const;
};

/**
 * @brief Classification of every configuration key
 *
 * @return Map from JSON key to its scope
 */
const std::map<std::string, ParameterScope>& parameter_table();

/**
 * @brief Scope of one configuration key
 *
 * @throws std::invalid_argument for an unknown key
 */
ParameterScope parameter_scope(const std::string& name);

/**
 * @brief Names of all parameters with the given scope, sorted
 */
std::vector<std::string> parameters_with_scope(ParameterScope scope);

/**
 * @brief Parses a job configuration from a JSON file
 *
 * Relative vulnerability and export paths are resolved against the
 * directory of the configuration file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws JobConfigError if configuration values are invalid
 */
JobConfig parse_job_config_from_file(const std::string& file_path);

/**
 * @brief Parses a job configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid or contains an unknown key
 * @throws JobConfigError if configuration values are invalid
 */
JobConfig parse_job_config_from_string(const std::string& json_string);

/**
 * @brief Checks value ranges that do not depend on a single asset
 *
 * Economics are validated per asset so a bad rate or life is reported as an
 * InvalidEconomics failure for each asset instead of aborting the run.
 *
 * @throws JobConfigError describing the first invalid value
 */
void validate_job_config(const JobConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_JOB_CONFIG_HPP
