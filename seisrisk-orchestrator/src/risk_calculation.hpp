/**
 * @file risk_calculation.hpp
 * @brief One retrofit risk run, from hazard acquisition to per-asset BCR
 *
 * Pipeline:
 *   ReuseController (stored or fresh hazard)
 *     -> RealizationAggregator per (site, imt)
 *     -> hazard maps at the configured poes
 *     -> run_risk_batch over the mean curves (original and retrofitted)
 *
 * Data-quality warnings, the resource warning for large individual exports
 * and every asset failure are logged through the Logger singleton.
 */

#ifndef SEISRISK_ORCHESTRATOR_RISK_CALCULATION_HPP
#define SEISRISK_ORCHESTRATOR_RISK_CALCULATION_HPP

#include "aggregation.hpp"
#include "asset.hpp"
#include "hazard_store.hpp"
#include "job_config.hpp"
#include "reuse_controller.hpp"
#include "risk_batch.hpp"
#include "vulnerability.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief A (site, imt) group whose realizations could not be aggregated
 */
struct HazardGroupFailure {
    std::string site_id;
    std::string imt;
    ErrorKind kind;          ///< MissingInput for inconsistent realizations, else the error's kind
    std::string message;

    HazardGroupFailure() : kind(ErrorKind::Unexpected) {}
};

/**
 * @brief Everything one run produced
 */
struct RiskRunResult {
    std::string run_id;
    std::string cache_key;                       ///< Hex digest of the hazard key
    bool hazard_reused;                          ///< Hazard came from the store
    bool hazard_coalesced;                       ///< Waited on a concurrent computation
    std::vector<AggregatedCurves> hazard;        ///< One entry per usable (site, imt), ordered
    std::vector<HazardGroupFailure> hazard_failures; ///< Groups left out of hazard, ordered
    std::map<std::string, double> hazard_maps;   ///< Map product key -> intensity
    RiskBatchResult batch;
    std::vector<std::string> warnings;           ///< Run-level warnings (resource risk)
    double hazard_time_ms;
    double execution_time_ms;

    RiskRunResult()
        : hazard_reused(false), hazard_coalesced(false),
          hazard_time_ms(0.0), execution_time_ms(0.0) {}
};

/**
 * @brief Aggregates every (site, imt) group of a store
 *
 * Groups are independent and run in parallel when OpenMP is available.
 * Both outputs are ordered like store.groups() regardless of worker count.
 * A group that fails (realizations missing so the weights fall short of 1,
 * or a non-monotone realization under strict validation) is appended to
 * failures and left out of the returned statistics; the others still run.
 */
std::vector<AggregatedCurves> aggregate_store(const HazardCurveStore& store,
                                              const RealizationAggregator& aggregator,
                                              int max_workers,
                                              std::vector<HazardGroupFailure>& failures);

/**
 * @brief Intensities at each poe on every mean and quantile curve
 *
 * @return Map keyed by mean_hazard_map_key / quantile_hazard_map_key
 */
std::map<std::string, double> extract_hazard_maps(const std::string& job_key,
                                                  const std::vector<AggregatedCurves>& hazard,
                                                  const std::vector<double>& poes);

/**
 * @brief Runs the risk pipeline for one job
 *
 * Usage Example:
 *   @code
 *   RiskCalculation calculation(controller);
 *   CancellationToken token;
 *   RiskRunResult result = calculation.run("run-1", config, assets,
 *                                          original, retrofitted, token);
 *   write_risk_run_json(std::cout, result, config);
 *   @endcode
 */
class RiskCalculation {
public:
    explicit RiskCalculation(ReuseController& controller);

    /**
     * @brief Runs one job
     *
     * Per-asset failures are collected in the result. Assets whose
     * (site, imt) group could not be aggregated fail with that group's
     * kind and message. The run itself only throws when hazard cannot be
     * obtained.
     *
     * @throws ComputationCancelled if the token is cancelled while hazard
     *         is being obtained
     */
    RiskRunResult run(const std::string& run_id,
                      const JobConfig& config,
                      const AssetSet& assets,
                      const VulnerabilityModel& original,
                      const VulnerabilityModel& retrofitted,
                      const CancellationToken& token);

private:
    ReuseController& controller_;
};

/**
 * @brief JSON form of a run
 *
 * Keys: cache_key, hazard_maps, results, failures, summary; hazard_failures
 * when some (site, imt) group could not be aggregated; hazard_curves
 * and loss_curves (product keys -> curves) when the matching export format
 * is requested. Timing and the run id are left out unless include_timing is
 * set, so that runs over the same inputs serialize to the same bytes.
 */
nlohmann::json risk_run_to_json(const RiskRunResult& result, const JobConfig& config,
                                bool include_timing = false);

void write_risk_run_json(std::ostream& os, const RiskRunResult& result, const JobConfig& config,
                         bool pretty_print = true);

void write_risk_run_json(const std::string& filepath, const RiskRunResult& result,
                         const JobConfig& config, bool pretty_print = true);

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_RISK_CALCULATION_HPP
