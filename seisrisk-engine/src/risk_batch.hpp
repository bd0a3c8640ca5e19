#ifndef SEISRISK_RISK_BATCH_HPP
#define SEISRISK_RISK_BATCH_HPP

#include "asset.hpp"
#include "benefit_cost.hpp"
#include "convolution.hpp"
#include "errors.hpp"
#include "hazard_curve.hpp"
#include "loss_curve.hpp"
#include "loss_integrator.hpp"
#include "vulnerability.hpp"
#include <map>
#include <string>
#include <vector>

namespace seisrisk {

struct RiskBatchConfig {
    ConvolutionConfig convolution;
    IntegrationConfig integration;
    double interest_rate;                        // Shared by all assets
    int life_expectancy_years;                   // Shared by all assets
    std::vector<double> conditional_loss_poes;   // Annual poes to read losses at (default none)
    bool keep_loss_curves;                       // Keep both loss-ratio curves in the result
    int max_workers;                             // Thread cap, 0 = OpenMP default

    RiskBatchConfig();
};

// Everything computed for one asset. AALs, conditional losses and the
// benefit-cost figures are monetary; curves stay in loss-ratio units.
struct AssetRiskResult {
    std::string asset_id;
    double asset_value;
    double aal_ratio_original;
    double aal_ratio_retrofitted;
    BenefitCostResult benefit_cost;
    std::map<double, double> conditional_loss_original;
    std::map<double, double> conditional_loss_retrofitted;
    LossExceedanceCurve loss_curve_original;
    LossExceedanceCurve loss_curve_retrofitted;
    std::vector<std::string> warnings;

    AssetRiskResult();
};

struct AssetFailure {
    std::string asset_id;
    ErrorKind kind;
    std::string message;
    std::string parameter;   // Offending parameter for InvalidEconomics

    AssetFailure();
};

// Either a result or a typed failure
struct AssetOutcome {
    bool success;
    AssetRiskResult result;
    AssetFailure failure;

    AssetOutcome();
};

struct RiskBatchResult {
    std::map<std::string, AssetOutcome> outcomes;   // Keyed by asset id
    std::vector<AssetFailure> failures;             // Same failures, in asset order
    size_t succeeded;
    size_t failed;
    double execution_time_ms;

    RiskBatchResult();
};

// Runs both vulnerability variants for one asset, integrates each curve and
// compares the two AALs. Throws RiskError subclasses:
//   MissingInput                  no hazard curve for the site or no function for the taxonomy
//   IncompatibleIntensityMeasure  the site has hazard only for other IMTs
//   InvalidEconomics              bad rate, life, retrofit cost or asset value
//   DegenerateCurve, MalformedCurve from convolution and integration
// A (site, imt) marked failed in the index raises its recorded kind and message.
AssetRiskResult assess_asset(const Asset& asset,
                             const HazardCurveIndex& hazard,
                             const VulnerabilityModel& original,
                             const VulnerabilityModel& retrofitted,
                             const RiskBatchConfig& config = RiskBatchConfig());

// Assesses every asset; assets are independent and run in parallel when
// OpenMP is available. A failing asset is recorded and the batch continues.
RiskBatchResult run_risk_batch(const AssetSet& assets,
                               const HazardCurveIndex& hazard,
                               const VulnerabilityModel& original,
                               const VulnerabilityModel& retrofitted,
                               const RiskBatchConfig& config = RiskBatchConfig());

} // namespace seisrisk

#endif // SEISRISK_RISK_BATCH_HPP
