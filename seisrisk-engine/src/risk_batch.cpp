#include "risk_batch.hpp"
#include <chrono>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace seisrisk {

RiskBatchConfig::RiskBatchConfig()
    : interest_rate(0.0),
      life_expectancy_years(0),
      keep_loss_curves(false),
      max_workers(0) {}

AssetRiskResult::AssetRiskResult()
    : asset_value(0.0),
      aal_ratio_original(0.0),
      aal_ratio_retrofitted(0.0) {}

AssetFailure::AssetFailure()
    : kind(ErrorKind::Unexpected) {}

AssetOutcome::AssetOutcome()
    : success(false) {}

RiskBatchResult::RiskBatchResult()
    : succeeded(0), failed(0), execution_time_ms(0.0) {}

namespace {

const VulnerabilityFunction& require_function(const VulnerabilityModel& model,
                                              VulnerabilityVariant variant,
                                              const Asset& asset) {
    const VulnerabilityFunction* function = model.find(asset.taxonomy);
    if (function == nullptr) {
        throw MissingInput("No " + variant_to_string(variant) +
                           " vulnerability function for taxonomy '" + asset.taxonomy +
                           "' (asset " + asset.asset_id + ")");
    }
    return *function;
}

const HazardCurve& require_hazard(const HazardCurveIndex& hazard,
                                  const Asset& asset,
                                  const std::string& imt) {
    const HazardCurve* curve = hazard.find(asset.site_id, imt);
    if (curve != nullptr) {
        return *curve;
    }
    const HazardGroupError* failed = hazard.failure(asset.site_id, imt);
    if (failed != nullptr) {
        throw RiskError(failed->kind, failed->message + " (asset " + asset.asset_id + ")");
    }
    const HazardCurve* other = hazard.any_for_site(asset.site_id);
    if (other != nullptr) {
        throw IncompatibleIntensityMeasure(other->imt(), imt);
    }
    throw MissingInput("No hazard curve for site '" + asset.site_id + "' (asset " +
                       asset.asset_id + ")");
}

struct VariantLoss {
    LossExceedanceCurve curve;
    double aal_ratio;
};

VariantLoss run_variant(const Asset& asset,
                        const HazardCurveIndex& hazard,
                        const VulnerabilityModel& model,
                        VulnerabilityVariant variant,
                        const RiskBatchConfig& config,
                        std::vector<std::string>& warnings) {
    const VulnerabilityFunction& function = require_function(model, variant, asset);
    const HazardCurve& curve = require_hazard(hazard, asset, function.imt());

    ConvolutionResult convolved = convolve(asset.asset_id, curve, function, config.convolution);
    for (const std::string& w : convolved.warnings) {
        warnings.push_back(variant_to_string(variant) + ": " + w);
    }

    std::vector<std::string> integration_warnings;
    double aal = average_annual_loss(convolved.curve, config.integration, integration_warnings);
    for (const std::string& w : integration_warnings) {
        warnings.push_back(variant_to_string(variant) + ": " + w);
    }

    return VariantLoss{std::move(convolved.curve), aal};
}

} // anonymous namespace

AssetRiskResult assess_asset(const Asset& asset,
                             const HazardCurveIndex& hazard,
                             const VulnerabilityModel& original,
                             const VulnerabilityModel& retrofitted,
                             const RiskBatchConfig& config) {
    RetrofitEconomics economics(asset.asset_id, config.interest_rate,
                                config.life_expectancy_years, asset.retrofit_cost);
    economics.validate();
    if (!(asset.value > 0.0) || !std::isfinite(asset.value)) {
        throw InvalidEconomics("value", "asset value must be a finite value > 0, got " +
                                            std::to_string(asset.value));
    }

    AssetRiskResult result;
    result.asset_id = asset.asset_id;
    result.asset_value = asset.value;

    // Independent runs; both must finish before the benefit-cost step
    VariantLoss before = run_variant(asset, hazard, original, VulnerabilityVariant::Original,
                                     config, result.warnings);
    VariantLoss after = run_variant(asset, hazard, retrofitted, VulnerabilityVariant::Retrofitted,
                                    config, result.warnings);

    result.aal_ratio_original = before.aal_ratio;
    result.aal_ratio_retrofitted = after.aal_ratio;
    result.benefit_cost = compute_benefit_cost(before.aal_ratio * asset.value,
                                               after.aal_ratio * asset.value,
                                               economics);

    for (double poe : config.conditional_loss_poes) {
        result.conditional_loss_original[poe] = before.curve.conditional_loss(poe) * asset.value;
        result.conditional_loss_retrofitted[poe] = after.curve.conditional_loss(poe) * asset.value;
    }

    if (config.keep_loss_curves) {
        result.loss_curve_original = std::move(before.curve);
        result.loss_curve_retrofitted = std::move(after.curve);
    }

    return result;
}

RiskBatchResult run_risk_batch(const AssetSet& assets,
                               const HazardCurveIndex& hazard,
                               const VulnerabilityModel& original,
                               const VulnerabilityModel& retrofitted,
                               const RiskBatchConfig& config) {
    RiskBatchResult batch;
    auto start_time = std::chrono::high_resolution_clock::now();

    const std::vector<Asset>& items = assets.assets();
    std::vector<AssetOutcome> outcomes(items.size());

#ifdef HAVE_OPENMP
    int workers = config.max_workers > 0 ? config.max_workers : omp_get_max_threads();
    // Exceptions must not leave the parallel region, so each asset records its own outcome
    #pragma omp parallel for schedule(dynamic, 16) num_threads(workers)
#endif
    for (long i = 0; i < static_cast<long>(items.size()); ++i) {
        const Asset& asset = items[static_cast<size_t>(i)];
        AssetOutcome& outcome = outcomes[static_cast<size_t>(i)];
        try {
            outcome.result = assess_asset(asset, hazard, original, retrofitted, config);
            outcome.success = true;
        } catch (const InvalidEconomics& e) {
            outcome.failure.asset_id = asset.asset_id;
            outcome.failure.kind = e.kind();
            outcome.failure.message = e.what();
            outcome.failure.parameter = e.parameter();
        } catch (const RiskError& e) {
            outcome.failure.asset_id = asset.asset_id;
            outcome.failure.kind = e.kind();
            outcome.failure.message = e.what();
        } catch (const std::exception& e) {
            outcome.failure.asset_id = asset.asset_id;
            outcome.failure.kind = ErrorKind::Unexpected;
            outcome.failure.message = e.what();
        }
    }

    for (size_t i = 0; i < items.size(); ++i) {
        if (outcomes[i].success) {
            ++batch.succeeded;
        } else {
            ++batch.failed;
            batch.failures.push_back(outcomes[i].failure);
        }
        batch.outcomes.emplace(items[i].asset_id, std::move(outcomes[i]));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    batch.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return batch;
}

} // namespace seisrisk
