#include "risk_calculation.hpp"
#include "errors.hpp"
#include "io/json_writer.hpp"
#include "logger.hpp"
#include "product_keys.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

using json = nlohmann::json;

namespace seisrisk {
namespace orchestrator {

namespace {

bool has_format(const JobConfig& config, const std::string& format) {
    return std::find(config.export_formats.begin(), config.export_formats.end(), format) !=
           config.export_formats.end();
}

} // namespace

std::vector<AggregatedCurves> aggregate_store(const HazardCurveStore& store,
                                              const RealizationAggregator& aggregator,
                                              int max_workers,
                                              std::vector<HazardGroupFailure>& failures) {
    std::vector<HazardCurveStore::GroupKey> groups = store.groups();
    std::vector<AggregatedCurves> results(groups.size());
    std::vector<HazardGroupFailure> errors(groups.size());
    std::vector<char> failed(groups.size(), 0);

#ifdef HAVE_OPENMP
    int workers = max_workers > 0 ? max_workers : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic, 4) num_threads(workers)
#else
    (void)max_workers;
#endif
    for (long i = 0; i < static_cast<long>(groups.size()); ++i) {
        const size_t idx = static_cast<size_t>(i);
        const auto& group = groups[idx];
        try {
            results[idx] = aggregator.aggregate(store.curves_for(group.first, group.second), store.weights());
        } catch (const RiskError& e) {
            errors[idx].kind = e.kind();
            errors[idx].message = e.what();
            failed[idx] = 1;
        } catch (const std::invalid_argument& e) {
            // Weight sum short of 1, duplicate or unweighted realizations
            errors[idx].kind = ErrorKind::MissingInput;
            errors[idx].message = e.what();
            failed[idx] = 1;
        } catch (const std::exception& e) {
            errors[idx].kind = ErrorKind::Unexpected;
            errors[idx].message = e.what();
            failed[idx] = 1;
        }
    }

    std::vector<AggregatedCurves> usable;
    usable.reserve(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        if (failed[i]) {
            errors[i].site_id = groups[i].first;
            errors[i].imt = groups[i].second;
            failures.push_back(std::move(errors[i]));
        } else {
            usable.push_back(std::move(results[i]));
        }
    }
    return usable;
}

std::map<std::string, double> extract_hazard_maps(const std::string& job_key,
                                                  const std::vector<AggregatedCurves>& hazard,
                                                  const std::vector<double>& poes) {
    std::map<std::string, double> maps;
    for (const AggregatedCurves& stats : hazard) {
        for (double poe : poes) {
            maps[mean_hazard_map_key(job_key, stats.site_id, stats.imt, poe)] =
                hazard_map_value(stats.mean, poe);
            for (const auto& [quantile, curve] : stats.quantiles) {
                maps[quantile_hazard_map_key(job_key, stats.site_id, stats.imt, poe, quantile)] =
                    hazard_map_value(curve, poe);
            }
        }
    }
    return maps;
}

RiskCalculation::RiskCalculation(ReuseController& controller)
    : controller_(controller) {}

RiskRunResult RiskCalculation::run(const std::string& run_id,
                                   const JobConfig& config,
                                   const AssetSet& assets,
                                   const VulnerabilityModel& original,
                                   const VulnerabilityModel& retrofitted,
                                   const CancellationToken& token) {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    RiskRunResult result;
    result.run_id = run_id;

    RunContext ctx(run_id);

    // 1. Hazard, stored or fresh
    HazardAcquisition hazard = controller_.acquire(config, ctx, token);
    result.cache_key = hazard.key.hex();
    result.hazard_reused = hazard.reused;
    result.hazard_coalesced = hazard.coalesced;
    result.hazard_time_ms = hazard.elapsed_ms;
    ctx.cache_key = result.cache_key;

    // 2. Realization statistics
    ctx.phase = "aggregation";
    const HazardCurveStore& store = *hazard.store;
    RealizationAggregator aggregator(config.to_aggregation_config());

    size_t group_count = store.groups().size();
    std::string resource_warning =
        aggregator.resource_warning(store.realization_count(), store.max_levels(), group_count);
    if (!resource_warning.empty()) {
        logger.log_resource_warning(ctx, resource_warning, store.realization_count(),
                                    estimate_individual_bytes(store.realization_count(),
                                                              store.max_levels(), group_count));
        result.warnings.push_back(resource_warning);
    }

    result.hazard = aggregate_store(store, aggregator, config.max_workers, result.hazard_failures);
    for (const AggregatedCurves& stats : result.hazard) {
        for (const std::string& warning : stats.warnings) {
            logger.log_data_quality(ctx, stats.site_id + "/" + stats.imt, warning);
        }
    }
    for (const HazardGroupFailure& failure : result.hazard_failures) {
        logger.log_error(ctx, "Hazard for " + failure.site_id + "/" + failure.imt + " unusable (" +
                                  error_kind_to_string(failure.kind) + "): " + failure.message);
    }

    result.hazard_maps = extract_hazard_maps(result.cache_key, result.hazard, config.poes);

    // 3. Per-asset risk over the mean curves
    ctx.phase = "risk";
    HazardCurveIndex index;
    for (const AggregatedCurves& stats : result.hazard) {
        index.add(stats.mean);
    }
    for (const HazardGroupFailure& failure : result.hazard_failures) {
        index.mark_failed(failure.site_id, failure.imt, failure.kind, failure.message);
    }

    result.batch = run_risk_batch(assets, index, original, retrofitted, config.to_batch_config());

    for (const auto& [asset_id, outcome] : result.batch.outcomes) {
        if (outcome.success) {
            for (const std::string& warning : outcome.result.warnings) {
                logger.log_data_quality(ctx, asset_id, warning);
            }
        }
    }
    for (const AssetFailure& failure : result.batch.failures) {
        logger.log_asset_failure(ctx, failure);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    RunSummary summary;
    summary.assets = assets.size();
    summary.succeeded = result.batch.succeeded;
    summary.failed = result.batch.failed;
    summary.hazard_reused = result.hazard_reused;
    summary.hazard_computations = hazard.computed ? 1 : 0;
    summary.execution_time_ms = result.execution_time_ms;
    logger.log_run_summary(ctx, summary);

    return result;
}

json risk_run_to_json(const RiskRunResult& result, const JobConfig& config, bool include_timing) {
    json j = io::risk_batch_to_json(result.batch, include_timing);
    j["cache_key"] = result.cache_key;
    j["hazard_maps"] = result.hazard_maps;

    if (has_format(config, "hazard_curves")) {
        json curves = json::object();
        for (const AggregatedCurves& stats : result.hazard) {
            curves[mean_hazard_curve_key(result.cache_key, stats.site_id, stats.imt)] =
                io::hazard_curve_to_json(stats.mean);
            for (const auto& [quantile, curve] : stats.quantiles) {
                curves[quantile_hazard_curve_key(result.cache_key, stats.site_id, stats.imt, quantile)] =
                    io::hazard_curve_to_json(curve);
            }
            for (const HazardCurve& curve : stats.individual) {
                curves[hazard_curve_key(result.cache_key, stats.site_id, stats.imt, curve.realization())] =
                    io::hazard_curve_to_json(curve);
            }
        }
        j["hazard_curves"] = curves;
    }

    // Loss curves move from the per-asset records to product keys
    if (has_format(config, "loss_curves")) {
        json curves = json::object();
        json& results = j["results"];
        for (auto it = results.begin(); it != results.end(); ++it) {
            const std::string asset_id = it.key();
            json& record = it.value();
            if (record.contains("loss_curve_original")) {
                curves[loss_curve_key(result.cache_key, asset_id, "original")] = record["loss_curve_original"];
                record.erase("loss_curve_original");
            }
            if (record.contains("loss_curve_retrofitted")) {
                curves[loss_curve_key(result.cache_key, asset_id, "retrofitted")] = record["loss_curve_retrofitted"];
                record.erase("loss_curve_retrofitted");
            }
        }
        j["loss_curves"] = curves;
    }

    if (!result.hazard_failures.empty()) {
        json failures = json::array();
        for (const HazardGroupFailure& failure : result.hazard_failures) {
            failures.push_back({{"site_id", failure.site_id},
                                {"imt", failure.imt},
                                {"kind", error_kind_to_string(failure.kind)},
                                {"message", failure.message}});
        }
        j["hazard_failures"] = failures;
    }

    if (!result.warnings.empty()) {
        j["warnings"] = result.warnings;
    }

    if (include_timing) {
        j["run_id"] = result.run_id;
        j["hazard_reused"] = result.hazard_reused;
        j["hazard_time_ms"] = result.hazard_time_ms;
        j["total_time_ms"] = result.execution_time_ms;
    }
    return j;
}

void write_risk_run_json(std::ostream& os, const RiskRunResult& result, const JobConfig& config,
                         bool pretty_print) {
    json j = risk_run_to_json(result, config, true);
    if (pretty_print) {
        os << j.dump(2) << "\n";
    } else {
        os << j.dump() << "\n";
    }
}

void write_risk_run_json(const std::string& filepath, const RiskRunResult& result,
                         const JobConfig& config, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_risk_run_json(file, result, config, pretty_print);
}

} // namespace orchestrator
} // namespace seisrisk
