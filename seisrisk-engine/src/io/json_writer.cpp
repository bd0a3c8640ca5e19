#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace seisrisk {
namespace io {

using json = nlohmann::json;

namespace {

json poe_table_to_json(const std::map<double, double>& values) {
    json table = json::array();
    for (const auto& entry : values) {
        table.push_back({{"poe", entry.first}, {"loss", entry.second}});
    }
    return table;
}

} // anonymous namespace

json hazard_curve_to_json(const HazardCurve& curve) {
    return json{
        {"site_id", curve.site_id()},
        {"imt", curve.imt()},
        {"realization", curve.realization()},
        {"imls", curve.imls()},
        {"poes", curve.poes()}
    };
}

json loss_curve_to_json(const LossExceedanceCurve& curve) {
    return json{
        {"asset_id", curve.asset_id()},
        {"unit", loss_unit_to_string(curve.unit())},
        {"losses", curve.losses()},
        {"poes", curve.poes()}
    };
}

json aggregated_curves_to_json(const AggregatedCurves& stats) {
    json j;
    j["site_id"] = stats.site_id;
    j["imt"] = stats.imt;
    j["realizations"] = stats.realization_count;
    j["mean"] = hazard_curve_to_json(stats.mean);

    json quantiles = json::array();
    for (const auto& entry : stats.quantiles) {
        json q = hazard_curve_to_json(entry.second);
        q["quantile"] = entry.first;
        quantiles.push_back(q);
    }
    j["quantiles"] = quantiles;

    if (!stats.individual.empty()) {
        json individual = json::array();
        for (const HazardCurve& curve : stats.individual) {
            individual.push_back(hazard_curve_to_json(curve));
        }
        j["individual"] = individual;
    }
    if (!stats.warnings.empty()) {
        j["warnings"] = stats.warnings;
    }
    return j;
}

json asset_result_to_json(const AssetRiskResult& result) {
    const BenefitCostResult& bcr = result.benefit_cost;
    json j;
    j["asset_id"] = result.asset_id;
    j["asset_value"] = result.asset_value;
    j["aal_ratio_original"] = result.aal_ratio_original;
    j["aal_ratio_retrofitted"] = result.aal_ratio_retrofitted;
    j["aal_original"] = bcr.aal_original;
    j["aal_retrofitted"] = bcr.aal_retrofitted;
    j["annual_benefit"] = bcr.annual_benefit;
    j["annuity_factor"] = bcr.annuity_factor;
    j["discounted_benefit"] = bcr.discounted_benefit;
    j["benefit_cost_ratio"] = bcr.benefit_cost_ratio;

    if (!result.conditional_loss_original.empty()) {
        j["conditional_loss_original"] = poe_table_to_json(result.conditional_loss_original);
        j["conditional_loss_retrofitted"] = poe_table_to_json(result.conditional_loss_retrofitted);
    }
    if (!result.loss_curve_original.empty()) {
        j["loss_curve_original"] = loss_curve_to_json(result.loss_curve_original);
    }
    if (!result.loss_curve_retrofitted.empty()) {
        j["loss_curve_retrofitted"] = loss_curve_to_json(result.loss_curve_retrofitted);
    }
    if (!result.warnings.empty()) {
        j["warnings"] = result.warnings;
    }
    return j;
}

json asset_failure_to_json(const AssetFailure& failure) {
    json j{
        {"asset_id", failure.asset_id},
        {"kind", error_kind_to_string(failure.kind)},
        {"message", failure.message}
    };
    if (!failure.parameter.empty()) {
        j["parameter"] = failure.parameter;
    }
    return j;
}

json risk_batch_to_json(const RiskBatchResult& batch, bool include_timing) {
    json results = json::object();
    for (const auto& entry : batch.outcomes) {
        if (entry.second.success) {
            results[entry.first] = asset_result_to_json(entry.second.result);
        }
    }

    json failures = json::array();
    for (const AssetFailure& failure : batch.failures) {
        failures.push_back(asset_failure_to_json(failure));
    }

    json j;
    j["results"] = results;
    j["failures"] = failures;
    j["summary"] = {
        {"assets", batch.outcomes.size()},
        {"succeeded", batch.succeeded},
        {"failed", batch.failed}
    };
    if (include_timing) {
        j["execution_time_ms"] = batch.execution_time_ms;
    }
    return j;
}

void write_risk_batch_json(std::ostream& os, const RiskBatchResult& batch, bool pretty_print) {
    json j = risk_batch_to_json(batch, true);
    if (pretty_print) {
        os << j.dump(2) << "\n";
    } else {
        os << j.dump() << "\n";
    }
}

void write_risk_batch_json(const std::string& filepath, const RiskBatchResult& batch,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_risk_batch_json(file, batch, pretty_print);
}

} // namespace io
} // namespace seisrisk
