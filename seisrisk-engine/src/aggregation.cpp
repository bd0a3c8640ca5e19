#include "aggregation.hpp"
#include "curve_checks.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <sstream>
#include <stdexcept>

namespace seisrisk {

AggregationConfig::AggregationConfig()
    : individual_curves(false),
      realization_warning_threshold(100),
      weight_tolerance(1e-6),
      strict_validation(false) {}

AggregatedCurves::AggregatedCurves()
    : realization_count(0) {}

size_t estimate_individual_bytes(size_t realizations, size_t levels, size_t groups) {
    // Intensity and probability per level
    return realizations * levels * groups * 2 * sizeof(double);
}

double weighted_quantile(const std::vector<double>& values,
                         const std::vector<double>& weights,
                         double quantile) {
    if (values.empty() || values.size() != weights.size()) {
        throw std::invalid_argument("weighted_quantile requires matching, non-empty values and weights");
    }
    if (!(quantile >= 0.0 && quantile <= 1.0)) {
        throw std::invalid_argument("Quantile must be between 0.0 and 1.0");
    }

    std::vector<size_t> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&values](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> sorted_values;
    std::vector<double> cumulative;
    sorted_values.reserve(order.size());
    cumulative.reserve(order.size());
    double running = 0.0;
    for (size_t idx : order) {
        running += weights[idx];
        sorted_values.push_back(values[idx]);
        cumulative.push_back(running);
    }

    if (quantile <= cumulative.front()) {
        return sorted_values.front();
    }
    if (quantile >= cumulative.back()) {
        return sorted_values.back();
    }
    for (size_t i = 0; i + 1 < cumulative.size(); ++i) {
        if (quantile <= cumulative[i + 1]) {
            double span = cumulative[i + 1] - cumulative[i];
            if (span <= 0.0) {
                return sorted_values[i + 1];
            }
            double frac = (quantile - cumulative[i]) / span;
            return sorted_values[i] + frac * (sorted_values[i + 1] - sorted_values[i]);
        }
    }
    return sorted_values.back();
}

RealizationAggregator::RealizationAggregator(const AggregationConfig& config)
    : config_(config) {
    for (double q : config_.quantiles) {
        if (!(q >= 0.0 && q <= 1.0)) {
            throw std::invalid_argument("Quantile must be between 0.0 and 1.0");
        }
    }
}

std::string RealizationAggregator::resource_warning(size_t realizations, size_t levels, size_t groups) const {
    if (!config_.individual_curves || realizations <= config_.realization_warning_threshold) {
        return "";
    }
    std::ostringstream msg;
    msg << "Exporting individual curves for " << realizations
        << " realizations (threshold " << config_.realization_warning_threshold
        << "): output scales linearly with the realization count, about "
        << estimate_individual_bytes(realizations, levels, groups) / (1024 * 1024)
        << " MB for " << groups << " site/IMT pair(s)";
    return msg.str();
}

AggregatedCurves RealizationAggregator::aggregate(const std::vector<HazardCurve>& curves,
                                                  const std::map<std::string, double>& weights) const {
    if (curves.empty()) {
        throw std::invalid_argument("Cannot aggregate an empty set of hazard curves");
    }

    const std::string& site_id = curves.front().site_id();
    const std::string& imt = curves.front().imt();

    std::set<std::string> seen;
    std::vector<double> curve_weights;
    curve_weights.reserve(curves.size());
    std::vector<double> levels;
    double weight_sum = 0.0;

    for (const HazardCurve& curve : curves) {
        if (curve.site_id() != site_id) {
            throw std::invalid_argument("Cannot aggregate curves of different sites: " +
                                        site_id + " and " + curve.site_id());
        }
        if (curve.imt() != imt) {
            throw IncompatibleIntensityMeasure(imt, curve.imt());
        }
        if (!seen.insert(curve.realization()).second) {
            throw std::invalid_argument("Duplicate realization '" + curve.realization() +
                                        "' for site " + site_id);
        }
        auto it = weights.find(curve.realization());
        if (it == weights.end()) {
            throw std::invalid_argument("No weight for realization '" + curve.realization() + "'");
        }
        curve_weights.push_back(it->second);
        weight_sum += it->second;
        levels = union_levels(levels, curve.imls());
    }

    if (std::fabs(weight_sum - 1.0) > config_.weight_tolerance) {
        throw std::invalid_argument("Realization weights for " + site_id + "/" + imt +
                                    " sum to " + std::to_string(weight_sum) + ", expected 1");
    }

    AggregatedCurves result;

    // Checked before resampling so a bad realization cannot hide in the mean
    for (const HazardCurve& curve : curves) {
        check_exceedance_monotone(curve.poes(),
                                  "Hazard curve " + site_id + "/" + imt + "/" + curve.realization(),
                                  config_.strict_validation,
                                  result.warnings);
    }

    std::vector<HazardCurve> resampled;
    resampled.reserve(curves.size());
    for (const HazardCurve& curve : curves) {
        resampled.push_back(curve.resampled(levels));
    }

    result.site_id = site_id;
    result.imt = imt;
    result.realization_count = curves.size();

    // Mean: weight-sum of realization probabilities at each level
    std::vector<double> mean_poes(levels.size(), 0.0);
    for (size_t r = 0; r < resampled.size(); ++r) {
        const std::vector<double>& poes = resampled[r].poes();
        for (size_t l = 0; l < levels.size(); ++l) {
            mean_poes[l] += curve_weights[r] * poes[l];
        }
    }
    for (double& poe : mean_poes) {
        poe = std::min(1.0, std::max(0.0, poe));
    }
    result.mean = HazardCurve(site_id, imt, levels, std::move(mean_poes), HazardCurve::MEAN_REALIZATION);

    for (double q : config_.quantiles) {
        std::vector<double> q_poes(levels.size(), 0.0);
        std::vector<double> column(resampled.size());
        for (size_t l = 0; l < levels.size(); ++l) {
            for (size_t r = 0; r < resampled.size(); ++r) {
                column[r] = resampled[r].poes()[l];
            }
            q_poes[l] = weighted_quantile(column, curve_weights, q);
        }
        std::ostringstream label;
        label << "quantile-" << q;
        result.quantiles.emplace(q, HazardCurve(site_id, imt, levels, std::move(q_poes), label.str()));
    }

    if (config_.individual_curves) {
        std::string warning = resource_warning(curves.size(), levels.size(), 1);
        if (!warning.empty()) {
            result.warnings.push_back(warning);
        }
        result.individual = std::move(resampled);
    }

    return result;
}

} // namespace seisrisk
