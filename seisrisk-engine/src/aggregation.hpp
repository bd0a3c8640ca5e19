#ifndef SEISRISK_AGGREGATION_HPP
#define SEISRISK_AGGREGATION_HPP

#include "hazard_curve.hpp"
#include <map>
#include <string>
#include <vector>

namespace seisrisk {

struct AggregationConfig {
    bool individual_curves;                 // Also return every realization (default false)
    std::vector<double> quantiles;          // Weighted quantile curves to compute (default none)
    size_t realization_warning_threshold;   // Warn above this many realizations when exporting individually
    double weight_tolerance;                // Allowed deviation of the weight sum from 1
    bool strict_validation;                 // Reject non-monotone realizations instead of warning

    AggregationConfig();
};

// Statistics for one (site, imt)
struct AggregatedCurves {
    std::string site_id;
    std::string imt;
    HazardCurve mean;
    std::map<double, HazardCurve> quantiles;
    std::vector<HazardCurve> individual;    // Empty unless individual_curves was set
    std::vector<std::string> warnings;
    size_t realization_count;

    AggregatedCurves();
};

// Bytes needed to hold `realizations` individual curves of `levels` points
// for `groups` (site, imt) pairs
size_t estimate_individual_bytes(size_t realizations, size_t levels, size_t groups);

// Weighted quantile of values at one level: sorts the values, accumulates the
// weights and interpolates the quantile linearly in cumulative weight
double weighted_quantile(const std::vector<double>& values,
                         const std::vector<double>& weights,
                         double quantile);

// Combines per-realization hazard curves sharing a (site, imt) into summary
// statistics. Realizations on different intensity supports are resampled
// onto the union of their levels first; a curve ending below the highest
// union level keeps its last probability there (HazardCurve::poe_at is flat
// outside the table), so it adds tail mass to the mean rather than zero.
class RealizationAggregator {
public:
    explicit RealizationAggregator(const AggregationConfig& config = AggregationConfig());

    // Throws std::invalid_argument for an empty input, mixed sites, duplicate
    // realizations, missing weights or weights not summing to 1;
    // IncompatibleIntensityMeasure for mixed IMTs. A realization whose
    // exceedance probabilities rise with intensity adds a warning, or throws
    // MalformedCurve under strict_validation.
    AggregatedCurves aggregate(const std::vector<HazardCurve>& curves,
                               const std::map<std::string, double>& weights) const;

    // Message to surface before an individual export of this size, or an
    // empty string when no warning is due
    std::string resource_warning(size_t realizations, size_t levels, size_t groups) const;

    const AggregationConfig& config() const { return config_; }

private:
    AggregationConfig config_;
};

} // namespace seisrisk

#endif // SEISRISK_AGGREGATION_HPP
