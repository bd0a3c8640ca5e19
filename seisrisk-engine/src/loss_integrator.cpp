#include "loss_integrator.hpp"
#include "curve_checks.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace seisrisk {

std::string integration_rule_to_string(IntegrationRule rule) {
    switch (rule) {
        case IntegrationRule::LeftRiemann: return "left_riemann";
        case IntegrationRule::Trapezoidal: return "trapezoidal";
        default: return "unknown";
    }
}

IntegrationRule integration_rule_from_string(const std::string& name) {
    if (name == "left_riemann") return IntegrationRule::LeftRiemann;
    if (name == "trapezoidal") return IntegrationRule::Trapezoidal;
    throw std::invalid_argument("Unknown integration rule: " + name +
                                " (expected left_riemann or trapezoidal)");
}

std::string below_minimum_policy_to_string(BelowMinimumPolicy policy) {
    switch (policy) {
        case BelowMinimumPolicy::ConstantFirstProbability: return "constant_first_probability";
        case BelowMinimumPolicy::ZeroBelowMinimum: return "zero_below_minimum";
        default: return "unknown";
    }
}

BelowMinimumPolicy below_minimum_policy_from_string(const std::string& name) {
    if (name == "constant_first_probability") return BelowMinimumPolicy::ConstantFirstProbability;
    if (name == "zero_below_minimum") return BelowMinimumPolicy::ZeroBelowMinimum;
    throw std::invalid_argument("Unknown below-minimum policy: " + name +
                                " (expected constant_first_probability or zero_below_minimum)");
}

IntegrationConfig::IntegrationConfig()
    : rule(IntegrationRule::LeftRiemann),
      below_minimum(BelowMinimumPolicy::ConstantFirstProbability),
      strict_validation(false) {}

double average_annual_loss(const LossExceedanceCurve& curve,
                           const IntegrationConfig& config,
                           std::vector<std::string>& warnings) {
    if (curve.size() < 2) {
        throw DegenerateCurve("Loss curve for asset '" + curve.asset_id() + "' has " +
                              std::to_string(curve.size()) + " point(s); at least 2 are required");
    }

    LossExceedanceCurve ordered = curve.sorted();
    const std::vector<double>& x = ordered.losses();
    const std::vector<double>& p = ordered.poes();

    check_exceedance_monotone(p, "Loss curve for asset '" + curve.asset_id() + "'",
                              config.strict_validation, warnings);

    double area = 0.0;
    if (config.below_minimum == BelowMinimumPolicy::ConstantFirstProbability && x.front() > 0.0) {
        area += x.front() * p.front();
    }

    for (size_t i = 0; i + 1 < x.size(); ++i) {
        double width = x[i + 1] - x[i];
        if (config.rule == IntegrationRule::Trapezoidal) {
            area += width * 0.5 * (p[i] + p[i + 1]);
        } else {
            area += width * p[i];
        }
    }
    return area;
}

double average_annual_loss(const LossExceedanceCurve& curve, const IntegrationConfig& config) {
    std::vector<std::string> warnings;
    return average_annual_loss(curve, config, warnings);
}

} // namespace seisrisk
