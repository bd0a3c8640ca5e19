#ifndef SEISRISK_LOSS_INTEGRATOR_HPP
#define SEISRISK_LOSS_INTEGRATOR_HPP

#include "loss_curve.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace seisrisk {

// Summation over the curve's discrete support, points ordered by loss.
//   LeftRiemann: sum (x[i+1] - x[i]) * p[i]. Exact for the step curves
//                produced by convolve(), whose P(L > x) is constant on [x[i], x[i+1]).
//   Trapezoidal: sum (x[i+1] - x[i]) * (p[i] + p[i+1]) / 2.
enum class IntegrationRule : uint8_t {
    LeftRiemann = 0,
    Trapezoidal = 1
};

// Probability assumed for losses between zero and the first tabulated loss.
//   ConstantFirstProbability: p[0] holds on [0, x[0]], adding x[0] * p[0].
//   ZeroBelowMinimum: nothing is added below x[0].
// Above the last tabulated loss the probability is always taken as zero.
enum class BelowMinimumPolicy : uint8_t {
    ConstantFirstProbability = 0,
    ZeroBelowMinimum = 1
};

std::string integration_rule_to_string(IntegrationRule rule);
IntegrationRule integration_rule_from_string(const std::string& name);
std::string below_minimum_policy_to_string(BelowMinimumPolicy policy);
BelowMinimumPolicy below_minimum_policy_from_string(const std::string& name);

struct IntegrationConfig {
    IntegrationRule rule;                 // Default: LeftRiemann
    BelowMinimumPolicy below_minimum;     // Default: ConstantFirstProbability
    bool strict_validation;               // Non-monotone loss curve is fatal (default false)

    IntegrationConfig();
};

// Average annual loss: area under the loss-exceedance curve, in the curve's
// unit. Input order does not matter; points are sorted by loss first.
// Throws DegenerateCurve with fewer than two points and MalformedCurve for a
// non-monotone curve in strict mode (a warning is appended otherwise).
double average_annual_loss(const LossExceedanceCurve& curve,
                           const IntegrationConfig& config,
                           std::vector<std::string>& warnings);

double average_annual_loss(const LossExceedanceCurve& curve,
                           const IntegrationConfig& config = IntegrationConfig());

} // namespace seisrisk

#endif // SEISRISK_LOSS_INTEGRATOR_HPP
