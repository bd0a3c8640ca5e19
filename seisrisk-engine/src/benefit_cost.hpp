#ifndef SEISRISK_BENEFIT_COST_HPP
#define SEISRISK_BENEFIT_COST_HPP

#include <string>

namespace seisrisk {

// Decimal places used when results are printed; computation is unrounded
constexpr int DEFAULT_DISPLAY_PRECISION = 4;

// Economic inputs for one asset's retrofit decision
struct RetrofitEconomics {
    std::string asset_id;
    double interest_rate;        // Annual discount rate, >= 0
    int life_expectancy_years;   // Remaining life of the structure, > 0
    double retrofit_cost;        // Same currency as the AALs, > 0

    RetrofitEconomics();
    RetrofitEconomics(const std::string& id, double rate, int life, double cost);

    // Throws InvalidEconomics naming the first offending parameter
    void validate() const;
};

struct BenefitCostResult {
    std::string asset_id;
    double aal_original;
    double aal_retrofitted;
    double annual_benefit;        // aal_original - aal_retrofitted, may be negative
    double annuity_factor;
    double discounted_benefit;
    double benefit_cost_ratio;

    BenefitCostResult();
};

// Present value of 1 per year over `years` at `rate`:
//   (1 - (1 + r)^-n) / r   for r > 0
//   n                      for r = 0
// Throws InvalidEconomics for r < 0 or n <= 0.
double annuity_factor(double rate, double years);

// Throws InvalidEconomics if the economics fail validate()
BenefitCostResult compute_benefit_cost(double aal_original,
                                       double aal_retrofitted,
                                       const RetrofitEconomics& economics);

std::string format_benefit_cost(const BenefitCostResult& result,
                                int precision = DEFAULT_DISPLAY_PRECISION);

} // namespace seisrisk

#endif // SEISRISK_BENEFIT_COST_HPP
