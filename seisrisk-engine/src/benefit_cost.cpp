#include "benefit_cost.hpp"
#include "errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace seisrisk {

RetrofitEconomics::RetrofitEconomics()
    : interest_rate(0.0), life_expectancy_years(0), retrofit_cost(0.0) {}

RetrofitEconomics::RetrofitEconomics(const std::string& id, double rate, int life, double cost)
    : asset_id(id), interest_rate(rate), life_expectancy_years(life), retrofit_cost(cost) {}

void RetrofitEconomics::validate() const {
    if (!(interest_rate >= 0.0) || !std::isfinite(interest_rate)) {
        throw InvalidEconomics("interest_rate",
                               "must be a finite value >= 0, got " + std::to_string(interest_rate));
    }
    if (life_expectancy_years <= 0) {
        throw InvalidEconomics("life_expectancy",
                               "must be > 0 years, got " + std::to_string(life_expectancy_years));
    }
    if (!(retrofit_cost > 0.0) || !std::isfinite(retrofit_cost)) {
        throw InvalidEconomics("retrofit_cost",
                               "must be a finite value > 0, got " + std::to_string(retrofit_cost));
    }
}

BenefitCostResult::BenefitCostResult()
    : aal_original(0.0),
      aal_retrofitted(0.0),
      annual_benefit(0.0),
      annuity_factor(0.0),
      discounted_benefit(0.0),
      benefit_cost_ratio(0.0) {}

double annuity_factor(double rate, double years) {
    if (!(rate >= 0.0) || !std::isfinite(rate)) {
        throw InvalidEconomics("interest_rate", "must be a finite value >= 0");
    }
    if (!(years > 0.0) || !std::isfinite(years)) {
        throw InvalidEconomics("life_expectancy", "must be > 0 years");
    }
    if (rate == 0.0) {
        return years;
    }
    // 1 - (1 + r)^-n without cancellation for small r
    return -std::expm1(-years * std::log1p(rate)) / rate;
}

BenefitCostResult compute_benefit_cost(double aal_original,
                                       double aal_retrofitted,
                                       const RetrofitEconomics& economics) {
    economics.validate();

    BenefitCostResult result;
    result.asset_id = economics.asset_id;
    result.aal_original = aal_original;
    result.aal_retrofitted = aal_retrofitted;
    result.annual_benefit = aal_original - aal_retrofitted;
    result.annuity_factor = annuity_factor(economics.interest_rate,
                                           static_cast<double>(economics.life_expectancy_years));
    result.discounted_benefit = result.annual_benefit * result.annuity_factor;
    result.benefit_cost_ratio = result.discounted_benefit / economics.retrofit_cost;
    return result;
}

std::string format_benefit_cost(const BenefitCostResult& result, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);
    oss << result.asset_id
        << ": AAL original=" << result.aal_original
        << ", AAL retrofitted=" << result.aal_retrofitted
        << ", discounted benefit=" << result.discounted_benefit
        << ", BCR=" << result.benefit_cost_ratio;
    return oss.str();
}

} // namespace seisrisk
