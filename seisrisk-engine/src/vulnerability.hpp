#ifndef SEISRISK_VULNERABILITY_HPP
#define SEISRISK_VULNERABILITY_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace seisrisk {

enum class VulnerabilityVariant : uint8_t {
    Original = 0,
    Retrofitted = 1
};

std::string variant_to_string(VulnerabilityVariant variant);

// One row of a vulnerability function: mean loss ratio and its coefficient of
// variation at a given intensity
struct VulnerabilityPoint {
    double iml;
    double mean_loss_ratio;
    double cov;
};

// One discrete outcome of the loss-ratio distribution at an intensity
struct LossRatioAtom {
    double loss_ratio;
    double probability;
};

// VulnerabilityFunction: intensity -> loss-ratio distribution for one asset class.
// Loss ratios must lie in [0, 1]. Monotonicity in intensity is expected but not
// enforced; is_monotone() lets callers flag violations.
class VulnerabilityFunction {
public:
    VulnerabilityFunction();
    VulnerabilityFunction(std::string taxonomy,
                          std::string imt,
                          std::vector<VulnerabilityPoint> points);

    const std::string& taxonomy() const { return taxonomy_; }
    const std::string& imt() const { return imt_; }
    const std::vector<VulnerabilityPoint>& points() const { return points_; }
    size_t size() const { return points_.size(); }

    // Zero below the first tabulated intensity, constant above the last,
    // linear in between
    double mean_loss_ratio_at(double iml) const;
    double cov_at(double iml) const;

    // Discretises the loss-ratio distribution at an intensity into `samples`
    // equiprobable lognormal quantiles, clipped to [0, 1]. A zero mean or
    // zero cov yields a single atom at the mean.
    std::vector<LossRatioAtom> loss_distribution_at(double iml, size_t samples) const;

    bool is_monotone() const;

private:
    std::string taxonomy_;
    std::string imt_;
    std::vector<VulnerabilityPoint> points_;

    double interpolate(double iml, double VulnerabilityPoint::*field, double below) const;
};

// VulnerabilityModel: the functions of one variant (original or retrofitted),
// keyed by taxonomy
class VulnerabilityModel {
public:
    explicit VulnerabilityModel(std::string name = "");

    void add(const VulnerabilityFunction& function);

    const VulnerabilityFunction* find(const std::string& taxonomy) const;
    const VulnerabilityFunction& get(const std::string& taxonomy) const;

    const std::string& name() const { return name_; }
    size_t size() const { return functions_.size(); }
    bool empty() const { return functions_.empty(); }

    // Long format: taxonomy,imt,iml,mean_loss_ratio,cov
    static VulnerabilityModel load_from_csv(const std::string& filepath);
    static VulnerabilityModel load_from_csv(std::istream& is, const std::string& name = "");

private:
    std::string name_;
    std::map<std::string, VulnerabilityFunction> functions_;
};

} // namespace seisrisk

#endif // SEISRISK_VULNERABILITY_HPP
