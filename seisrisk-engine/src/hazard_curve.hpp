#ifndef SEISRISK_HAZARD_CURVE_HPP
#define SEISRISK_HAZARD_CURVE_HPP

#include "errors.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace seisrisk {

// HazardCurve: annual probability of exceeding each intensity level at a site,
// for one intensity measure type and one logic-tree realization (or "mean").
// Immutable once constructed.
class HazardCurve {
public:
    static constexpr const char* MEAN_REALIZATION = "mean";

    HazardCurve();
    HazardCurve(std::string site_id,
                std::string imt,
                std::vector<double> imls,
                std::vector<double> poes,
                std::string realization = MEAN_REALIZATION);

    const std::string& site_id() const { return site_id_; }
    const std::string& imt() const { return imt_; }
    const std::string& realization() const { return realization_; }
    const std::vector<double>& imls() const { return imls_; }
    const std::vector<double>& poes() const { return poes_; }

    size_t size() const { return imls_.size(); }
    bool empty() const { return imls_.empty(); }
    bool is_mean() const { return realization_ == MEAN_REALIZATION; }

    // Piecewise-linear interpolation between tabulated levels, flat outside them
    double poe_at(double iml) const;

    // Same curve evaluated on another strictly increasing set of levels
    HazardCurve resampled(const std::vector<double>& levels) const;

    // Copy carrying a different realization label
    HazardCurve relabeled(const std::string& realization) const;

    bool is_monotone() const;

    bool operator==(const HazardCurve& other) const;

private:
    std::string site_id_;
    std::string imt_;
    std::string realization_;
    std::vector<double> imls_;
    std::vector<double> poes_;
};

// Sorted union of two strictly increasing level sets
std::vector<double> union_levels(const std::vector<double>& a, const std::vector<double>& b);

// Resamples both curves onto the union of their levels
std::pair<HazardCurve, HazardCurve> resample_to_common_support(const HazardCurve& a,
                                                               const HazardCurve& b);

// Intensity at which the curve reaches the target probability of exceedance.
// Log-log interpolation between bracketing levels, clamped to the tabulated range.
double hazard_map_value(const HazardCurve& curve, double poe);

// Lookup of one curve per (site, imt), used to feed the per-asset pipeline
// Why a (site, imt) has no usable curve
struct HazardGroupError {
    ErrorKind kind;
    std::string message;
};

class HazardCurveIndex {
public:
    void add(const HazardCurve& curve);
    void add(HazardCurve&& curve);

    const HazardCurve* find(const std::string& site_id, const std::string& imt) const;

    // Any curve for the site, regardless of IMT (nullptr if none)
    const HazardCurve* any_for_site(const std::string& site_id) const;

    // Records a (site, imt) whose curve could not be built. Lookups of it
    // report this error rather than a missing curve.
    void mark_failed(const std::string& site_id, const std::string& imt,
                     ErrorKind kind, const std::string& message);
    const HazardGroupError* failure(const std::string& site_id, const std::string& imt) const;

    size_t size() const { return curves_.size(); }
    bool empty() const { return curves_.empty(); }

private:
    std::map<std::pair<std::string, std::string>, HazardCurve> curves_;
    std::map<std::pair<std::string, std::string>, HazardGroupError> failures_;
};

} // namespace seisrisk

#endif // SEISRISK_HAZARD_CURVE_HPP
