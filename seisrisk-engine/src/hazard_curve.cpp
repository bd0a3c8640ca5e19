#include "hazard_curve.hpp"
#include "curve_checks.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace seisrisk {

// ============================================================================
// HazardCurve Implementation
// ============================================================================

HazardCurve::HazardCurve()
    : realization_(MEAN_REALIZATION) {}

HazardCurve::HazardCurve(std::string site_id,
                         std::string imt,
                         std::vector<double> imls,
                         std::vector<double> poes,
                         std::string realization)
    : site_id_(std::move(site_id)),
      imt_(std::move(imt)),
      realization_(std::move(realization)),
      imls_(std::move(imls)),
      poes_(std::move(poes)) {
    if (imls_.empty()) {
        throw std::invalid_argument("Hazard curve for site '" + site_id_ + "' has no intensity levels");
    }
    if (imls_.size() != poes_.size()) {
        throw std::invalid_argument("Hazard curve for site '" + site_id_ +
                                    "': intensity and probability counts differ");
    }
    if (!is_strictly_increasing(imls_)) {
        throw std::invalid_argument("Hazard curve for site '" + site_id_ +
                                    "': intensity levels must be strictly increasing");
    }
    for (double poe : poes_) {
        if (!(poe >= 0.0 && poe <= 1.0)) {
            throw std::invalid_argument("Hazard curve for site '" + site_id_ +
                                        "': probability of exceedance must be between 0.0 and 1.0");
        }
    }
}

double HazardCurve::poe_at(double iml) const {
    if (imls_.empty()) {
        throw std::logic_error("poe_at called on empty hazard curve");
    }
    if (iml <= imls_.front()) {
        return poes_.front();
    }
    if (iml >= imls_.back()) {
        return poes_.back();
    }

    auto upper = std::upper_bound(imls_.begin(), imls_.end(), iml);
    size_t hi = static_cast<size_t>(upper - imls_.begin());
    size_t lo = hi - 1;
    if (imls_[lo] == iml) {
        return poes_[lo];
    }

    double frac = (iml - imls_[lo]) / (imls_[hi] - imls_[lo]);
    return poes_[lo] + frac * (poes_[hi] - poes_[lo]);
}

HazardCurve HazardCurve::resampled(const std::vector<double>& levels) const {
    if (levels == imls_) {
        return *this;
    }
    std::vector<double> poes;
    poes.reserve(levels.size());
    for (double level : levels) {
        poes.push_back(poe_at(level));
    }
    return HazardCurve(site_id_, imt_, levels, std::move(poes), realization_);
}

HazardCurve HazardCurve::relabeled(const std::string& realization) const {
    HazardCurve copy = *this;
    copy.realization_ = realization;
    return copy;
}

bool HazardCurve::is_monotone() const {
    return find_monotonicity_violations(poes_).empty();
}

bool HazardCurve::operator==(const HazardCurve& other) const {
    return site_id_ == other.site_id_ &&
           imt_ == other.imt_ &&
           realization_ == other.realization_ &&
           imls_ == other.imls_ &&
           poes_ == other.poes_;
}

// ============================================================================
// Resampling
// ============================================================================

std::vector<double> union_levels(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> merged;
    merged.reserve(a.size() + b.size());
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(merged));
    merged.erase(std::unique(merged.begin(), merged.end()), merged.end());
    return merged;
}

std::pair<HazardCurve, HazardCurve> resample_to_common_support(const HazardCurve& a,
                                                               const HazardCurve& b) {
    std::vector<double> levels = union_levels(a.imls(), b.imls());
    return {a.resampled(levels), b.resampled(levels)};
}

// ============================================================================
// Hazard maps
// ============================================================================

double hazard_map_value(const HazardCurve& curve, double poe) {
    if (!(poe > 0.0 && poe < 1.0)) {
        throw std::invalid_argument("Hazard map probability must be in (0, 1)");
    }

    const std::vector<double>& imls = curve.imls();
    const std::vector<double>& poes = curve.poes();

    if (poe >= poes.front()) {
        return imls.front();
    }

    // First bracketing segment: poes[i] > poe >= poes[i + 1]
    for (size_t i = 0; i + 1 < poes.size(); ++i) {
        if (poes[i] > poe && poe >= poes[i + 1]) {
            if (poes[i + 1] <= 0.0 || imls[i] <= 0.0) {
                double frac = (poes[i] - poe) / (poes[i] - poes[i + 1]);
                return imls[i] + frac * (imls[i + 1] - imls[i]);
            }
            double log_frac = (std::log(poes[i]) - std::log(poe)) /
                              (std::log(poes[i]) - std::log(poes[i + 1]));
            return std::exp(std::log(imls[i]) + log_frac * (std::log(imls[i + 1]) - std::log(imls[i])));
        }
    }

    return imls.back();
}

// ============================================================================
// HazardCurveIndex Implementation
// ============================================================================

void HazardCurveIndex::add(const HazardCurve& curve) {
    curves_[{curve.site_id(), curve.imt()}] = curve;
}

void HazardCurveIndex::add(HazardCurve&& curve) {
    auto key = std::make_pair(curve.site_id(), curve.imt());
    curves_[key] = std::move(curve);
}

const HazardCurve* HazardCurveIndex::find(const std::string& site_id, const std::string& imt) const {
    auto it = curves_.find({site_id, imt});
    return it == curves_.end() ? nullptr : &it->second;
}

const HazardCurve* HazardCurveIndex::any_for_site(const std::string& site_id) const {
    auto it = curves_.lower_bound({site_id, std::string()});
    if (it != curves_.end() && it->first.first == site_id) {
        return &it->second;
    }
    return nullptr;
}

void HazardCurveIndex::mark_failed(const std::string& site_id, const std::string& imt,
                                   ErrorKind kind, const std::string& message) {
    failures_[{site_id, imt}] = HazardGroupError{kind, message};
}

const HazardGroupError* HazardCurveIndex::failure(const std::string& site_id,
                                                  const std::string& imt) const {
    auto it = failures_.find({site_id, imt});
    return it == failures_.end() ? nullptr : &it->second;
}

} // namespace seisrisk
