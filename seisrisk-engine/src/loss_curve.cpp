#include "loss_curve.hpp"
#include "curve_checks.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace seisrisk {

std::string loss_unit_to_string(LossUnit unit) {
    switch (unit) {
        case LossUnit::LossRatio: return "loss_ratio";
        case LossUnit::Monetary: return "monetary";
        default: return "unknown";
    }
}

LossExceedanceCurve::LossExceedanceCurve()
    : unit_(LossUnit::LossRatio) {}

LossExceedanceCurve::LossExceedanceCurve(std::string asset_id,
                                         std::vector<double> losses,
                                         std::vector<double> poes,
                                         LossUnit unit)
    : asset_id_(std::move(asset_id)),
      losses_(std::move(losses)),
      poes_(std::move(poes)),
      unit_(unit) {
    if (losses_.size() != poes_.size()) {
        throw std::invalid_argument("Loss curve for asset '" + asset_id_ +
                                    "': loss and probability counts differ");
    }
}

LossExceedanceCurve LossExceedanceCurve::sorted() const {
    std::vector<size_t> order(losses_.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        if (losses_[a] != losses_[b]) return losses_[a] < losses_[b];
        return poes_[a] > poes_[b];
    });

    std::vector<double> losses;
    std::vector<double> poes;
    losses.reserve(order.size());
    poes.reserve(order.size());
    for (size_t idx : order) {
        losses.push_back(losses_[idx]);
        poes.push_back(poes_[idx]);
    }
    return LossExceedanceCurve(asset_id_, std::move(losses), std::move(poes), unit_);
}

LossExceedanceCurve LossExceedanceCurve::to_monetary(double asset_value) const {
    if (unit_ != LossUnit::LossRatio) {
        throw std::logic_error("Loss curve for asset '" + asset_id_ + "' is already monetary");
    }
    if (!(asset_value > 0.0)) {
        throw std::invalid_argument("Asset value must be positive");
    }
    std::vector<double> losses;
    losses.reserve(losses_.size());
    for (double ratio : losses_) {
        losses.push_back(ratio * asset_value);
    }
    return LossExceedanceCurve(asset_id_, std::move(losses), poes_, LossUnit::Monetary);
}

bool LossExceedanceCurve::is_monotone() const {
    return find_monotonicity_violations(sorted().poes()).empty();
}

double LossExceedanceCurve::conditional_loss(double poe) const {
    if (losses_.empty()) {
        throw std::logic_error("conditional_loss called on empty loss curve");
    }
    LossExceedanceCurve ordered = sorted();
    const std::vector<double>& x = ordered.losses_;
    const std::vector<double>& p = ordered.poes_;

    // Largest index whose probability still reaches the target
    size_t found = x.size();
    for (size_t i = x.size(); i-- > 0;) {
        if (p[i] >= poe) {
            found = i;
            break;
        }
    }
    if (found == x.size()) {
        return x.front();
    }
    if (found + 1 == x.size()) {
        return x.back();
    }

    double frac = (p[found] - poe) / (p[found] - p[found + 1]);
    return x[found] + frac * (x[found + 1] - x[found]);
}

bool LossExceedanceCurve::operator==(const LossExceedanceCurve& other) const {
    return asset_id_ == other.asset_id_ &&
           unit_ == other.unit_ &&
           losses_ == other.losses_ &&
           poes_ == other.poes_;
}

} // namespace seisrisk
