#ifndef SEISRISK_LOSS_CURVE_HPP
#define SEISRISK_LOSS_CURVE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace seisrisk {

enum class LossUnit : uint8_t {
    LossRatio = 0,   // fraction of the asset's replacement value
    Monetary = 1     // same currency as the asset value
};

std::string loss_unit_to_string(LossUnit unit);

// LossExceedanceCurve: annual probability of exceeding each loss value for an
// asset. Points are kept in the order given; sorted() returns them by loss.
class LossExceedanceCurve {
public:
    LossExceedanceCurve();
    LossExceedanceCurve(std::string asset_id,
                        std::vector<double> losses,
                        std::vector<double> poes,
                        LossUnit unit = LossUnit::LossRatio);

    const std::string& asset_id() const { return asset_id_; }
    const std::vector<double>& losses() const { return losses_; }
    const std::vector<double>& poes() const { return poes_; }
    LossUnit unit() const { return unit_; }
    size_t size() const { return losses_.size(); }
    bool empty() const { return losses_.empty(); }

    // Points ordered by increasing loss; ties keep the larger probability first
    LossExceedanceCurve sorted() const;

    // Loss-ratio curve expressed in money for an asset of the given value
    LossExceedanceCurve to_monetary(double asset_value) const;

    bool is_monotone() const;

    // Loss exceeded with the given annual probability, by linear interpolation.
    // Returns the smallest loss for probabilities above the curve and the
    // largest loss for probabilities below it.
    double conditional_loss(double poe) const;

    bool operator==(const LossExceedanceCurve& other) const;

private:
    std::string asset_id_;
    std::vector<double> losses_;
    std::vector<double> poes_;
    LossUnit unit_;
};

} // namespace seisrisk

#endif // SEISRISK_LOSS_CURVE_HPP
