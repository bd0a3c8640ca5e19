#include "convolution.hpp"
#include "curve_checks.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace seisrisk {

std::string bin_representative_to_string(BinRepresentative representative) {
    switch (representative) {
        case BinRepresentative::LeftEdge: return "left_edge";
        case BinRepresentative::Midpoint: return "midpoint";
        case BinRepresentative::RightEdge: return "right_edge";
        default: return "unknown";
    }
}

BinRepresentative bin_representative_from_string(const std::string& name) {
    if (name == "left_edge") return BinRepresentative::LeftEdge;
    if (name == "midpoint") return BinRepresentative::Midpoint;
    if (name == "right_edge") return BinRepresentative::RightEdge;
    throw std::invalid_argument("Unknown bin representative: " + name +
                                " (expected left_edge, midpoint or right_edge)");
}

ConvolutionConfig::ConvolutionConfig()
    : representative(BinRepresentative::Midpoint),
      loss_resolution(1e-4),
      loss_ratio_samples(10),
      strict_validation(false) {}

ConvolutionResult::ConvolutionResult()
    : bins(0), atoms(0) {}

std::vector<IntensityBin> make_intensity_bins(const HazardCurve& hazard,
                                              BinRepresentative representative) {
    const std::vector<double>& imls = hazard.imls();
    const std::vector<double>& poes = hazard.poes();

    std::vector<IntensityBin> bins;
    bins.reserve(imls.size());

    for (size_t i = 0; i + 1 < imls.size(); ++i) {
        IntensityBin bin;
        bin.lower = imls[i];
        bin.upper = imls[i + 1];
        bin.occurrence = poes[i] - poes[i + 1];
        switch (representative) {
            case BinRepresentative::LeftEdge: bin.representative = bin.lower; break;
            case BinRepresentative::RightEdge: bin.representative = bin.upper; break;
            case BinRepresentative::Midpoint:
            default: bin.representative = 0.5 * (bin.lower + bin.upper); break;
        }
        bins.push_back(bin);
    }

    // Tail: shaking above the highest tabulated level
    IntensityBin tail;
    tail.lower = imls.back();
    tail.upper = imls.back();
    tail.representative = imls.back();
    tail.occurrence = poes.back();
    bins.push_back(tail);

    return bins;
}

std::vector<LossRatioAtom> merge_loss_atoms(std::vector<LossRatioAtom> atoms, double resolution) {
    if (resolution < 0.0) {
        throw std::invalid_argument("Loss resolution must be non-negative");
    }
    std::stable_sort(atoms.begin(), atoms.end(), [](const LossRatioAtom& a, const LossRatioAtom& b) {
        return a.loss_ratio < b.loss_ratio;
    });

    std::vector<LossRatioAtom> merged;
    double anchor = 0.0;       // lowest loss ratio in the current group
    double weighted = 0.0;     // sum of loss * probability in the current group

    for (const LossRatioAtom& atom : atoms) {
        bool joins = !merged.empty() &&
                     (atom.loss_ratio == anchor || atom.loss_ratio - anchor < resolution);
        if (joins) {
            LossRatioAtom& group = merged.back();
            group.probability += atom.probability;
            weighted += atom.loss_ratio * atom.probability;
            if (group.probability != 0.0) {
                group.loss_ratio = weighted / group.probability;
            }
        } else {
            merged.push_back(atom);
            anchor = atom.loss_ratio;
            weighted = atom.loss_ratio * atom.probability;
        }
    }

    // A group without mass has no meaningful mean loss; offsetting negative
    // bins of a non-monotone hazard curve can cancel a group exactly
    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [](const LossRatioAtom& group) { return group.probability == 0.0; }),
                 merged.end());
    return merged;
}

LossExceedanceCurve exceedance_from_atoms(const std::string& asset_id,
                                          const std::vector<LossRatioAtom>& atoms) {
    std::vector<double> losses;
    std::vector<double> poes;

    if (atoms.empty()) {
        return LossExceedanceCurve(asset_id, {0.0, 1.0}, {0.0, 0.0}, LossUnit::LossRatio);
    }

    // suffix[j] = probability mass strictly above atom j
    std::vector<double> suffix(atoms.size(), 0.0);
    for (size_t j = atoms.size() - 1; j > 0; --j) {
        suffix[j - 1] = suffix[j] + atoms[j].probability;
    }
    double total = suffix[0] + atoms[0].probability;

    losses.reserve(atoms.size() + 2);
    poes.reserve(atoms.size() + 2);
    if (atoms.front().loss_ratio > 0.0) {
        losses.push_back(0.0);
        poes.push_back(total);
    }
    for (size_t j = 0; j < atoms.size(); ++j) {
        losses.push_back(atoms[j].loss_ratio);
        poes.push_back(suffix[j]);
    }
    if (losses.back() < 1.0) {
        losses.push_back(1.0);
        poes.push_back(0.0);
    }

    return LossExceedanceCurve(asset_id, std::move(losses), std::move(poes), LossUnit::LossRatio);
}

ConvolutionResult convolve(const std::string& asset_id,
                           const HazardCurve& hazard,
                           const VulnerabilityFunction& vulnerability,
                           const ConvolutionConfig& config) {
    if (hazard.imt() != vulnerability.imt()) {
        throw IncompatibleIntensityMeasure(hazard.imt(), vulnerability.imt());
    }
    if (hazard.empty()) {
        throw std::invalid_argument("Cannot convolve an empty hazard curve");
    }

    ConvolutionResult result;

    check_exceedance_monotone(hazard.poes(),
                              "Hazard curve " + hazard.site_id() + "/" + hazard.imt() + "/" +
                                  hazard.realization(),
                              config.strict_validation,
                              result.warnings);
    if (!vulnerability.is_monotone()) {
        result.warnings.push_back("Vulnerability function '" + vulnerability.taxonomy() +
                                  "': mean loss ratio decreases with intensity");
    }

    std::vector<IntensityBin> bins = make_intensity_bins(hazard, config.representative);

    std::vector<LossRatioAtom> atoms;
    atoms.reserve(bins.size() * std::max<size_t>(config.loss_ratio_samples, 1));

    for (const IntensityBin& bin : bins) {
        if (bin.occurrence == 0.0) {
            continue;
        }
        ++result.bins;
        for (const LossRatioAtom& atom :
             vulnerability.loss_distribution_at(bin.representative, config.loss_ratio_samples)) {
            atoms.push_back(LossRatioAtom{atom.loss_ratio, atom.probability * bin.occurrence});
        }
    }

    std::vector<LossRatioAtom> merged = merge_loss_atoms(std::move(atoms), config.loss_resolution);
    result.atoms = merged.size();
    result.curve = exceedance_from_atoms(asset_id, merged);
    return result;
}

} // namespace seisrisk
