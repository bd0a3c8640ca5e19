#ifndef SEISRISK_CONVOLUTION_HPP
#define SEISRISK_CONVOLUTION_HPP

#include "hazard_curve.hpp"
#include "loss_curve.hpp"
#include "vulnerability.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace seisrisk {

// Intensity used to look up the vulnerability function for each hazard bin.
// The choice biases results: LeftEdge is optimistic, RightEdge conservative.
enum class BinRepresentative : uint8_t {
    LeftEdge = 0,
    Midpoint = 1,
    RightEdge = 2
};

std::string bin_representative_to_string(BinRepresentative representative);
BinRepresentative bin_representative_from_string(const std::string& name);

struct ConvolutionConfig {
    BinRepresentative representative;   // Default: Midpoint
    double loss_resolution;             // Loss ratios closer than this are merged (default 1e-4)
    size_t loss_ratio_samples;          // Quantile atoms per bin when cov > 0 (default 10)
    bool strict_validation;             // Non-monotone hazard curve is fatal (default false)

    ConvolutionConfig();
};

// One slice of the hazard curve with its annual occurrence probability.
// Bin i spans [iml_i, iml_i+1] with occurrence poe_i - poe_i+1; the last bin
// is the tail above the highest level, with occurrence poe_n-1 and all three
// representatives equal to that level.
struct IntensityBin {
    double lower;
    double upper;
    double representative;
    double occurrence;
};

struct ConvolutionResult {
    LossExceedanceCurve curve;          // Loss-ratio units, spans [0, 1]
    std::vector<std::string> warnings;  // Data-quality warnings (lenient mode)
    size_t bins;                        // Intensity bins with non-zero occurrence
    size_t atoms;                       // Loss atoms after merging

    ConvolutionResult();
};

std::vector<IntensityBin> make_intensity_bins(const HazardCurve& hazard,
                                              BinRepresentative representative);

// Sorts atoms by loss ratio and merges neighbours closer than `resolution`
// into their probability-weighted mean, summing probabilities. Groups whose
// probability sums to exactly zero are dropped.
std::vector<LossRatioAtom> merge_loss_atoms(std::vector<LossRatioAtom> atoms, double resolution);

// Exceedance curve P(L > x) of a discrete loss distribution, anchored at a
// zero loss ratio and closed at a loss ratio of 1
LossExceedanceCurve exceedance_from_atoms(const std::string& asset_id,
                                          const std::vector<LossRatioAtom>& atoms);

// Convolves a hazard curve with a vulnerability function into the asset's
// loss-ratio exceedance curve.
// Throws IncompatibleIntensityMeasure if the two use different IMTs and
// MalformedCurve for a non-monotone hazard curve in strict mode.
ConvolutionResult convolve(const std::string& asset_id,
                           const HazardCurve& hazard,
                           const VulnerabilityFunction& vulnerability,
                           const ConvolutionConfig& config = ConvolutionConfig());

} // namespace seisrisk

#endif // SEISRISK_CONVOLUTION_HPP
