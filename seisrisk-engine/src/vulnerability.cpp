#include "vulnerability.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <boost/math/distributions/lognormal.hpp>

namespace seisrisk {

std::string variant_to_string(VulnerabilityVariant variant) {
    switch (variant) {
        case VulnerabilityVariant::Original: return "original";
        case VulnerabilityVariant::Retrofitted: return "retrofitted";
        default: return "unknown";
    }
}

// ============================================================================
// VulnerabilityFunction Implementation
// ============================================================================

VulnerabilityFunction::VulnerabilityFunction() {}

VulnerabilityFunction::VulnerabilityFunction(std::string taxonomy,
                                             std::string imt,
                                             std::vector<VulnerabilityPoint> points)
    : taxonomy_(std::move(taxonomy)), imt_(std::move(imt)), points_(std::move(points)) {
    if (points_.empty()) {
        throw std::invalid_argument("Vulnerability function '" + taxonomy_ + "' has no points");
    }

    std::sort(points_.begin(), points_.end(),
              [](const VulnerabilityPoint& a, const VulnerabilityPoint& b) { return a.iml < b.iml; });

    for (size_t i = 0; i < points_.size(); ++i) {
        const VulnerabilityPoint& p = points_[i];
        if (i > 0 && p.iml == points_[i - 1].iml) {
            throw std::invalid_argument("Vulnerability function '" + taxonomy_ +
                                        "' has duplicate intensity " + std::to_string(p.iml));
        }
        if (!(p.mean_loss_ratio >= 0.0 && p.mean_loss_ratio <= 1.0)) {
            throw std::invalid_argument("Vulnerability function '" + taxonomy_ +
                                        "': mean loss ratio must be between 0.0 and 1.0");
        }
        if (!(p.cov >= 0.0)) {
            throw std::invalid_argument("Vulnerability function '" + taxonomy_ +
                                        "': coefficient of variation must be non-negative");
        }
    }
}

double VulnerabilityFunction::interpolate(double iml, double VulnerabilityPoint::*field, double below) const {
    if (iml < points_.front().iml) {
        return below;
    }
    if (iml >= points_.back().iml) {
        return points_.back().*field;
    }

    auto upper = std::upper_bound(points_.begin(), points_.end(), iml,
                                  [](double x, const VulnerabilityPoint& p) { return x < p.iml; });
    const VulnerabilityPoint& hi = *upper;
    const VulnerabilityPoint& lo = *(upper - 1);
    if (lo.iml == iml) {
        return lo.*field;
    }

    double frac = (iml - lo.iml) / (hi.iml - lo.iml);
    return lo.*field + frac * (hi.*field - lo.*field);
}

double VulnerabilityFunction::mean_loss_ratio_at(double iml) const {
    return interpolate(iml, &VulnerabilityPoint::mean_loss_ratio, 0.0);
}

double VulnerabilityFunction::cov_at(double iml) const {
    return interpolate(iml, &VulnerabilityPoint::cov, 0.0);
}

std::vector<LossRatioAtom> VulnerabilityFunction::loss_distribution_at(double iml, size_t samples) const {
    double mean = mean_loss_ratio_at(iml);
    double cov = cov_at(iml);

    if (mean <= 0.0 || cov <= 0.0 || samples <= 1) {
        return {LossRatioAtom{mean, 1.0}};
    }

    // Lognormal with the requested mean and coefficient of variation
    double sigma = std::sqrt(std::log1p(cov * cov));
    double location = std::log(mean) - 0.5 * sigma * sigma;
    boost::math::lognormal_distribution<double> dist(location, sigma);

    std::vector<LossRatioAtom> atoms;
    atoms.reserve(samples);
    double weight = 1.0 / static_cast<double>(samples);
    for (size_t k = 0; k < samples; ++k) {
        double p = (static_cast<double>(k) + 0.5) / static_cast<double>(samples);
        double ratio = std::min(1.0, boost::math::quantile(dist, p));
        atoms.push_back(LossRatioAtom{ratio, weight});
    }
    return atoms;
}

bool VulnerabilityFunction::is_monotone() const {
    for (size_t i = 0; i + 1 < points_.size(); ++i) {
        if (points_[i + 1].mean_loss_ratio < points_[i].mean_loss_ratio) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// VulnerabilityModel Implementation
// ============================================================================

VulnerabilityModel::VulnerabilityModel(std::string name)
    : name_(std::move(name)) {}

void VulnerabilityModel::add(const VulnerabilityFunction& function) {
    if (functions_.count(function.taxonomy()) > 0) {
        throw std::invalid_argument("Duplicate vulnerability function for taxonomy '" +
                                    function.taxonomy() + "' in model '" + name_ + "'");
    }
    functions_.emplace(function.taxonomy(), function);
}

const VulnerabilityFunction* VulnerabilityModel::find(const std::string& taxonomy) const {
    auto it = functions_.find(taxonomy);
    return it == functions_.end() ? nullptr : &it->second;
}

const VulnerabilityFunction& VulnerabilityModel::get(const std::string& taxonomy) const {
    const VulnerabilityFunction* function = find(taxonomy);
    if (!function) {
        throw std::out_of_range("No vulnerability function for taxonomy '" + taxonomy +
                                "' in model '" + name_ + "'");
    }
    return *function;
}

VulnerabilityModel VulnerabilityModel::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open vulnerability file: " + filepath);
    }
    return load_from_csv(file, filepath);
}

VulnerabilityModel VulnerabilityModel::load_from_csv(std::istream& is, const std::string& name) {
    CsvReader reader(is);
    reader.read_header();
    size_t taxonomy_col = reader.column("taxonomy");
    size_t imt_col = reader.column("imt");
    size_t iml_col = reader.column("iml");
    size_t mean_col = reader.column("mean_loss_ratio");
    size_t cov_col = reader.column("cov");
    size_t width = std::max({taxonomy_col, imt_col, iml_col, mean_col, cov_col}) + 1;

    // taxonomy -> (imt, points), in file order
    std::map<std::string, std::pair<std::string, std::vector<VulnerabilityPoint>>> rows;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;
        if (row.size() < width) {
            throw std::runtime_error("Vulnerability CSV row at line " +
                                     std::to_string(reader.line_number()) + " has too few columns");
        }

        const std::string& taxonomy = row[taxonomy_col];
        const std::string& imt = row[imt_col];
        auto& entry = rows[taxonomy];
        if (entry.second.empty()) {
            entry.first = imt;
        } else if (entry.first != imt) {
            throw std::runtime_error("Vulnerability function '" + taxonomy +
                                     "' mixes intensity measure types " + entry.first + " and " + imt);
        }

        size_t line = reader.line_number();
        entry.second.push_back(VulnerabilityPoint{
            parse_double(row[iml_col], "iml", line),
            parse_double(row[mean_col], "mean_loss_ratio", line),
            parse_double(row[cov_col], "cov", line)
        });
    }

    VulnerabilityModel model(name);
    for (auto& [taxonomy, entry] : rows) {
        model.add(VulnerabilityFunction(taxonomy, entry.first, std::move(entry.second)));
    }
    return model;
}

} // namespace seisrisk
