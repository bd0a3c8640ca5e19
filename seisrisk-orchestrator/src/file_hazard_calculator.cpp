#include "file_hazard_calculator.hpp"
#include "cache_key.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

namespace seisrisk {
namespace orchestrator {

FileHazardCalculator::FileHazardCalculator(const std::string& filepath)
    : filepath_(filepath) {}

std::string FileHazardCalculator::fingerprint() const {
    std::ifstream file(filepath_, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open hazard file: " + filepath_);
    }

    Fnv1a64 h;
    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        std::streamsize n = file.gcount();
        if (n > 0) {
            h.update_bytes(buffer, static_cast<size_t>(n));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read hazard file: " + filepath_);
    }
    return "fnv1a64:" + hash_to_hex(h.value());
}

io::HazardTable FileHazardCalculator::compute(const JobConfig& config, const CancellationToken& token) {
    token.throw_if_cancelled("Hazard computation");

    io::HazardTable source = io::load_hazard_table(filepath_);

    std::set<std::string> sites;
    for (const auto& site : config.sites) {
        sites.insert(site.site_id);
    }

    io::HazardTable result;
    for (const HazardCurve& curve : source.curves) {
        token.throw_if_cancelled("Hazard computation");

        if (sites.count(curve.site_id()) == 0) {
            continue;
        }
        auto levels = config.intensity_measure_types_and_levels.find(curve.imt());
        if (levels == config.intensity_measure_types_and_levels.end()) {
            continue;
        }

        if (curve.imls() == levels->second) {
            result.curves.push_back(curve);
        } else {
            result.curves.push_back(curve.resampled(levels->second));
        }
        result.weights[curve.realization()] = source.weights.at(curve.realization());
    }

    if (result.curves.empty()) {
        throw std::runtime_error("No hazard curves for the configured sites and IMTs in " + filepath_);
    }
    return result;
}

} // namespace orchestrator
} // namespace seisrisk
