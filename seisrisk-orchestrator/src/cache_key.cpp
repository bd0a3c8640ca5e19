#include "cache_key.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

using json = nlohmann::json;

namespace seisrisk {
namespace orchestrator {

namespace {

double canonical_double(double x) {
    if (x == 0.0) {
        return 0.0;
    }
    if (std::isnan(x)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return x;
}

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
    const auto* p = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < n; ++i) {
        h_ ^= p[i];
        h_ *= kPrime;
    }
}

void Fnv1a64::update_u64(uint64_t v) {
    uint8_t bytes[8];
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
    }
    update_bytes(bytes, sizeof(bytes));
}

void Fnv1a64::update_string(const std::string& s) {
    update_u64(static_cast<uint64_t>(s.size()));
    update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) {
    uint64_t bits;
    if (std::isnan(x)) {
        bits = 0x7FF8000000000000ull;
    } else {
        double c = canonical_double(x);
        std::memcpy(&bits, &c, sizeof(bits));
    }
    update_u64(bits);
}

void Fnv1a64::add_tag(const std::string& tag) {
    update_string(tag);
    update_u8(0x1F);
}

std::string hash_to_hex(uint64_t value) {
    static const char* digits = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = digits[value & 0xFu];
        value >>= 4;
    }
    return out;
}

CacheKey make_cache_key(const JobConfig& config, const std::string& hazard_source) {
    std::vector<Site> sites = config.sites;
    std::sort(sites.begin(), sites.end(),
              [](const Site& a, const Site& b) { return a.site_id < b.site_id; });

    Fnv1a64 h;
    json canonical;

    h.add_tag("HazardKey/v1");

    h.add_tag("SourceModel");
    h.update_string(config.source_model_logic_tree);
    canonical["source_model_logic_tree"] = config.source_model_logic_tree;

    h.add_tag("Gsim");
    h.update_string(config.gsim_logic_tree);
    canonical["gsim_logic_tree"] = config.gsim_logic_tree;

    h.add_tag("Sites");
    h.update_u64(sites.size());
    json sites_json = json::array();
    for (const auto& site : sites) {
        h.update_string(site.site_id);
        h.update_f64(site.lon);
        h.update_f64(site.lat);
        sites_json.push_back(json::array({site.site_id, canonical_double(site.lon), canonical_double(site.lat)}));
    }
    canonical["sites"] = sites_json;

    // std::map iterates IMTs in name order
    h.add_tag("Levels");
    h.update_u64(config.intensity_measure_types_and_levels.size());
    json imtls = json::object();
    for (const auto& [imt, levels] : config.intensity_measure_types_and_levels) {
        h.update_string(imt);
        h.update_u64(levels.size());
        json levels_json = json::array();
        for (double level : levels) {
            h.update_f64(level);
            levels_json.push_back(canonical_double(level));
        }
        imtls[imt] = levels_json;
    }
    canonical["intensity_measure_types_and_levels"] = imtls;

    h.add_tag("Calculation");
    h.update_f64(config.truncation_level);
    h.update_f64(config.investigation_time);
    h.update_i64(config.number_of_logic_tree_samples);
    h.update_i64(config.random_seed);
    h.update_f64(config.maximum_distance);
    canonical["truncation_level"] = canonical_double(config.truncation_level);
    canonical["investigation_time"] = canonical_double(config.investigation_time);
    canonical["number_of_logic_tree_samples"] = config.number_of_logic_tree_samples;
    canonical["random_seed"] = config.random_seed;
    canonical["maximum_distance"] = canonical_double(config.maximum_distance);

    h.add_tag("HazardSource");
    h.update_string(hazard_source);
    canonical["hazard_source"] = hazard_source;

    CacheKey key;
    key.digest = h.value();
    key.canonical = canonical.dump();
    return key;
}

} // namespace orchestrator
} // namespace seisrisk
