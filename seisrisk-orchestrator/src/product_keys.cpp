#include "product_keys.hpp"
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace seisrisk {
namespace orchestrator {

namespace {

void check_component(const std::string& component, const char* what) {
    if (component.empty()) {
        throw std::invalid_argument(std::string("Empty ") + what + " in product key");
    }
    if (component.find(KEY_SEPARATOR) != std::string::npos) {
        throw std::invalid_argument(std::string(what) + " '" + component +
                                    "' contains the key separator");
    }
}

std::string join(ProductType type, const std::vector<std::string>& parts) {
    std::string key = product_type_to_string(type);
    for (const auto& part : parts) {
        key += KEY_SEPARATOR;
        key += part;
    }
    return key;
}

std::vector<std::string> split(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = key.find(KEY_SEPARATOR, start);
        if (pos == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

double parse_number(const std::string& text, const std::string& key) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw std::invalid_argument("Non-numeric component '" + text + "' in product key: " + key);
    }
    return value;
}

} // namespace

std::string product_type_to_string(ProductType type) {
    switch (type) {
        case ProductType::HazardCurve: return "hazard_curve";
        case ProductType::MeanHazardCurve: return "mean_hazard_curve";
        case ProductType::QuantileHazardCurve: return "quantile_hazard_curve";
        case ProductType::MeanHazardMap: return "mean_hazard_map";
        case ProductType::QuantileHazardMap: return "quantile_hazard_map";
        case ProductType::LossCurve: return "loss_curve";
        default: return "unknown";
    }
}

ProductType product_type_from_string(const std::string& token) {
    if (token == "hazard_curve") return ProductType::HazardCurve;
    if (token == "mean_hazard_curve") return ProductType::MeanHazardCurve;
    if (token == "quantile_hazard_curve") return ProductType::QuantileHazardCurve;
    if (token == "mean_hazard_map") return ProductType::MeanHazardMap;
    if (token == "quantile_hazard_map") return ProductType::QuantileHazardMap;
    if (token == "loss_curve") return ProductType::LossCurve;
    throw std::invalid_argument("Unknown product type: " + token);
}

std::string format_key_number(double value) {
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

std::string hazard_curve_key(const std::string& job_key, const std::string& site_id,
                             const std::string& imt, const std::string& realization) {
    check_component(job_key, "job key");
    check_component(site_id, "site id");
    check_component(imt, "imt");
    check_component(realization, "realization");
    return join(ProductType::HazardCurve, {job_key, site_id, imt, realization});
}

std::string mean_hazard_curve_key(const std::string& job_key, const std::string& site_id,
                                  const std::string& imt) {
    check_component(job_key, "job key");
    check_component(site_id, "site id");
    check_component(imt, "imt");
    return join(ProductType::MeanHazardCurve, {job_key, site_id, imt});
}

std::string quantile_hazard_curve_key(const std::string& job_key, const std::string& site_id,
                                      const std::string& imt, double quantile) {
    check_component(job_key, "job key");
    check_component(site_id, "site id");
    check_component(imt, "imt");
    return join(ProductType::QuantileHazardCurve,
                {job_key, site_id, imt, format_key_number(quantile)});
}

std::string mean_hazard_map_key(const std::string& job_key, const std::string& site_id,
                                const std::string& imt, double poe) {
    check_component(job_key, "job key");
    check_component(site_id, "site id");
    check_component(imt, "imt");
    return join(ProductType::MeanHazardMap, {job_key, site_id, imt, format_key_number(poe)});
}

std::string quantile_hazard_map_key(const std::string& job_key, const std::string& site_id,
                                    const std::string& imt, double poe, double quantile) {
    check_component(job_key, "job key");
    check_component(site_id, "site id");
    check_component(imt, "imt");
    return join(ProductType::QuantileHazardMap,
                {job_key, site_id, imt, format_key_number(poe), format_key_number(quantile)});
}

std::string loss_curve_key(const std::string& job_key, const std::string& asset_id,
                           const std::string& variant) {
    check_component(job_key, "job key");
    check_component(asset_id, "asset id");
    check_component(variant, "variant");
    return join(ProductType::LossCurve, {job_key, asset_id, variant});
}

ProductKey parse_product_key(const std::string& key) {
    std::vector<std::string> parts = split(key);

    ProductKey parsed;
    parsed.type = product_type_from_string(parts[0]);

    size_t expected = 0;
    switch (parsed.type) {
        case ProductType::HazardCurve: expected = 5; break;
        case ProductType::MeanHazardCurve: expected = 4; break;
        case ProductType::QuantileHazardCurve: expected = 5; break;
        case ProductType::MeanHazardMap: expected = 5; break;
        case ProductType::QuantileHazardMap: expected = 6; break;
        case ProductType::LossCurve: expected = 4; break;
    }
    if (parts.size() != expected) {
        throw std::invalid_argument("Expected " + std::to_string(expected) +
                                    " components in product key: " + key);
    }

    parsed.job_key = parts[1];
    if (parsed.type == ProductType::LossCurve) {
        parsed.asset_id = parts[2];
        parsed.variant = parts[3];
        return parsed;
    }

    parsed.site_id = parts[2];
    parsed.imt = parts[3];
    switch (parsed.type) {
        case ProductType::HazardCurve:
            parsed.realization = parts[4];
            break;
        case ProductType::QuantileHazardCurve:
            parsed.quantile = parse_number(parts[4], key);
            break;
        case ProductType::MeanHazardMap:
            parsed.poe = parse_number(parts[4], key);
            break;
        case ProductType::QuantileHazardMap:
            parsed.poe = parse_number(parts[4], key);
            parsed.quantile = parse_number(parts[5], key);
            break;
        default:
            break;
    }
    return parsed;
}

} // namespace orchestrator
} // namespace seisrisk
