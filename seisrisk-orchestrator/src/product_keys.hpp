#ifndef SEISRISK_ORCHESTRATOR_PRODUCT_KEYS_HPP
#define SEISRISK_ORCHESTRATOR_PRODUCT_KEYS_HPP

#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Kind of artifact a product key addresses
 */
enum class ProductType {
    HazardCurve,            ///< One realization's curve
    MeanHazardCurve,
    QuantileHazardCurve,
    MeanHazardMap,          ///< Intensity at a poe on the mean curve
    QuantileHazardMap,      ///< Intensity at a poe on a quantile curve
    LossCurve               ///< One asset's loss curve for one vulnerability variant
};

std::string product_type_to_string(ProductType type);

/**
 * @throws std::invalid_argument for an unknown token
 */
ProductType product_type_from_string(const std::string& token);

/**
 * @brief Parsed product key
 *
 * Fields not used by the product type stay empty (or 0 for numbers).
 */
struct ProductKey {
    ProductType type;
    std::string job_key;       ///< Hex cache key of the hazard the product derives from
    std::string site_id;
    std::string imt;
    std::string realization;   ///< HazardCurve
    double quantile;           ///< QuantileHazardCurve, QuantileHazardMap
    double poe;                ///< MeanHazardMap, QuantileHazardMap
    std::string asset_id;      ///< LossCurve
    std::string variant;       ///< LossCurve: original or retrofitted

    ProductKey() : type(ProductType::HazardCurve), quantile(0.0), poe(0.0) {}
};

/// Separator between key components
constexpr char KEY_SEPARATOR = '!';

// Key layout: <type>!<job_key>!<components...>
// Components may not contain the separator (std::invalid_argument).
std::string hazard_curve_key(const std::string& job_key, const std::string& site_id,
                             const std::string& imt, const std::string& realization);
std::string mean_hazard_curve_key(const std::string& job_key, const std::string& site_id,
                                  const std::string& imt);
std::string quantile_hazard_curve_key(const std::string& job_key, const std::string& site_id,
                                      const std::string& imt, double quantile);
std::string mean_hazard_map_key(const std::string& job_key, const std::string& site_id,
                                const std::string& imt, double poe);
std::string quantile_hazard_map_key(const std::string& job_key, const std::string& site_id,
                                    const std::string& imt, double poe, double quantile);
std::string loss_curve_key(const std::string& job_key, const std::string& asset_id,
                           const std::string& variant);

/**
 * @brief Splits a key back into its components
 *
 * @throws std::invalid_argument for an unknown type, a wrong component
 *         count or a non-numeric quantile or poe
 */
ProductKey parse_product_key(const std::string& key);

/**
 * @brief Shortest decimal text that reads back as the same double
 */
std::string format_key_number(double value);

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_PRODUCT_KEYS_HPP
