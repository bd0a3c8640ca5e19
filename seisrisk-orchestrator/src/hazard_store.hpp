#ifndef SEISRISK_ORCHESTRATOR_HAZARD_STORE_HPP
#define SEISRISK_ORCHESTRATOR_HAZARD_STORE_HPP

#include "cache_key.hpp"
#include "hazard_curve.hpp"
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Immutable set of hazard curves for one cache key
 *
 * Holds one curve per (site, imt, realization) together with the logic-tree
 * weight of each realization. Populated once through Builder, then shared
 * read-only by every run that resolves to the same key.
 *
 * Usage Example:
 *   @code
 *   HazardCurveStore::Builder builder(key);
 *   builder.set_weight("rlz-0", 0.6);
 *   builder.set_weight("rlz-1", 0.4);
 *   builder.add_curve(curve_0);
 *   builder.add_curve(curve_1);
 *   std::shared_ptr<const HazardCurveStore> store = builder.build();
 *
 *   for (const auto& group : store->groups()) {
 *       auto curves = store->curves_for(group.first, group.second);
 *   }
 *   @endcode
 */
class HazardCurveStore {
public:
    /// (site_id, imt)
    using GroupKey = std::pair<std::string, std::string>;

    /**
     * @brief Collects curves and weights before the store is sealed
     */
    class Builder {
    public:
        explicit Builder(CacheKey key);

        /**
         * @throws std::invalid_argument for a duplicate (site, imt, realization)
         *         or an empty curve
         */
        Builder& add_curve(HazardCurve curve);

        /**
         * @throws std::invalid_argument for a negative weight
         */
        Builder& set_weight(const std::string& realization, double weight);

        size_t curve_count() const { return curves_.size(); }

        /**
         * @brief Seals the store
         *
         * @throws std::invalid_argument if a curve's realization has no weight
         */
        std::shared_ptr<const HazardCurveStore> build();

    private:
        CacheKey key_;
        std::map<std::tuple<std::string, std::string, std::string>, HazardCurve> curves_;
        std::map<std::string, double> weights_;
    };

    const CacheKey& cache_key() const { return key_; }
    const std::map<std::string, double>& weights() const { return weights_; }

    /// Curves ordered by site, imt, realization
    const std::vector<HazardCurve>& curves() const { return curves_; }

    size_t size() const { return curves_.size(); }
    bool empty() const { return curves_.empty(); }
    size_t realization_count() const { return weights_.size(); }

    /// Largest number of intensity levels of any curve
    size_t max_levels() const;

    /// Distinct (site, imt) pairs in order
    std::vector<GroupKey> groups() const;

    std::vector<std::string> site_ids() const;

    const HazardCurve* find(const std::string& site_id, const std::string& imt,
                            const std::string& realization) const;

    /// Every realization of one (site, imt), ordered by realization
    std::vector<HazardCurve> curves_for(const std::string& site_id, const std::string& imt) const;

    /// FNV-1a digest of weights and curves
    uint64_t checksum() const { return checksum_; }

    /**
     * @brief Writes the versioned binary form
     *
     * Layout: magic, version, cache key (digest and canonical text),
     * weights, curves, checksum.
     */
    void serialize(std::ostream& os) const;

    /**
     * @brief Reads a store written by serialize()
     *
     * @param is Input stream
     * @param expected Key the caller believes the data belongs to
     * @throws CacheInconsistency on a bad magic byte, unknown version,
     *         truncated data, key mismatch or checksum mismatch
     */
    static std::shared_ptr<const HazardCurveStore> deserialize(std::istream& is, const CacheKey& expected);

    static constexpr uint8_t MAGIC = 0x48;    // 'H'
    static constexpr uint8_t VERSION = 1;

private:
    HazardCurveStore(CacheKey key,
                     std::vector<HazardCurve> curves,
                     std::map<std::string, double> weights);

    CacheKey key_;
    std::vector<HazardCurve> curves_;
    std::map<std::string, double> weights_;
    std::map<std::tuple<std::string, std::string, std::string>, size_t> index_;
    uint64_t checksum_;

    uint64_t compute_checksum() const;
};

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_HAZARD_STORE_HPP
