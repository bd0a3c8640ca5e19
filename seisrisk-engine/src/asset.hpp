#ifndef SEISRISK_ASSET_HPP
#define SEISRISK_ASSET_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace seisrisk {

// Asset: an opaque identifier with the value, location and class needed to
// price its seismic risk
struct Asset {
    std::string asset_id;
    std::string site_id;     // Site whose hazard curve applies
    std::string taxonomy;    // Vulnerability function lookup key
    double value;            // Replacement value
    double retrofit_cost;    // Same currency as value
    double lon;
    double lat;

    Asset();

    bool operator==(const Asset& other) const;
};

class AssetSet {
public:
    // Throws std::invalid_argument on a duplicate asset_id
    void add(const Asset& asset);
    void add(Asset&& asset);

    const Asset& get(size_t index) const;
    const Asset* find(const std::string& asset_id) const;
    size_t size() const { return assets_.size(); }
    bool empty() const { return assets_.empty(); }

    const std::vector<Asset>& assets() const { return assets_; }

    // Distinct site ids in first-seen order
    std::vector<std::string> site_ids() const;

    void reserve(size_t count) { assets_.reserve(count); }

    // Header: asset_id,site_id,taxonomy,value,retrofit_cost[,lon,lat]
    static AssetSet load_from_csv(const std::string& filepath);
    static AssetSet load_from_csv(std::istream& is);

private:
    std::vector<Asset> assets_;
    std::map<std::string, size_t> index_;
};

} // namespace seisrisk

#endif // SEISRISK_ASSET_HPP
