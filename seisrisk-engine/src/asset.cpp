#include "asset.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace seisrisk {

Asset::Asset()
    : value(0.0), retrofit_cost(0.0), lon(0.0), lat(0.0) {}

bool Asset::operator==(const Asset& other) const {
    return asset_id == other.asset_id &&
           site_id == other.site_id &&
           taxonomy == other.taxonomy &&
           value == other.value &&
           retrofit_cost == other.retrofit_cost &&
           lon == other.lon &&
           lat == other.lat;
}

void AssetSet::add(const Asset& asset) {
    Asset copy = asset;
    add(std::move(copy));
}

void AssetSet::add(Asset&& asset) {
    if (asset.asset_id.empty()) {
        throw std::invalid_argument("Asset id must not be empty");
    }
    if (index_.count(asset.asset_id) > 0) {
        throw std::invalid_argument("Duplicate asset id: " + asset.asset_id);
    }
    index_[asset.asset_id] = assets_.size();
    assets_.push_back(std::move(asset));
}

const Asset& AssetSet::get(size_t index) const {
    if (index >= assets_.size()) {
        throw std::out_of_range("Asset index out of range");
    }
    return assets_[index];
}

const Asset* AssetSet::find(const std::string& asset_id) const {
    auto it = index_.find(asset_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &assets_[it->second];
}

std::vector<std::string> AssetSet::site_ids() const {
    std::vector<std::string> ids;
    std::set<std::string> seen;
    for (const Asset& asset : assets_) {
        if (seen.insert(asset.site_id).second) {
            ids.push_back(asset.site_id);
        }
    }
    return ids;
}

AssetSet AssetSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

AssetSet AssetSet::load_from_csv(std::istream& is) {
    AssetSet set;
    CsvReader reader(is);
    reader.read_header();

    size_t id_col = reader.column("asset_id");
    size_t site_col = reader.column("site_id");
    size_t taxonomy_col = reader.column("taxonomy");
    size_t value_col = reader.column("value");
    size_t cost_col = reader.column("retrofit_cost");
    bool has_location = reader.has_column("lon") && reader.has_column("lat");
    size_t lon_col = has_location ? reader.column("lon") : 0;
    size_t lat_col = has_location ? reader.column("lat") : 0;
    size_t required = std::max({id_col, site_col, taxonomy_col, value_col, cost_col}) + 1;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        if (row.size() < required) {
            throw std::runtime_error("Assets CSV line " + std::to_string(reader.line_number()) +
                                     ": expected at least " + std::to_string(required) + " fields");
        }

        Asset a;
        a.asset_id = row[id_col];
        a.site_id = row[site_col];
        a.taxonomy = row[taxonomy_col];
        a.value = parse_double(row[value_col], "value", reader.line_number());
        a.retrofit_cost = parse_double(row[cost_col], "retrofit_cost", reader.line_number());
        if (has_location && lon_col < row.size() && lat_col < row.size() &&
            !row[lon_col].empty() && !row[lat_col].empty()) {
            a.lon = parse_double(row[lon_col], "lon", reader.line_number());
            a.lat = parse_double(row[lat_col], "lat", reader.line_number());
        }
        set.add(std::move(a));
    }

    return set;
}

} // namespace seisrisk
