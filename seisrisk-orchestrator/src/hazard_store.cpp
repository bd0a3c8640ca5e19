#include "hazard_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace seisrisk {
namespace orchestrator {

namespace {

// Strings longer than this in a store file are treated as corruption
constexpr uint64_t kMaxStringLength = 1u << 20;
constexpr uint64_t kMaxCount = 1u << 28;

void write_u64(std::ostream& os, uint64_t value) {
    os.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

void write_f64(std::ostream& os, double value) {
    os.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

void write_string(std::ostream& os, const std::string& value) {
    write_u64(os, value.size());
    os.write(value.data(), static_cast<std::streamsize>(value.size()));
}

void write_doubles(std::ostream& os, const std::vector<double>& values) {
    write_u64(os, values.size());
    os.write(reinterpret_cast<const char*>(values.data()),
             static_cast<std::streamsize>(values.size() * sizeof(double)));
}

// Readers throw CacheInconsistency instead of returning short data
class StoreReader {
public:
    StoreReader(std::istream& is, const CacheKey& key) : is_(is), key_(key) {}

    uint8_t read_u8() {
        uint8_t value = 0;
        read_raw(&value, sizeof(value));
        return value;
    }

    uint64_t read_u64() {
        uint64_t value = 0;
        read_raw(&value, sizeof(value));
        return value;
    }

    double read_f64() {
        double value = 0.0;
        read_raw(&value, sizeof(value));
        return value;
    }

    uint64_t read_count() {
        uint64_t count = read_u64();
        if (count > kMaxCount) {
            fail("implausible element count " + std::to_string(count));
        }
        return count;
    }

    std::string read_string() {
        uint64_t length = read_u64();
        if (length > kMaxStringLength) {
            fail("implausible string length " + std::to_string(length));
        }
        std::string value(length, '\0');
        read_raw(value.data(), length);
        return value;
    }

    std::vector<double> read_doubles() {
        uint64_t count = read_count();
        // Grow as data arrives so a corrupt count fails on truncation, not allocation
        std::vector<double> values;
        values.reserve(static_cast<size_t>(std::min<uint64_t>(count, 4096)));
        for (uint64_t i = 0; i < count; ++i) {
            values.push_back(read_f64());
        }
        return values;
    }

    [[noreturn]] void fail(const std::string& detail) const {
        throw CacheInconsistency(key_.hex(), detail);
    }

private:
    std::istream& is_;
    const CacheKey& key_;

    void read_raw(void* out, size_t bytes) {
        if (bytes == 0) {
            return;
        }
        is_.read(static_cast<char*>(out), static_cast<std::streamsize>(bytes));
        if (!is_ || static_cast<size_t>(is_.gcount()) != bytes) {
            fail("truncated store data");
        }
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------

HazardCurveStore::Builder::Builder(CacheKey key)
    : key_(std::move(key)) {}

HazardCurveStore::Builder& HazardCurveStore::Builder::add_curve(HazardCurve curve) {
    if (curve.empty()) {
        throw std::invalid_argument("Empty hazard curve for site " + curve.site_id());
    }
    auto id = std::make_tuple(curve.site_id(), curve.imt(), curve.realization());
    if (curves_.count(id) > 0) {
        throw std::invalid_argument("Duplicate hazard curve for site " + curve.site_id() +
                                    ", imt " + curve.imt() + ", realization " + curve.realization());
    }
    curves_.emplace(std::move(id), std::move(curve));
    return *this;
}

HazardCurveStore::Builder& HazardCurveStore::Builder::set_weight(const std::string& realization, double weight) {
    if (!(weight >= 0.0)) {
        throw std::invalid_argument("Negative weight for realization " + realization);
    }
    weights_[realization] = weight;
    return *this;
}

std::shared_ptr<const HazardCurveStore> HazardCurveStore::Builder::build() {
    std::vector<HazardCurve> curves;
    curves.reserve(curves_.size());
    for (auto& entry : curves_) {
        if (weights_.count(entry.second.realization()) == 0) {
            throw std::invalid_argument("No weight for realization " + entry.second.realization());
        }
        curves.push_back(std::move(entry.second));
    }
    curves_.clear();
    return std::shared_ptr<const HazardCurveStore>(
        new HazardCurveStore(key_, std::move(curves), weights_));
}

// ---------------------------------------------------------------------------
// HazardCurveStore
// ---------------------------------------------------------------------------

HazardCurveStore::HazardCurveStore(CacheKey key,
                                   std::vector<HazardCurve> curves,
                                   std::map<std::string, double> weights)
    : key_(std::move(key)),
      curves_(std::move(curves)),
      weights_(std::move(weights)) {
    for (size_t i = 0; i < curves_.size(); ++i) {
        const HazardCurve& c = curves_[i];
        index_[std::make_tuple(c.site_id(), c.imt(), c.realization())] = i;
    }
    checksum_ = compute_checksum();
}

size_t HazardCurveStore::max_levels() const {
    size_t levels = 0;
    for (const auto& curve : curves_) {
        levels = std::max(levels, curve.size());
    }
    return levels;
}

std::vector<HazardCurveStore::GroupKey> HazardCurveStore::groups() const {
    std::vector<GroupKey> result;
    for (const auto& curve : curves_) {
        GroupKey group(curve.site_id(), curve.imt());
        if (result.empty() || result.back() != group) {
            result.push_back(group);
        }
    }
    return result;
}

std::vector<std::string> HazardCurveStore::site_ids() const {
    std::vector<std::string> sites;
    for (const auto& curve : curves_) {
        if (sites.empty() || sites.back() != curve.site_id()) {
            sites.push_back(curve.site_id());
        }
    }
    return sites;
}

const HazardCurve* HazardCurveStore::find(const std::string& site_id, const std::string& imt,
                                          const std::string& realization) const {
    auto it = index_.find(std::make_tuple(site_id, imt, realization));
    if (it == index_.end()) {
        return nullptr;
    }
    return &curves_[it->second];
}

std::vector<HazardCurve> HazardCurveStore::curves_for(const std::string& site_id,
                                                      const std::string& imt) const {
    std::vector<HazardCurve> result;
    auto it = index_.lower_bound(std::make_tuple(site_id, imt, std::string()));
    for (; it != index_.end(); ++it) {
        if (std::get<0>(it->first) != site_id || std::get<1>(it->first) != imt) {
            break;
        }
        result.push_back(curves_[it->second]);
    }
    return result;
}

uint64_t HazardCurveStore::compute_checksum() const {
    Fnv1a64 h;
    h.add_tag("HazardCurveStore/v1");
    h.update_u64(weights_.size());
    for (const auto& [realization, weight] : weights_) {
        h.update_string(realization);
        h.update_f64(weight);
    }
    h.update_u64(curves_.size());
    for (const auto& curve : curves_) {
        h.update_string(curve.site_id());
        h.update_string(curve.imt());
        h.update_string(curve.realization());
        h.update_u64(curve.size());
        for (size_t i = 0; i < curve.size(); ++i) {
            h.update_f64(curve.imls()[i]);
            h.update_f64(curve.poes()[i]);
        }
    }
    return h.value();
}

void HazardCurveStore::serialize(std::ostream& os) const {
    os.put(static_cast<char>(MAGIC));
    os.put(static_cast<char>(VERSION));

    write_u64(os, key_.digest);
    write_string(os, key_.canonical);

    write_u64(os, weights_.size());
    for (const auto& [realization, weight] : weights_) {
        write_string(os, realization);
        write_f64(os, weight);
    }

    write_u64(os, curves_.size());
    for (const auto& curve : curves_) {
        write_string(os, curve.site_id());
        write_string(os, curve.imt());
        write_string(os, curve.realization());
        write_doubles(os, curve.imls());
        write_doubles(os, curve.poes());
    }

    write_u64(os, checksum_);

    if (!os) {
        throw std::runtime_error("Failed to write hazard store " + key_.hex());
    }
}

std::shared_ptr<const HazardCurveStore> HazardCurveStore::deserialize(std::istream& is,
                                                                      const CacheKey& expected) {
    StoreReader reader(is, expected);

    if (reader.read_u8() != MAGIC) {
        reader.fail("bad magic byte");
    }
    uint8_t version = reader.read_u8();
    if (version != VERSION) {
        reader.fail("unsupported store version " + std::to_string(version));
    }

    CacheKey stored;
    stored.digest = reader.read_u64();
    stored.canonical = reader.read_string();
    if (stored != expected) {
        reader.fail("stored key " + stored.hex() + " does not match");
    }

    Builder builder(stored);
    std::shared_ptr<const HazardCurveStore> store;
    uint64_t checksum = 0;
    try {
        uint64_t weight_count = reader.read_count();
        for (uint64_t i = 0; i < weight_count; ++i) {
            std::string realization = reader.read_string();
            double weight = reader.read_f64();
            builder.set_weight(realization, weight);
        }

        uint64_t curve_count = reader.read_count();
        for (uint64_t i = 0; i < curve_count; ++i) {
            std::string site_id = reader.read_string();
            std::string imt = reader.read_string();
            std::string realization = reader.read_string();
            std::vector<double> imls = reader.read_doubles();
            std::vector<double> poes = reader.read_doubles();
            builder.add_curve(HazardCurve(site_id, imt, std::move(imls), std::move(poes), realization));
        }

        checksum = reader.read_u64();
        store = builder.build();
    } catch (const std::invalid_argument& e) {
        reader.fail(e.what());
    }

    if (store->checksum() != checksum) {
        reader.fail("checksum mismatch (stored " + hash_to_hex(checksum) +
                    ", computed " + hash_to_hex(store->checksum()) + ")");
    }
    return store;
}

} // namespace orchestrator
} // namespace seisrisk
