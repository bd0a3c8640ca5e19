#include "store_repository.hpp"
#include "errors.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace seisrisk {
namespace orchestrator {

namespace {

bool parse_digest(const std::string& stem, uint64_t& digest) {
    if (stem.size() != 16) {
        return false;
    }
    for (char c : stem) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    digest = std::stoull(stem, nullptr, 16);
    return true;
}

} // namespace

StoreRepository::StoreRepository(const std::string& cache_dir, bool keep_in_memory)
    : cache_dir_(cache_dir),
      keep_in_memory_(keep_in_memory || cache_dir.empty()),
      hits_(0),
      misses_(0),
      disk_loads_(0),
      publishes_(0),
      inconsistencies_(0),
      bytes_stored_(0),
      temp_counter_(0) {
    if (!cache_dir_.empty()) {
        fs::create_directories(cache_dir_);
        scan_cache_dir();
    }
}

fs::path StoreRepository::get_cache_path(const CacheKey& key) const {
    return cache_dir_ / (key.hex() + FILE_EXTENSION);
}

void StoreRepository::scan_cache_dir() {
    for (const auto& entry : fs::directory_iterator(cache_dir_)) {
        if (!entry.is_regular_file() || entry.path().extension() != FILE_EXTENSION) {
            continue;
        }
        uint64_t digest = 0;
        if (parse_digest(entry.path().stem().string(), digest)) {
            known_.insert(digest);
        }
    }
}

std::shared_ptr<const HazardCurveStore> StoreRepository::find(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (known_.count(key.digest) == 0) {
        misses_++;
        return nullptr;
    }

    auto it = memory_.find(key.digest);
    if (it != memory_.end()) {
        if (it->second->cache_key() != key) {
            inconsistencies_++;
            throw CacheInconsistency(key.hex(), "entry belongs to a different configuration");
        }
        hits_++;
        return it->second;
    }

    if (!persistent()) {
        inconsistencies_++;
        throw CacheInconsistency(key.hex(), "known key has no stored data");
    }

    std::shared_ptr<const HazardCurveStore> store;
    try {
        store = load_from_disk(key);
    } catch (const CacheInconsistency&) {
        inconsistencies_++;
        throw;
    }

    disk_loads_++;
    hits_++;
    if (keep_in_memory_) {
        memory_[key.digest] = store;
    }
    return store;
}

std::shared_ptr<const HazardCurveStore> StoreRepository::load_from_disk(const CacheKey& key) {
    fs::path cache_path = get_cache_path(key);

    if (!fs::exists(cache_path)) {
        throw CacheInconsistency(key.hex(), "store file missing: " + cache_path.string());
    }

    std::ifstream file(cache_path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheInconsistency(key.hex(), "store file unreadable: " + cache_path.string());
    }

    return HazardCurveStore::deserialize(file, key);
}

void StoreRepository::save_to_disk(const HazardCurveStore& store) {
    fs::path cache_path = get_cache_path(store.cache_key());
    fs::path temp_path = cache_path;
    temp_path += ".tmp" + std::to_string(temp_counter_++);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open store file for writing: " + temp_path.string());
        }
        store.serialize(file);
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            throw std::runtime_error("Failed to write store file: " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, cache_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw std::runtime_error("Failed to publish store file " + cache_path.string() + ": " + ec.message());
    }

    bytes_stored_ += static_cast<size_t>(fs::file_size(cache_path));
}

void StoreRepository::publish(std::shared_ptr<const HazardCurveStore> store) {
    if (!store) {
        throw std::invalid_argument("Cannot publish a null hazard store");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const CacheKey& key = store->cache_key();
    if (persistent()) {
        save_to_disk(*store);
    }
    if (keep_in_memory_) {
        memory_[key.digest] = store;
    }
    known_.insert(key.digest);
    publishes_++;
}

bool StoreRepository::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.count(key.digest) > 0;
}

void StoreRepository::invalidate(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    memory_.erase(key.digest);
    known_.erase(key.digest);

    if (persistent()) {
        std::error_code ec;
        fs::remove(get_cache_path(key), ec);
        if (ec) {
            throw std::runtime_error("Failed to remove store file for key " + key.hex() + ": " + ec.message());
        }
    }
}

void StoreRepository::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    memory_.clear();
    known_.clear();

    if (persistent()) {
        for (const auto& entry : fs::directory_iterator(cache_dir_)) {
            if (entry.path().extension() == FILE_EXTENSION) {
                fs::remove(entry.path());
            }
        }
    }
}

void StoreRepository::evict_memory() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (persistent()) {
        memory_.clear();
    }
}

RepositoryStats StoreRepository::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RepositoryStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.disk_loads = disk_loads_;
    stats.publishes = publishes_;
    stats.inconsistencies = inconsistencies_;
    stats.entries_count = known_.size();
    stats.bytes_stored = bytes_stored_;
    return stats;
}

} // namespace orchestrator
} // namespace seisrisk
