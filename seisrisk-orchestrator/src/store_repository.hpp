#ifndef SEISRISK_ORCHESTRATOR_STORE_REPOSITORY_HPP
#define SEISRISK_ORCHESTRATOR_STORE_REPOSITORY_HPP

#include "hazard_store.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Repository statistics
 */
struct RepositoryStats {
    size_t hits;              ///< find() returned a store
    size_t misses;            ///< find() found no entry
    size_t disk_loads;        ///< Stores read back from the cache directory
    size_t publishes;
    size_t inconsistencies;   ///< Known entries found missing or corrupt
    size_t entries_count;     ///< Known keys
    size_t bytes_stored;      ///< Bytes written to disk by this repository
};

/**
 * @brief Content-addressed home of hazard curve stores
 *
 * Features:
 * - One store per cache key, populated once, read many times
 * - Optional persistence to a cache directory (one file per key)
 * - Publication writes a temp file and renames it into place, so readers
 *   never see a partial entry
 * - A known key whose file is missing or corrupt raises CacheInconsistency
 *   and is never served stale
 * - Thread-safe
 */
class StoreRepository {
public:
    /**
     * @brief Constructor
     *
     * Existing store files in the cache directory become known keys.
     *
     * @param cache_dir Cache directory path (empty: memory only)
     * @param keep_in_memory Keep published and loaded stores in memory
     */
    explicit StoreRepository(const std::string& cache_dir = "", bool keep_in_memory = true);

    /**
     * @brief Looks up the store for a key
     *
     * @return The store, or nullptr if the key is unknown
     * @throws CacheInconsistency if the key is known but its stored data is
     *         missing, corrupt or belongs to a different key
     */
    std::shared_ptr<const HazardCurveStore> find(const CacheKey& key);

    /**
     * @brief Makes a populated store visible under its cache key
     *
     * @throws std::runtime_error if the store file cannot be written; the
     *         key then stays unknown
     */
    void publish(std::shared_ptr<const HazardCurveStore> store);

    bool contains(const CacheKey& key) const;

    /**
     * @brief Forgets a key and deletes its file
     */
    void invalidate(const CacheKey& key);

    /**
     * @brief Forgets every key and deletes all store files
     */
    void clear();

    /**
     * @brief Drops in-memory copies; known keys are reloaded from disk
     */
    void evict_memory();

    RepositoryStats get_stats() const;

    bool persistent() const { return !cache_dir_.empty(); }

    /**
     * @brief File holding the store of a key
     */
    std::filesystem::path get_cache_path(const CacheKey& key) const;

    static constexpr const char* FILE_EXTENSION = ".hzs";

private:
    std::filesystem::path cache_dir_;
    bool keep_in_memory_;
    mutable std::mutex mutex_;

    std::map<uint64_t, std::shared_ptr<const HazardCurveStore>> memory_;
    std::set<uint64_t> known_;

    // Statistics
    size_t hits_;
    size_t misses_;
    size_t disk_loads_;
    size_t publishes_;
    size_t inconsistencies_;
    size_t bytes_stored_;
    size_t temp_counter_;

    std::shared_ptr<const HazardCurveStore> load_from_disk(const CacheKey& key);
    void save_to_disk(const HazardCurveStore& store);
    void scan_cache_dir();
};

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_STORE_REPOSITORY_HPP
