#ifndef SEISRISK_ORCHESTRATOR_CACHE_KEY_HPP
#define SEISRISK_ORCHESTRATOR_CACHE_KEY_HPP

#include "job_config.hpp"
#include <cstdint>
#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief FNV-1a 64-bit hash with explicit, platform-stable encodings
 *
 * Not cryptographic. Used for cache identity and store checksums.
 */
class Fnv1a64 {
public:
    static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
    static constexpr uint64_t kPrime = 1099511628211ull;

    Fnv1a64() : h_(kOffsetBasis) {}

    uint64_t value() const { return h_; }

    void update_bytes(const void* data, size_t n);
    void update_u8(uint8_t v) { update_bytes(&v, 1); }
    void update_u64(uint64_t v);    ///< Little-endian
    void update_i64(int64_t v) { update_u64(static_cast<uint64_t>(v)); }
    void update_bool(bool b) { update_u8(b ? 1 : 0); }
    void update_string(const std::string& s);   ///< Length-delimited
    void update_f64(double x);      ///< -0.0 hashed as +0.0, all NaNs alike

    /**
     * @brief Section tag followed by a unit separator
     */
    void add_tag(const std::string& tag);

private:
    uint64_t h_;
};

/**
 * @brief 16 lowercase hex digits
 */
std::string hash_to_hex(uint64_t value);

/**
 * @brief Fingerprint of every hazard-affecting parameter of a job
 *
 * Two configurations with equal keys describe the same hazard computation.
 * The canonical text is stored next to persisted hazard output so a digest
 * collision is detected instead of served.
 */
struct CacheKey {
    uint64_t digest;
    std::string canonical;   ///< Compact JSON of the hashed parameters

    CacheKey() : digest(0) {}

    std::string hex() const { return hash_to_hex(digest); }

    bool operator==(const CacheKey& other) const {
        return digest == other.digest && canonical == other.canonical;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }
};

/**
 * @brief Computes the cache key of a job
 *
 * Only parameters classified ParameterScope::Hazard are read, in a fixed
 * order. Site order does not matter; intensity level order does.
 *
 * @param hazard_source Fingerprint of the hazard input the curves come from
 *        (IHazardCalculator::fingerprint()), hashed under its own tag so a
 *        changed input under an unchanged job gets a new key
 */
CacheKey make_cache_key(const JobConfig& config, const std::string& hazard_source = "");

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_CACHE_KEY_HPP
