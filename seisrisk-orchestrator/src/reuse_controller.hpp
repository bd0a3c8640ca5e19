/**
 * @file reuse_controller.hpp
 * @brief Decides between reusing stored hazard and computing it afresh
 *
 * The controller keys every hazard request by make_cache_key(). A request
 * whose key has a stored, intact HazardCurveStore skips the hazard
 * collaborator entirely. Otherwise exactly one caller computes and publishes
 * the store while concurrent callers with the same key wait for it.
 *
 * Guarantees:
 * - At most one hazard computation per cache key in flight
 * - A cancelled or failed computation publishes nothing
 * - A corrupt or missing stored entry is invalidated and recomputed,
 *   never served
 */

#ifndef SEISRISK_ORCHESTRATOR_REUSE_CONTROLLER_HPP
#define SEISRISK_ORCHESTRATOR_REUSE_CONTROLLER_HPP

#include "cache_key.hpp"
#include "hazard_calculator.hpp"
#include "hazard_store.hpp"
#include "job_config.hpp"
#include "logger.hpp"
#include "store_repository.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief How a run obtained its hazard
 */
struct HazardAcquisition {
    std::shared_ptr<const HazardCurveStore> store;
    CacheKey key;
    bool reused;              ///< Store came from the repository
    bool coalesced;           ///< Waited on another caller's computation
    bool computed;            ///< This caller ran the hazard collaborator
    std::string miss_reason;  ///< "not_found" or "inconsistent" when computed
    double elapsed_ms;        ///< Time spent obtaining the store

    HazardAcquisition()
        : reused(false), coalesced(false), computed(false), elapsed_ms(0.0) {}
};

/**
 * @brief Controller statistics
 */
struct ReuseStats {
    size_t hits;              ///< Served from the repository
    size_t misses;            ///< Led a computation
    size_t computations;      ///< Computations that published a store
    size_t coalesced;         ///< Waits on another caller's computation
    size_t inconsistencies;   ///< Stored entries found corrupt or missing
    size_t cancellations;     ///< Computations abandoned on cancel

    ReuseStats()
        : hits(0), misses(0), computations(0), coalesced(0),
          inconsistencies(0), cancellations(0) {}
};

/**
 * @brief Reuse/cache controller wrapped around the hazard collaborator
 *
 * Usage Example:
 *   @code
 *   StoreRepository repository(cache_dir);
 *   FileHazardCalculator calculator(hazard_path);
 *   ReuseController controller(repository, calculator);
 *
 *   CancellationToken token;
 *   HazardAcquisition hazard = controller.acquire(config, RunContext("run-1"), token);
 *   if (hazard.reused) { ... }
 *   @endcode
 */
class ReuseController {
public:
    ReuseController(StoreRepository& repository, IHazardCalculator& calculator);

    /**
     * @brief Returns the hazard store for a job, computing it if needed
     *
     * @param config Job configuration; only its hazard parameters are keyed
     * @param ctx Run context for logging (cache_key is filled in)
     * @param token Cancellation flag for this caller
     * @throws ComputationCancelled if this caller's token is cancelled
     * @throws std::exception from the hazard collaborator when the
     *         computation this caller led or waited on failed
     */
    HazardAcquisition acquire(const JobConfig& config, RunContext ctx, const CancellationToken& token);

    /**
     * @brief Forgets the stored hazard of a job
     */
    void invalidate(const JobConfig& config);

    ReuseStats get_stats() const;

    StoreRepository& repository() { return repository_; }

private:
    using StoreFuture = std::shared_future<std::shared_ptr<const HazardCurveStore>>;

    StoreRepository& repository_;
    IHazardCalculator& calculator_;

    mutable std::mutex mutex_;
    std::map<uint64_t, StoreFuture> in_flight_;
    ReuseStats stats_;

    std::shared_ptr<const HazardCurveStore> compute_and_publish(const JobConfig& config,
                                                               const CacheKey& key,
                                                               const RunContext& ctx,
                                                               const CancellationToken& token);
};

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_REUSE_CONTROLLER_HPP
