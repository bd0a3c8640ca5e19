#include "reuse_controller.hpp"
#include <chrono>
#include <exception>

namespace seisrisk {
namespace orchestrator {

namespace {

// How often a waiting caller checks its own cancellation token
constexpr std::chrono::milliseconds kWaitPollInterval(10);

double elapsed_ms_since(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace

ReuseController::ReuseController(StoreRepository& repository, IHazardCalculator& calculator)
    : repository_(repository), calculator_(calculator) {}

HazardAcquisition ReuseController::acquire(const JobConfig& config, RunContext ctx,
                                           const CancellationToken& token) {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    HazardAcquisition result;
    result.key = make_cache_key(config, calculator_.fingerprint());
    ctx.cache_key = result.key.hex();
    ctx.phase = "hazard";

    std::string miss_reason = "not_found";

    while (true) {
        token.throw_if_cancelled("Hazard acquisition");

        std::unique_lock<std::mutex> lock(mutex_);

        auto flight = in_flight_.find(result.key.digest);
        if (flight != in_flight_.end()) {
            // Another caller is computing this key
            StoreFuture future = flight->second;
            stats_.coalesced++;
            lock.unlock();
            logger.log_coalesced_wait(ctx);

            while (future.wait_for(kWaitPollInterval) != std::future_status::ready) {
                token.throw_if_cancelled("Wait for hazard computation");
            }

            try {
                result.store = future.get();
            } catch (const ComputationCancelled&) {
                // The leader gave up; retry and possibly lead
                continue;
            }
            result.reused = true;
            result.coalesced = true;
            result.elapsed_ms = elapsed_ms_since(start_time);
            return result;
        }

        std::shared_ptr<const HazardCurveStore> store;
        try {
            store = repository_.find(result.key);
        } catch (const CacheInconsistency& e) {
            stats_.inconsistencies++;
            logger.log_cache_inconsistency(ctx, e.what());
            repository_.invalidate(result.key);
            miss_reason = "inconsistent";
        }

        if (store) {
            stats_.hits++;
            lock.unlock();
            logger.log_cache_hit(ctx, store->size());
            result.store = store;
            result.reused = true;
            result.elapsed_ms = elapsed_ms_since(start_time);
            return result;
        }

        // Lead the computation for this key
        std::promise<std::shared_ptr<const HazardCurveStore>> promise;
        in_flight_[result.key.digest] = promise.get_future().share();
        stats_.misses++;
        lock.unlock();

        logger.log_cache_miss(ctx, miss_reason);

        try {
            store = compute_and_publish(config, result.key, ctx, token);
        } catch (const ComputationCancelled&) {
            {
                std::lock_guard<std::mutex> guard(mutex_);
                in_flight_.erase(result.key.digest);
                stats_.cancellations++;
            }
            promise.set_exception(std::current_exception());
            logger.log_computation_cancelled(ctx);
            throw;
        } catch (...) {
            {
                std::lock_guard<std::mutex> guard(mutex_);
                in_flight_.erase(result.key.digest);
            }
            promise.set_exception(std::current_exception());
            throw;
        }

        {
            std::lock_guard<std::mutex> guard(mutex_);
            in_flight_.erase(result.key.digest);
            stats_.computations++;
        }
        promise.set_value(store);

        result.store = store;
        result.computed = true;
        result.miss_reason = miss_reason;
        result.elapsed_ms = elapsed_ms_since(start_time);
        return result;
    }
}

std::shared_ptr<const HazardCurveStore> ReuseController::compute_and_publish(const JobConfig& config,
                                                                            const CacheKey& key,
                                                                            const RunContext& ctx,
                                                                            const CancellationToken& token) {
    Logger& logger = Logger::get_instance();
    logger.log_hazard_computation_start(ctx);
    auto start_time = std::chrono::high_resolution_clock::now();

    io::HazardTable table = calculator_.compute(config, token);
    token.throw_if_cancelled("Hazard computation");

    HazardCurveStore::Builder builder(key);
    for (const auto& [realization, weight] : table.weights) {
        builder.set_weight(realization, weight);
    }
    for (HazardCurve& curve : table.curves) {
        builder.add_curve(std::move(curve));
    }
    std::shared_ptr<const HazardCurveStore> store = builder.build();

    // Last point at which a cancel leaves no trace
    token.throw_if_cancelled("Hazard computation");
    repository_.publish(store);

    logger.log_hazard_computation_complete(ctx, store->size(), elapsed_ms_since(start_time));
    return store;
}

void ReuseController::invalidate(const JobConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    repository_.invalidate(make_cache_key(config, calculator_.fingerprint()));
}

ReuseStats ReuseController::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace orchestrator
} // namespace seisrisk
