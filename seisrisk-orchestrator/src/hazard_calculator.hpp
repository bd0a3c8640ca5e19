/**
 * @file hazard_calculator.hpp
 * @brief Abstract interface for the hazard computation collaborator
 *
 * The probabilistic hazard analysis itself (source-model traversal,
 * ground-motion models) lives outside this project. The reuse controller
 * talks to it through IHazardCalculator and calls it at most once per cache
 * key at a time.
 *
 * Design Principles:
 * - Deterministic: same configuration produces the same curves
 * - Cancellable: implementations poll the token between units of work
 * - Side-effect free: results are returned, never written to the store
 */

#ifndef SEISRISK_ORCHESTRATOR_HAZARD_CALCULATOR_HPP
#define SEISRISK_ORCHESTRATOR_HAZARD_CALCULATOR_HPP

#include "errors.hpp"
#include "io/hazard_table.hpp"
#include "job_config.hpp"
#include <atomic>
#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Cooperative cancellation flag shared between a run and its workers
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @throws ComputationCancelled if cancel() was called
     */
    void throw_if_cancelled(const std::string& what) const {
        if (is_cancelled()) {
            throw ComputationCancelled(what + " cancelled");
        }
    }

private:
    std::atomic<bool> cancelled_;
};

/**
 * @brief Abstract hazard calculator
 *
 * Usage Pattern:
 *   1. compute() with the job configuration and a cancellation token
 *   2. The caller builds a HazardCurveStore from the returned table
 */
class IHazardCalculator {
public:
    virtual ~IHazardCalculator() = default;

    /**
     * @brief Computes per-realization hazard curves for a job
     *
     * Only the hazard-scope parameters of config may influence the result.
     *
     * @param config Job configuration
     * @param token Cancellation flag, polled between units of work
     * @return Curves for every (site, imt, realization) plus realization weights
     * @throws ComputationCancelled if the token was cancelled
     * @throws std::runtime_error if hazard cannot be produced
     */
    virtual io::HazardTable compute(const JobConfig& config, const CancellationToken& token) = 0;

    /**
     * @brief Short name for logs
     */
    virtual std::string name() const = 0;

    /**
     * @brief Identity of the hazard input behind compute()
     *
     * Part of the cache key: must change whenever the same job would
     * produce different curves, e.g. when an input file is rewritten.
     *
     * @throws std::runtime_error if the input cannot be read
     */
    virtual std::string fingerprint() const = 0;
};

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_HAZARD_CALCULATOR_HPP
