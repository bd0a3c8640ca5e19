#ifndef SEISRISK_ORCHESTRATOR_FILE_HAZARD_CALCULATOR_HPP
#define SEISRISK_ORCHESTRATOR_FILE_HAZARD_CALCULATOR_HPP

#include "hazard_calculator.hpp"
#include <string>

namespace seisrisk {
namespace orchestrator {

/**
 * @brief Serves hazard curves precomputed by an external PSHA run
 *
 * Reads a CSV or Parquet hazard table, keeps the configured sites and IMTs,
 * and resamples every curve onto the configured intensity levels.
 */
class FileHazardCalculator : public IHazardCalculator {
public:
    explicit FileHazardCalculator(const std::string& filepath);

    /**
     * @throws std::runtime_error if the file cannot be read or holds no
     *         curve for the configured sites and IMTs
     */
    io::HazardTable compute(const JobConfig& config, const CancellationToken& token) override;

    std::string name() const override { return "file:" + filepath_; }

    /**
     * @brief FNV-1a digest of the file's bytes
     *
     * Content only: the same table under another path shares the key, a
     * regenerated file under the same path does not.
     *
     * @throws std::runtime_error if the file cannot be read
     */
    std::string fingerprint() const override;

private:
    std::string filepath_;
};

} // namespace orchestrator
} // namespace seisrisk

#endif // SEISRISK_ORCHESTRATOR_FILE_HAZARD_CALCULATOR_HPP
