#ifndef SEISRISK_IO_JSON_WRITER_HPP
#define SEISRISK_IO_JSON_WRITER_HPP

#include "../aggregation.hpp"
#include "../hazard_curve.hpp"
#include "../loss_curve.hpp"
#include "../risk_batch.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace seisrisk {
namespace io {

nlohmann::json hazard_curve_to_json(const HazardCurve& curve);
nlohmann::json loss_curve_to_json(const LossExceedanceCurve& curve);
nlohmann::json aggregated_curves_to_json(const AggregatedCurves& stats);
nlohmann::json asset_result_to_json(const AssetRiskResult& result);
nlohmann::json asset_failure_to_json(const AssetFailure& failure);

// Per-asset results keyed by asset id plus the failure summary.
// execution_time_ms is left out unless include_timing is set, so that two
// runs over the same inputs serialize to the same bytes.
nlohmann::json risk_batch_to_json(const RiskBatchResult& batch, bool include_timing = false);

void write_risk_batch_json(std::ostream& os, const RiskBatchResult& batch,
                           bool pretty_print = true);

void write_risk_batch_json(const std::string& filepath, const RiskBatchResult& batch,
                           bool pretty_print = true);

} // namespace io
} // namespace seisrisk

#endif // SEISRISK_IO_JSON_WRITER_HPP
