#ifndef SEISRISK_CURVE_CHECKS_HPP
#define SEISRISK_CURVE_CHECKS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace seisrisk {

// Returns every index i where poes[i + 1] > poes[i]. The probabilities must
// already be ordered by increasing intensity or loss.
std::vector<size_t> find_monotonicity_violations(const std::vector<double>& poes);

// Lenient mode appends a data-quality warning and returns false.
// Strict mode throws MalformedCurve instead.
bool check_exceedance_monotone(const std::vector<double>& poes,
                               const std::string& label,
                               bool strict,
                               std::vector<std::string>& warnings);

bool is_strictly_increasing(const std::vector<double>& values);

} // namespace seisrisk

#endif // SEISRISK_CURVE_CHECKS_HPP
