#include "curve_checks.hpp"
#include "errors.hpp"
#include <sstream>

namespace seisrisk {

std::vector<size_t> find_monotonicity_violations(const std::vector<double>& poes) {
    std::vector<size_t> violations;
    for (size_t i = 0; i + 1 < poes.size(); ++i) {
        if (poes[i + 1] > poes[i]) {
            violations.push_back(i);
        }
    }
    return violations;
}

bool check_exceedance_monotone(const std::vector<double>& poes,
                               const std::string& label,
                               bool strict,
                               std::vector<std::string>& warnings) {
    std::vector<size_t> violations = find_monotonicity_violations(poes);
    if (violations.empty()) {
        return true;
    }

    std::ostringstream msg;
    msg << label << ": exceedance probability increases at " << violations.size()
        << " point(s), first at index " << violations.front() + 1
        << " (" << poes[violations.front()] << " -> " << poes[violations.front() + 1] << ")";

    if (strict) {
        throw MalformedCurve(msg.str());
    }
    warnings.push_back(msg.str());
    return false;
}

bool is_strictly_increasing(const std::vector<double>& values) {
    for (size_t i = 0; i + 1 < values.size(); ++i) {
        if (!(values[i + 1] > values[i])) {
            return false;
        }
    }
    return true;
}

} // namespace seisrisk
