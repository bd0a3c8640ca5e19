#ifndef SEISRISK_ERRORS_HPP
#define SEISRISK_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace seisrisk {

// Failure categories reported per asset
enum class ErrorKind : uint8_t {
    IncompatibleIntensityMeasure = 0,
    DegenerateCurve = 1,
    InvalidEconomics = 2,
    MalformedCurve = 3,
    CacheInconsistency = 4,
    MissingInput = 5,
    ComputationCancelled = 6,
    Unexpected = 7
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IncompatibleIntensityMeasure: return "IncompatibleIntensityMeasure";
        case ErrorKind::DegenerateCurve: return "DegenerateCurve";
        case ErrorKind::InvalidEconomics: return "InvalidEconomics";
        case ErrorKind::MalformedCurve: return "MalformedCurve";
        case ErrorKind::CacheInconsistency: return "CacheInconsistency";
        case ErrorKind::MissingInput: return "MissingInput";
        case ErrorKind::ComputationCancelled: return "ComputationCancelled";
        case ErrorKind::Unexpected: return "Unexpected";
        default: return "Unknown";
    }
}

// Base class for all risk pipeline errors
class RiskError : public std::runtime_error {
public:
    RiskError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Hazard curve and vulnerability function use different shaking measures
class IncompatibleIntensityMeasure : public RiskError {
public:
    IncompatibleIntensityMeasure(const std::string& hazard_imt, const std::string& vulnerability_imt)
        : RiskError(ErrorKind::IncompatibleIntensityMeasure,
                    "Hazard curve IMT '" + hazard_imt + "' does not match vulnerability IMT '" +
                    vulnerability_imt + "'"),
          hazard_imt_(hazard_imt), vulnerability_imt_(vulnerability_imt) {}

    const std::string& hazard_imt() const { return hazard_imt_; }
    const std::string& vulnerability_imt() const { return vulnerability_imt_; }

private:
    std::string hazard_imt_;
    std::string vulnerability_imt_;
};

// Too few points to integrate
class DegenerateCurve : public RiskError {
public:
    explicit DegenerateCurve(const std::string& message)
        : RiskError(ErrorKind::DegenerateCurve, message) {}
};

// Interest rate, life expectancy or retrofit cost out of range
class InvalidEconomics : public RiskError {
public:
    InvalidEconomics(const std::string& parameter, const std::string& message)
        : RiskError(ErrorKind::InvalidEconomics, "Invalid " + parameter + ": " + message),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Exceedance probabilities increase somewhere along the curve
class MalformedCurve : public RiskError {
public:
    explicit MalformedCurve(const std::string& message)
        : RiskError(ErrorKind::MalformedCurve, message) {}
};

// Stored hazard output missing or corrupted for a key believed valid
class CacheInconsistency : public RiskError {
public:
    CacheInconsistency(const std::string& cache_key, const std::string& message)
        : RiskError(ErrorKind::CacheInconsistency,
                    "Cache inconsistency for key " + cache_key + ": " + message),
          cache_key_(cache_key) {}

    const std::string& cache_key() const { return cache_key_; }

private:
    std::string cache_key_;
};

// No hazard curve or vulnerability function available for an asset
class MissingInput : public RiskError {
public:
    explicit MissingInput(const std::string& message)
        : RiskError(ErrorKind::MissingInput, message) {}
};

class ComputationCancelled : public RiskError {
public:
    explicit ComputationCancelled(const std::string& message)
        : RiskError(ErrorKind::ComputationCancelled, message) {}
};

} // namespace seisrisk

#endif // SEISRISK_ERRORS_HPP
