/**
 * @file logger.hpp
 * @brief Structured logging for the risk runner with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (run ID, cache key, phase)
 * - One event type per cache decision, warning and failure
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef SEISRISK_LOGGER_HPP
#define SEISRISK_LOGGER_HPP

#include "risk_batch.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace seisrisk {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-asset warnings, store sizes)
    INFO,    ///< Informational messages (cache decisions, run summary)
    WARN,    ///< Warning messages (data quality, resource risk, inconsistent cache)
    ERROR    ///< Error messages (asset failures, aborted runs)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Run context attached to every event
 */
struct RunContext {
    std::string run_id;       ///< Caller-chosen identifier of the risk run
    std::string cache_key;    ///< Hex digest of the hazard cache key (empty before it is known)
    std::string phase;        ///< hazard, aggregation, risk

    RunContext() = default;

    RunContext(const std::string& id, const std::string& key = "")
        : run_id(id), cache_key(key) {}
};

/**
 * @brief Figures reported once per run
 */
struct RunSummary {
    size_t assets;                ///< Assets in the batch
    size_t succeeded;             ///< Assets with a result
    size_t failed;                ///< Assets with a typed failure
    bool hazard_reused;           ///< Hazard came from the store
    size_t hazard_computations;   ///< Collaborator calls made by this run (0 or 1)
    double execution_time_ms;     ///< Wall time of the whole run

    RunSummary()
        : assets(0), succeeded(0), failed(0), hazard_reused(false),
          hazard_computations(0), execution_time_ms(0.0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("seisrisk.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Centralized logging for the reuse controller and the risk runner. Every
 * method emits one line with an "event" field, so cache behaviour can be
 * audited from the log alone. Safe to call from several threads.
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "seisrisk.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("run-1", key.hex());
 *   logger.log_cache_hit(ctx, 120);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Stored hazard output reused for this run
     *
     * @param ctx Run context
     * @param curve_count Curves in the reused store
     */
    void log_cache_hit(const RunContext& ctx, size_t curve_count);

    /**
     * @brief No usable store for the key; hazard will be computed
     *
     * @param ctx Run context
     * @param reason "not_found", "invalidated" or "inconsistent"
     */
    void log_cache_miss(const RunContext& ctx, const std::string& reason);

    /**
     * @brief Hazard collaborator invoked
     */
    void log_hazard_computation_start(const RunContext& ctx);

    /**
     * @brief Hazard collaborator returned and the store was published
     *
     * @param ctx Run context
     * @param curve_count Curves in the new store
     * @param elapsed_ms Time spent in the collaborator
     */
    void log_hazard_computation_complete(const RunContext& ctx, size_t curve_count, double elapsed_ms);

    /**
     * @brief Run waited on another run's computation for the same key
     */
    void log_coalesced_wait(const RunContext& ctx);

    /**
     * @brief Stored output missing or corrupt; forcing recomputation
     *
     * @param ctx Run context
     * @param detail What was wrong with the stored entry
     */
    void log_cache_inconsistency(const RunContext& ctx, const std::string& detail);

    /**
     * @brief Hazard computation cancelled; nothing was published
     */
    void log_computation_cancelled(const RunContext& ctx);

    /**
     * @brief Individual-curve export large enough to risk exhausting resources
     *
     * @param ctx Run context
     * @param message Warning text from the aggregator
     * @param realizations Realization count
     * @param estimated_bytes Estimated size of the export
     */
    void log_resource_warning(const RunContext& ctx, const std::string& message,
                              size_t realizations, size_t estimated_bytes);

    /**
     * @brief Malformed input tolerated in lenient mode
     *
     * @param ctx Run context
     * @param subject Asset or curve the warning concerns
     * @param warning Warning text
     */
    void log_data_quality(const RunContext& ctx, const std::string& subject, const std::string& warning);

    /**
     * @brief One asset failed; the batch continues
     */
    void log_asset_failure(const RunContext& ctx, const AssetFailure& failure);

    /**
     * @brief End-of-run figures
     */
    void log_run_summary(const RunContext& ctx, const RunSummary& summary);

    /**
     * @brief Log error with context
     */
    void log_error(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const RunContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Get current log level
     */
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    std::map<std::string, std::string> context_fields(const RunContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace seisrisk

#endif // SEISRISK_LOGGER_HPP
