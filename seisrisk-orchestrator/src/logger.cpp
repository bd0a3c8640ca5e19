/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace seisrisk {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(const RunContext& ctx,
                                                          const std::string& event) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["run_id"] = ctx.run_id;
    if (!ctx.cache_key.empty()) {
        fields["cache_key"] = ctx.cache_key;
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_cache_hit(const RunContext& ctx, size_t curve_count) {
    auto fields = context_fields(ctx, "cache_hit");
    fields["curve_count"] = std::to_string(curve_count);
    log(LogLevel::INFO, "Reusing stored hazard curves", std::move(fields));
}

void Logger::log_cache_miss(const RunContext& ctx, const std::string& reason) {
    auto fields = context_fields(ctx, "cache_miss");
    fields["reason"] = reason;
    log(LogLevel::INFO, "No stored hazard curves for key", std::move(fields));
}

void Logger::log_hazard_computation_start(const RunContext& ctx) {
    log(LogLevel::INFO, "Starting hazard computation", context_fields(ctx, "hazard_start"));
}

void Logger::log_hazard_computation_complete(const RunContext& ctx, size_t curve_count, double elapsed_ms) {
    auto fields = context_fields(ctx, "hazard_complete");
    fields["curve_count"] = std::to_string(curve_count);
    fields["execution_time_ms"] = std::to_string(elapsed_ms);
    log(LogLevel::INFO, "Hazard computation stored", std::move(fields));
}

void Logger::log_coalesced_wait(const RunContext& ctx) {
    log(LogLevel::INFO, "Waiting on in-flight hazard computation",
        context_fields(ctx, "coalesced_wait"));
}

void Logger::log_cache_inconsistency(const RunContext& ctx, const std::string& detail) {
    auto fields = context_fields(ctx, "cache_inconsistency");
    fields["detail"] = detail;
    log(LogLevel::WARN, "Stored hazard output unusable, recomputing", std::move(fields));
}

void Logger::log_computation_cancelled(const RunContext& ctx) {
    log(LogLevel::WARN, "Hazard computation cancelled, nothing stored",
        context_fields(ctx, "hazard_cancelled"));
}

void Logger::log_resource_warning(const RunContext& ctx, const std::string& message,
                                  size_t realizations, size_t estimated_bytes) {
    auto fields = context_fields(ctx, "resource_warning");
    fields["realizations"] = std::to_string(realizations);
    fields["estimated_bytes"] = std::to_string(estimated_bytes);
    fields["estimated_mb"] = std::to_string(estimated_bytes / (1024.0 * 1024.0));
    log(LogLevel::WARN, message, std::move(fields));
}

void Logger::log_data_quality(const RunContext& ctx, const std::string& subject, const std::string& warning) {
    auto fields = context_fields(ctx, "data_quality");
    fields["subject"] = subject;
    fields["warning"] = warning;
    log(LogLevel::WARN, "Data-quality warning", std::move(fields));
}

void Logger::log_asset_failure(const RunContext& ctx, const AssetFailure& failure) {
    auto fields = context_fields(ctx, "asset_failure");
    fields["asset_id"] = failure.asset_id;
    fields["kind"] = error_kind_to_string(failure.kind);
    fields["error_message"] = failure.message;
    if (!failure.parameter.empty()) {
        fields["parameter"] = failure.parameter;
    }
    log(LogLevel::ERROR, "Asset failed", std::move(fields));
}

void Logger::log_run_summary(const RunContext& ctx, const RunSummary& summary) {
    auto fields = context_fields(ctx, "run_summary");
    fields["assets"] = std::to_string(summary.assets);
    fields["succeeded"] = std::to_string(summary.succeeded);
    fields["failed"] = std::to_string(summary.failed);
    fields["hazard_reused"] = summary.hazard_reused ? "true" : "false";
    fields["hazard_computations"] = std::to_string(summary.hazard_computations);
    fields["execution_time_ms"] = std::to_string(summary.execution_time_ms);
    log(summary.failed == 0 ? LogLevel::INFO : LogLevel::WARN, "Risk run completed", std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, "Run error", std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    auto fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;
    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        // Plain text format
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    // Invalid UTF-8 in messages is replaced rather than thrown
    return nlohmann::json(fields).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace seisrisk
