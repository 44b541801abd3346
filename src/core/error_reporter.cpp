#include <rsp/error_reporter.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace rsp {

Result<void> ErrorReporter::ReportingConfig::validate() const {
    if (max_reports_per_second == 0) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    if (max_log_entry_size < 64) {
        return make_error<void>(RSPError::INVALID_CONFIGURATION);
    }
    return make_result();
}

ErrorReporter::ErrorReporter() : config_{} {
    rate_limit_.second_start = std::chrono::steady_clock::now();
}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    if (!config_.log_file_path.empty()) {
        log_file_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    }
}

ErrorReporter::~ErrorReporter() {
    (void)flush_logs();
}

Result<void> ErrorReporter::report_error(LogLevel level,
                                         RSPError error,
                                         const std::string& category,
                                         const std::string& message) {
    ErrorReport report(level, error, message);
    report.category = category;
    return submit_report(report);
}

Result<void> ErrorReporter::report_security_incident(RSPError error,
                                                     const std::string& component,
                                                     const std::string& description) {
    ErrorReport report(LogLevel::SECURITY, error, description);
    report.category = "security";
    report.component = component;
    report.metadata["error"] = error_name(error);
    return submit_report(report);
}

ErrorReporter::ReportBuilder ErrorReporter::create_report(LogLevel level, RSPError error) {
    return ReportBuilder(*this, level, error);
}

Result<void> ErrorReporter::submit_report(const ErrorReport& report) {
    if (!passes_filters(report)) {
        if (report.level >= get_configuration().minimum_level) {
            return make_error<void>(RSPError::RATE_LIMITED);
        }
        return make_result();
    }

    stats_.reports_by_level[static_cast<size_t>(report.level)]++;
    if (report.is_security_incident) {
        stats_.security_incidents++;
    }

    notify_callbacks(report);

    auto result = write_report(report);
    if (!result) {
        return result;
    }

    stats_.total_reports++;
    return make_result();
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (config.log_file_path.empty()) {
        log_file_.reset();
    } else {
        log_file_ = std::make_unique<std::ofstream>(config.log_file_path, std::ios::app);
        if (!log_file_->is_open()) {
            log_file_.reset();
            return make_error<void>(RSPError::INVALID_CONFIGURATION);
        }
    }
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

Result<void> ErrorReporter::flush_logs() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_) {
        log_file_->flush();
        if (!log_file_->good()) {
            return make_error<void>(RSPError::INTERNAL_ERROR);
        }
    } else {
        std::cerr.flush();
    }
    return make_result();
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.security_incidents = 0;
    stats_.rate_limited_reports = 0;
    stats_.filtered_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

// Private method implementations

bool ErrorReporter::passes_filters(const ErrorReport& report) {
    // Security incidents are always logged
    if (report.level == LogLevel::SECURITY) {
        return true;
    }

    uint32_t max_per_second;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        if (report.level < config_.minimum_level) {
            stats_.filtered_reports++;
            return false;
        }
        max_per_second = config_.max_reports_per_second;
    }

    std::lock_guard<std::mutex> lock(rate_limit_.reset_mutex);
    auto now = std::chrono::steady_clock::now();
    if (now - rate_limit_.second_start >= std::chrono::seconds(1)) {
        rate_limit_.reports_this_second = 0;
        rate_limit_.second_start = now;
    }

    // Check limits BEFORE incrementing
    if (rate_limit_.reports_this_second >= max_per_second) {
        stats_.rate_limited_reports++;
        return false;
    }
    rate_limit_.reports_this_second++;
    return true;
}

Result<void> ErrorReporter::write_report(const ErrorReport& report) {
    auto config = get_configuration();
    if (!config.write_to_stream) {
        return make_result();
    }

    std::string formatted = format_report(report, config);
    if (formatted.size() > config.max_log_entry_size) {
        formatted.resize(config.max_log_entry_size);
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_) {
        *log_file_ << formatted << '\n';
        if (!log_file_->good()) {
            return make_error<void>(RSPError::INTERNAL_ERROR);
        }
    } else {
        std::cerr << formatted << std::endl;
    }

    stats_.bytes_logged += formatted.length();
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report,
                                         const ReportingConfig& config) const {
    std::string timestamp = format_timestamp(report.timestamp, config.use_utc_timestamps);

    if (config.format == OutputFormat::JSON) {
        nlohmann::json entry = {
            {"timestamp", timestamp},
            {"level", log_level_to_string(report.level)},
            {"error", error_name(report.error_code)},
            {"category", report.category},
            {"message", report.message}
        };
        if (!report.component.empty()) {
            entry["component"] = report.component;
        }
        if (!report.metadata.empty()) {
            entry["metadata"] = report.metadata;
        }
        if (report.is_security_incident) {
            entry["security_incident"] = true;
        }
        return entry.dump();
    }

    std::ostringstream oss;
    oss << timestamp << " " << log_level_to_string(report.level) << " [";
    if (!report.component.empty()) {
        oss << report.component << "/";
    }
    oss << report.category << "] ";
    if (report.error_code != RSPError::SUCCESS) {
        oss << error_name(report.error_code) << ": ";
    }
    oss << report.message;
    for (const auto& kv : report.metadata) {
        oss << " " << kv.first << "=" << kv.second;
    }
    return oss.str();
}

std::string ErrorReporter::format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                            bool utc) const {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    if (utc) {
        gmtime_r(&t, &tm_buf);
    } else {
        localtime_r(&t, &tm_buf);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        timestamp.time_since_epoch()).count() % 1000000;

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros;
    if (utc) {
        oss << "Z";
    }
    return oss.str();
}

void ErrorReporter::notify_callbacks(const ErrorReport& report) {
    std::vector<ReporterCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        callbacks = custom_reporters_;
    }
    for (const auto& callback : callbacks) {
        callback(report);
    }
}

// ReportBuilder

ErrorReporter::ReportBuilder::ReportBuilder(ErrorReporter& reporter, LogLevel level, RSPError error)
    : reporter_(reporter)
    , report_(level, error, "") {}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::category(const std::string& cat) {
    report_.category = cat;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::component(const std::string& comp) {
    report_.component = comp;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::message(const std::string& msg) {
    report_.message = msg;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::metadata(const std::string& key,
                                                                     const std::string& value) {
    report_.metadata[key] = value;
    return *this;
}

Result<void> ErrorReporter::ReportBuilder::submit() {
    return reporter_.submit_report(report_);
}

} // namespace rsp
