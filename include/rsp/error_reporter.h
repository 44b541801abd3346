#ifndef RSP_ERROR_REPORTER_H
#define RSP_ERROR_REPORTER_H

#include <rsp/config.h>
#include <rsp/error.h>
#include <rsp/result.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <fstream>
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace rsp {

/**
 * ErrorReporter is the diagnostic and event log shared by the three
 * provisioning entities.
 *
 * Reports never carry key material, PSKs, shared secrets or profile
 * plaintext; callers pass identifiers and error kinds only. SECURITY
 * level reports (signature, MAC and session failures) bypass both the
 * minimum level filter and the rate limiter.
 */
class RSP_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Detailed diagnostic information
        INFO,       // Protocol progress
        WARNING,    // Non-fatal conditions
        ERROR,      // Failed operations
        CRITICAL,   // Failures that stop a provisioning run
        SECURITY    // Verification failures, always logged
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        uint32_t max_reports_per_second = 100;
        size_t max_log_entry_size = 4096;

        std::string log_file_path;                 // Empty = stderr
        bool write_to_stream = true;               // false = callbacks only
        bool use_utc_timestamps = true;

        Result<void> validate() const;
    };

    struct ErrorReport {
        LogLevel level;
        RSPError error_code;
        std::string category;                     // e.g. "key_establishment"
        std::string component;                    // Reporting entity, e.g. "SM-DP"
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::unordered_map<std::string, std::string> metadata;
        bool is_security_incident;

        ErrorReport(LogLevel lvl, RSPError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now())
            , is_security_incident(lvl == LogLevel::SECURITY) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an event.
     * @param level Log level for the report
     * @param error Error kind, SUCCESS for progress events
     * @param category Protocol area
     * @param message Descriptive message (no sensitive data)
     * @return RATE_LIMITED when dropped, otherwise the write result
     */
    Result<void> report_error(LogLevel level,
                              RSPError error,
                              const std::string& category,
                              const std::string& message);

    /**
     * Report a verification failure. Never filtered or rate limited.
     */
    Result<void> report_security_incident(RSPError error,
                                          const std::string& component,
                                          const std::string& description);

    class ReportBuilder;
    ReportBuilder create_report(LogLevel level, RSPError error);

    Result<void> submit_report(const ErrorReport& report);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    Result<void> flush_logs();

    struct ReportingStatistics {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[6]{};
        std::atomic<uint64_t> security_incidents{0};
        std::atomic<uint64_t> rate_limited_reports{0};
        std::atomic<uint64_t> filtered_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };

    const ReportingStatistics& get_statistics() const { return stats_; }
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex output_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable ReportingStatistics stats_;

    struct RateLimitState {
        uint32_t reports_this_second{0};
        std::chrono::steady_clock::time_point second_start;
        std::mutex reset_mutex;
    };
    mutable RateLimitState rate_limit_;

    bool passes_filters(const ErrorReport& report);
    Result<void> write_report(const ErrorReport& report);
    std::string format_report(const ErrorReport& report, const ReportingConfig& config) const;
    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                 bool utc) const;
    void notify_callbacks(const ErrorReport& report);
};

/**
 * Fluent construction of a report with component and metadata.
 */
class RSP_API ErrorReporter::ReportBuilder {
public:
    ReportBuilder(ErrorReporter& reporter, LogLevel level, RSPError error);

    ReportBuilder& category(const std::string& cat);
    ReportBuilder& component(const std::string& comp);
    ReportBuilder& message(const std::string& msg);
    ReportBuilder& metadata(const std::string& key, const std::string& value);

    Result<void> submit();

private:
    ErrorReporter& reporter_;
    ErrorReport report_;
};

// Convenience macros; reporter is a (possibly null) pointer-like handle
#define RSP_REPORT_ERROR(reporter, level, error, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while (0)

#define RSP_REPORT_SECURITY(reporter, error, component, description) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_security_incident((error), (component), (description)); \
        } \
    } while (0)

#define RSP_REPORT_INFO(reporter, message) \
    RSP_REPORT_ERROR(reporter, ::rsp::ErrorReporter::LogLevel::INFO, ::rsp::RSPError::SUCCESS, message)

#define RSP_REPORT_DEBUG(reporter, message) \
    RSP_REPORT_ERROR(reporter, ::rsp::ErrorReporter::LogLevel::DEBUG, ::rsp::RSPError::SUCCESS, message)

#define RSP_REPORT_WARNING(reporter, error, message) \
    RSP_REPORT_ERROR(reporter, ::rsp::ErrorReporter::LogLevel::WARNING, error, message)

} // namespace rsp

#endif // RSP_ERROR_REPORTER_H
