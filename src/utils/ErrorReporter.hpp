#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Platform,         // Unsupported OS or architecture
    VersionMetadata,  // Release metadata query failed
    Network,          // Download attempts failed
    Filesystem,       // Install directory, permissions, startup files
    Configuration,    // TOML parsing, invalid options
    ManualCompletion, // Automated sources exhausted
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded path taken, run continues
    Error,   // Operation failed
    Fatal    // Run terminates
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Actionable message naming the path/URL involved
    std::string technical_details; // Underlying error text
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Collects problems raised during an install run
 *
 * Every report is logged through plog immediately and queued so the
 * application can print a summary once the pipeline finishes.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::VersionMetadata,
 *                                "Could not resolve the latest release",
 *                                "status 403");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report a problem
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-facing message
     * @param technical_details Technical details for the log
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending reports and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
