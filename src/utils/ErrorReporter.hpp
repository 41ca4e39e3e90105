#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, output directory bootstrap
    Configuration,  // TOML parsing, invalid thresholds, bad arguments
    Io,             // unreadable transcript, unwritable artifact
    Parsing,        // recovered malformed input worth surfacing
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded result, processing continues
    Error,   // Item failed, run continues with the next item
    Fatal    // Run cannot start
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Path, errno text, parser position
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter shared by all stages of a run
 *
 * Every report is logged through plog and kept in a bounded queue so the
 * command-line front end can print a summary of what went wrong at the end.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Io, "Failed to read transcript", path);
 *
 *   // After the run:
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
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

    /**
     * @brief Number of reports at or above the given severity since the last clear
     *
     * Counted independently of the bounded queue, so draining or overflowing the
     * queue does not change the result.
     */
    static std::size_t CountAtLeast(ErrorSeverity severity);

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::array<std::size_t, 4> s_severity_counts;
    static constexpr std::size_t MAX_QUEUE_SIZE = 200;
};

} // namespace utils
