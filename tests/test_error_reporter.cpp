#include <catch2/catch_test_macros.hpp>
#include <string>

#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter queues reports by severity", "[error_reporter]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Parsing, "Odd markup", "IM_1.html");
    ErrorReporter::ReportError(ErrorCategory::Io, "Failed to read transcript", "IM_2.html");
    ErrorReporter::ReportFatal(ErrorCategory::Configuration, "Configuration file could not be parsed");

    REQUIRE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Warning) == 3);
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Error) == 2);
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Fatal) == 1);

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[1].category == ErrorCategory::Io);
    REQUIRE(reports[1].technical_details == "IM_2.html");
    REQUIRE_FALSE(reports[1].is_fatal);
    REQUIRE(reports[2].is_fatal);
    REQUIRE_FALSE(reports[0].timestamp.empty());
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Warning) == 3);
    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter keeps a bounded queue", "[error_reporter]")
{
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 250; ++i)
        ErrorReporter::ReportError(ErrorCategory::Io, "Failed", std::to_string(i));

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 200);
    REQUIRE(reports.front().technical_details == "50");
    REQUIRE(reports.back().technical_details == "249");

    // Counts cover every report, not only the ones still queued
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Error) == 250);
    ErrorReporter::ClearErrors();
    REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Info) == 0);
}

TEST_CASE("ErrorReporter names categories and severities", "[error_reporter]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Io) == "I/O");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Configuration) == "Configuration");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "Fatal");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
}
