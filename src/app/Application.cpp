#include "Application.hpp"
#include "app/Version.hpp"
#include "archive/ArtifactWriter.hpp"
#include "archive/PrefixProcessor.hpp"
#include "archive/RunReport.hpp"
#include "config/ConfigManager.hpp"
#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <plog/Log.h>

namespace fs = std::filesystem;

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

std::string Application::programName() const
{
    if (argc_ > 0 && argv_ && argv_[0])
        return fs::path(argv_[0]).filename().string();
    return "transcript-archiver";
}

int Application::run()
{
    std::string error;
    auto parsed = parse_command_line(argc_, argv_, error);
    if (!parsed)
    {
        std::cerr << programName() << ": " << error << "\n\n" << usage_text(programName());
        return kExitUsage;
    }
    options_ = std::move(*parsed);

    if (options_.help)
    {
        std::cout << usage_text(programName());
        return kExitOk;
    }
    if (options_.version)
    {
        std::cout << "transcript-archiver " << TXA_VERSION_STRING << "\n";
        return kExitOk;
    }

    if (!initializeConfig())
    {
        for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        {
            std::cerr << programName() << ": " << report.user_message;
            if (!report.technical_details.empty())
                std::cerr << ": " << report.technical_details;
            std::cerr << "\n";
        }
        return kExitUsage;
    }

    if (!initializeLogging())
    {
        std::cerr << programName() << ": failed to initialize logging in '" << utils::LogManager::LogDirectory()
                  << "'\n";
        return kExitInitFailed;
    }

    PLOG_INFO << "transcript-archiver " << TXA_VERSION_STRING << " starting";
    logConfigSummary();

    initializeDiagnostics();

    if (!checkDataDirectory())
        return kExitUsage;

    archive::RunReport report;
    processAll(report);
    printSummary(report);

    if (options_.report_path && !report.writeTo(*options_.report_path))
        std::cerr << programName() << ": could not write report to " << *options_.report_path << "\n";

    return kExitOk;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(static_cast<plog::Severity>(config_.logging.level), config_.logging.append,
                                       config_.logging.directory))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filename = "transcript-archiver.log",
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = 10 * 1024 * 1024,
                                                     .backup_count = 3,
                                                     .add_console_appender = true });

#if TXA_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                          .filename = "profiling.log",
                                                                          .append_override = std::nullopt,
                                                                          .level_override = plog::debug,
                                                                          .max_file_size = 10 * 1024 * 1024,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });
#endif

    return ok;
}

bool Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    config_manager_ = std::make_unique<ConfigManager>(options_.config_path);
    if (!register_archiver_tables(*config_manager_, config_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to register config tables",
                                          config_manager_->lastError());
        return false;
    }

    if (!config_manager_->load())
        return false;

    apply_overrides(options_, config_);

    if (auto reason = config_.validate())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid configuration", *reason);
        return false;
    }

    return true;
}

void Application::logConfigSummary() const
{
    if (config_manager_->fileExists())
        PLOG_INFO << "Loaded config from " << config_manager_->configPath();
    else
        PLOG_INFO << "No config file at " << config_manager_->configPath() << "; using defaults";

    // Warnings queued while the file was read, before the loggers existed
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        PLOG_WARNING << report.user_message
                     << (report.technical_details.empty() ? "" : " | Details: " + report.technical_details);

    PLOG_INFO << "Chunking: max_words=" << config_.chunking.max_words << " max_bytes=" << config_.chunking.max_bytes
              << " by_year=" << (config_.chunking.by_year ? "true" : "false");
    PLOG_INFO << "Paths: data_dir=" << config_.paths.data_dir << " output_dir=" << config_.paths.resolvedOutputDir();
}

void Application::initializeDiagnostics()
{
    const bool verbose = config_.processing_options.verbose;
    processing::Diagnostics::SetVerbose(verbose);

    utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
        { .name = "pipeline",
          .filename = "pipeline.log",
          .append_override = std::nullopt,
          .level_override = verbose ? std::optional<plog::Severity>(plog::verbose) : std::nullopt,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

    if (verbose)
        PLOG_INFO << "Verbose pipeline trace enabled: " << utils::LogManager::LogPath("pipeline.log");
}

bool Application::checkDataDirectory() const
{
    std::error_code ec;
    if (fs::is_directory(config_.paths.data_dir, ec))
        return true;

    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Data directory does not exist",
                                      config_.paths.data_dir);
    std::cerr << programName() << ": data directory '" << config_.paths.data_dir << "' does not exist\n";
    return false;
}

std::vector<std::string> Application::resolvePrefixes() const
{
    if (options_.all)
    {
        auto prefixes = archive::PrefixProcessor::discover_prefixes(config_.paths.data_dir);
        PLOG_INFO << "Discovered " << prefixes.size() << " prefixes in " << config_.paths.data_dir;
        return prefixes;
    }
    if (!options_.prefixes.empty())
        return options_.prefixes;
    return default_prefixes();
}

void Application::processAll(archive::RunReport& report)
{
    PROFILE_SCOPE_FUNCTION();

    archive::ArtifactWriter writer(config_.paths.resolvedOutputDir());
    archive::PrefixProcessor processor(config_.paths.data_dir, config_.chunking, config_.parserOptions(), writer);

    for (const auto& prefix : resolvePrefixes())
        report.add(processor.process(prefix));
}

void Application::printSummary(const archive::RunReport& report) const
{
    PLOG_INFO << "Run complete: " << report.summaryLine();
    std::cout << "Done: " << report.summaryLine() << "\n";

    std::size_t problems = utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Error);
    if (problems > 0)
    {
        std::cout << problems << " problem(s) reported; see "
                  << utils::LogManager::LogPath("transcript-archiver.log") << "\n";
    }
}

void Application::cleanup()
{
    utils::ErrorReporter::ClearErrors();
    utils::LogManager::Shutdown();
}
