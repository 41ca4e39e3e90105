#pragma once

#include "CommandLine.hpp"
#include "../config/ArchiverConfig.hpp"

#include <memory>
#include <string>
#include <vector>

class ConfigManager;

namespace archive
{
class RunReport;
}

class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitInitFailed = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initializeLogging();
    bool initializeConfig();
    void initializeDiagnostics();
    void logConfigSummary() const;
    bool checkDataDirectory() const;

    std::vector<std::string> resolvePrefixes() const;
    void processAll(archive::RunReport& report);
    void printSummary(const archive::RunReport& report) const;
    void cleanup();

    std::string programName() const;

    std::unique_ptr<ConfigManager> config_manager_;
    CommandLineOptions options_;
    ArchiverConfig config_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
