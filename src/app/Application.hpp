#pragma once

#include "app/CommandLine.hpp"
#include "config/InstallerConfig.hpp"
#include "installer/InstallTypes.hpp"

#include <string>

class Application
{
public:
    Application(int argc, char** argv);

    int run();

private:
    bool parseCommandLineArgs(std::string& outError);
    bool initializeConfig(std::string& outError);
    void initializeLogging();
    void printSummary(const installer::InstallOutcome& outcome);

    CommandLineOptions options_;
    InstallerConfig config_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
