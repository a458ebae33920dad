#include "Application.hpp"
#include "installer/HttpClient.hpp"
#include "installer/InstallPipeline.hpp"
#include "installer/ManualFallback.hpp"
#include "platform/PlatformDetector.hpp"
#include "platform/ProcessUtils.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <iostream>

using utils::ErrorCategory;
using utils::ErrorReporter;

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

bool Application::parseCommandLineArgs(std::string& outError)
{
    return CommandLine::parse(argc_, argv_, options_, outError);
}

bool Application::initializeConfig(std::string& outError)
{
    ConfigLoader loader;
    loader.applyDefaults(config_);

    // Explicit config files must exist; the per-user one is optional
    if (options_.config_path)
    {
        if (!loader.loadFile(loader.expandHome(*options_.config_path), config_, true))
        {
            outError = loader.lastError();
            return false;
        }
    }
    else if (const char* envConfig = std::getenv("DYMO_BOOTSTRAP_CONFIG"); envConfig && *envConfig)
    {
        if (!loader.loadFile(loader.expandHome(envConfig), config_, true))
        {
            outError = loader.lastError();
            return false;
        }
    }
    else if (auto userConfig = loader.userConfigPath())
    {
        if (!loader.loadFile(*userConfig, config_, false))
        {
            outError = loader.lastError();
            return false;
        }
    }

    loader.applyEnvironment(config_);

    if (options_.version)
        config_.release.version = *options_.version;
    if (options_.install_dir)
        config_.install.directory = loader.expandHome(*options_.install_dir);
    if (options_.mirror && !installer::parseMirrorScheme(*options_.mirror, config_.mirror.scheme))
    {
        outError = "unknown mirror '" + *options_.mirror + "' (expected raw or jsdelivr)";
        return false;
    }
    if (options_.no_modify_path)
        config_.install.modify_path = false;
    if (options_.non_interactive)
        config_.install.interactive = false;

    return config_.validate(outError);
}

void Application::initializeLogging()
{
    utils::LogManager::LoggerConfig cfg;
    cfg.level = utils::LogManager::SeverityFromInt(config_.logging.level);
    if (options_.verbose)
        cfg.level = plog::debug;
    else if (options_.quiet)
        cfg.level = plog::warning;
    cfg.filepath = config_.logging.file;

    utils::LogManager::Initialize(cfg);
}

void Application::printSummary(const installer::InstallOutcome& outcome)
{
    if (outcome.code == installer::ExitCode::Success)
    {
        PLOG_INFO << outcome.message;
        if (!outcome.updatedStartupFiles.empty())
        {
            PLOG_INFO << "Open a new shell, or run: source " << outcome.updatedStartupFiles.front().string();
        }
        ErrorReporter::ClearErrors();
        return;
    }

    if (!outcome.attempts.empty())
    {
        PLOG_INFO << "Download attempts:";
        for (const auto& attempt : outcome.attempts)
        {
            PLOG_INFO << "  " << installer::toString(attempt.candidate.kind) << " #" << attempt.attemptNumber << " "
                      << attempt.candidate.url << ": " << installer::toString(attempt.outcome) << ", "
                      << installer::Downloader::formatSize(attempt.sizeBytes) << " (" << attempt.detail << ")";
        }
    }

    auto reports = ErrorReporter::GetPendingErrors();
    if (!reports.empty())
    {
        PLOG_INFO << "Problems during this run:";
        for (const auto& report : reports)
        {
            PLOG_INFO << "  [" << ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        }
    }
}

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(error))
    {
        std::cerr << "error: " << error << "\n\n" << CommandLine::usage(argc_ > 0 ? argv_[0] : "dymo-bootstrap");
        return static_cast<int>(installer::ExitCode::UsageError);
    }

    if (options_.help)
    {
        std::cout << CommandLine::usage(argc_ > 0 ? argv_[0] : "dymo-bootstrap");
        return static_cast<int>(installer::ExitCode::Success);
    }

    bool configOk = initializeConfig(error);
    initializeLogging();
    if (!configOk)
    {
        ErrorReporter::ReportFatal(ErrorCategory::Configuration, "Invalid configuration", error);
        return static_cast<int>(installer::ExitCode::UsageError);
    }

    PLOG_DEBUG << "Install directory: " << config_.install.directory.string();

    installer::CprHttpClient http;
    installer::ManualFallback fallback(std::cin, std::cout, &platform::ProcessUtils::OpenUrl,
                                       config_.install.interactive);
    installer::InstallPipeline pipeline(config_, http, fallback);

    installer::InstallOutcome outcome = pipeline.run(platform::PlatformDetector::queryHost());
    printSummary(outcome);
    return static_cast<int>(outcome.code);
}
