#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "log/ConsoleMessageFormatter.hpp"

#include <filesystem>
#include <system_error>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

plog::Severity LogManager::SeverityFromInt(int level)
{
    if (level < static_cast<int>(plog::none))
        return plog::none;
    if (level > static_cast<int>(plog::verbose))
        return plog::verbose;
    return static_cast<plog::Severity>(level);
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unable to prepare log directory " + parent.string(),
                                     ec.message());
        return false;
    }
    return true;
}

bool LogManager::Initialize(const LoggerConfig& config)
{
    if (s_initialized)
    {
        if (auto logger = plog::get())
        {
            logger->setMaxSeverity(config.level);
        }
        return true;
    }

    try
    {
        auto& logger = plog::init(config.level);

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<ConsoleMessageFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_initialized = true;

        if (!config.filepath.empty() && PrepareLogDirectory(config.filepath))
        {
            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, config.backup_count);
            logger.addAppender(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
            PLOG_DEBUG << "Writing log to " << config.filepath;
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Failed to set up logging", ex.what());
        return false;
    }
}

} // namespace utils
