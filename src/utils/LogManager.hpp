#pragma once

#include <memory>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        plog::Severity level = plog::info;
        std::string filepath; // empty = console only
        size_t max_file_size = 1024 * 1024;
        size_t backup_count = 2;
        bool add_console_appender = true;
    };

    // Safe to call once per process; later calls only adjust the level
    static bool Initialize(const LoggerConfig& config);

    // Maps the 0-6 config scale onto plog severities, clamping out-of-range values
    static plog::Severity SeverityFromInt(int level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
