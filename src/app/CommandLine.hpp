#pragma once

#include <optional>
#include <string>

struct CommandLineOptions
{
    std::optional<std::string> version; // pinned release tag
    std::optional<std::string> install_dir;
    std::optional<std::string> config_path;
    std::optional<std::string> mirror; // raw | jsdelivr
    bool no_modify_path = false;
    bool non_interactive = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

class CommandLine
{
public:
    // Accepts both "--option value" and "--option=value"
    static bool parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError);

    static std::string usage(const std::string& program);
};
