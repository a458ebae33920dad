#include "CommandLine.hpp"

#include <sstream>

namespace
{

// Splits "--name=value"; returns false for plain flags
bool splitInline(const std::string& arg, std::string& name, std::string& value)
{
    auto eq = arg.find('=');
    if (eq == std::string::npos)
    {
        name = arg;
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // namespace

bool CommandLine::parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string name;
        std::string value;
        bool hasInline = splitInline(arg, name, value);

        auto takeValue = [&](std::optional<std::string>& target) -> bool
        {
            if (!hasInline)
            {
                if (i + 1 >= argc)
                {
                    outError = "missing value for " + name;
                    return false;
                }
                value = argv[++i];
            }
            if (value.empty())
            {
                outError = "empty value for " + name;
                return false;
            }
            target = value;
            return true;
        };

        auto rejectInline = [&]() -> bool
        {
            if (hasInline)
            {
                outError = name + " does not take a value";
                return false;
            }
            return true;
        };

        if (name == "--version")
        {
            if (!takeValue(out.version))
                return false;
        }
        else if (name == "--install-dir")
        {
            if (!takeValue(out.install_dir))
                return false;
        }
        else if (name == "--config")
        {
            if (!takeValue(out.config_path))
                return false;
        }
        else if (name == "--mirror")
        {
            if (!takeValue(out.mirror))
                return false;
        }
        else if (name == "--no-modify-path")
        {
            if (!rejectInline())
                return false;
            out.no_modify_path = true;
        }
        else if (name == "--non-interactive")
        {
            if (!rejectInline())
                return false;
            out.non_interactive = true;
        }
        else if (name == "--verbose" || name == "-v")
        {
            if (!rejectInline())
                return false;
            out.verbose = true;
        }
        else if (name == "--quiet" || name == "-q")
        {
            if (!rejectInline())
                return false;
            out.quiet = true;
        }
        else if (name == "--help" || name == "-h")
        {
            out.help = true;
        }
        else
        {
            outError = "unknown option: " + arg;
            return false;
        }
    }

    if (out.verbose && out.quiet)
    {
        outError = "--verbose and --quiet cannot be combined";
        return false;
    }
    return true;
}

std::string CommandLine::usage(const std::string& program)
{
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "\n"
       << "Downloads the dymo-code binary for this machine and installs it for the current user.\n"
       << "\n"
       << "Options:\n"
       << "  --version <tag>       Install this release tag instead of the latest (env: DYMO_VERSION)\n"
       << "  --install-dir <dir>   Install location (default: ~/.local/bin, env: DYMO_INSTALL_DIR)\n"
       << "  --config <file>       Read settings from a TOML file (env: DYMO_BOOTSTRAP_CONFIG)\n"
       << "  --mirror <scheme>     Mirror used when the release host fails: raw or jsdelivr\n"
       << "  --no-modify-path      Do not touch shell startup files (env: DYMO_NO_MODIFY_PATH=1)\n"
       << "  --non-interactive     Do not wait for Enter when manual download is required\n"
       << "  -v, --verbose         Show debug output\n"
       << "  -q, --quiet           Only show warnings and errors\n"
       << "  -h, --help            Show this help\n"
       << "\n"
       << "Exit status: 0 installed, 1 unsupported platform, 2 manual download required,\n"
       << "3 filesystem error, 64 invalid options or configuration.\n";
    return ss.str();
}
