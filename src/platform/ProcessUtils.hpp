#pragma once

#include <string>
#include <vector>

namespace platform
{

// Cross-platform helpers for handing work to other programs
class ProcessUtils
{
public:
    // Launch a program looked up on PATH without waiting for it.
    // Returns false if the process could not be started.
    static bool LaunchDetached(const std::string& program, const std::vector<std::string>& args);

    // Open a URL with the desktop's default handler (best effort):
    // ShellExecute on Windows, `open` on macOS, `xdg-open` elsewhere.
    static bool OpenUrl(const std::string& url);
};

} // namespace platform
