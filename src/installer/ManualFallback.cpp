#include "ManualFallback.hpp"

#include <plog/Log.h>

#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace installer
{

ManualFallback::ManualFallback(std::istream& in, std::ostream& out, UrlOpenFunction openUrl, bool interactive)
    : in_(in)
    , out_(out)
    , openUrl_(std::move(openUrl))
    , interactive_(interactive)
{
}

bool ManualFallback::run(const std::string& downloadUrl, const std::filesystem::path& destination, int attemptCount)
{
    PLOG_DEBUG << "Automatic download failed after " << attemptCount << " attempts, manual completion required";

    out_ << "\n========================================\n";
    out_ << "Automatic download failed after " << attemptCount << " attempts.\n";
    out_ << "========================================\n";
    out_ << "Download the file manually from:\n";
    out_ << "  " << downloadUrl << "\n";
    out_ << "and save it as:\n";
    out_ << "  " << destination.string() << "\n";
#ifndef _WIN32
    out_ << "then make it executable:\n";
    out_ << "  chmod +x \"" << destination.string() << "\"\n";
#endif
    out_ << "========================================\n";

    if (interactive_)
    {
        out_ << "Press Enter to open the download page..." << std::flush;
        std::string ack;
        std::getline(in_, ack);
        out_ << "\n";
    }
    out_.flush();

    bool opened = false;
    if (openUrl_)
    {
        opened = openUrl_(downloadUrl);
    }

    if (!opened)
    {
        PLOG_INFO << "Could not open a browser; use the URL above";
    }
    return opened;
}

} // namespace installer
