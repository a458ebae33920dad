#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>

namespace installer
{

using UrlOpenFunction = std::function<bool(const std::string& url)>;

// Last resort after every automated source failed: tell the user exactly
// where to fetch the binary and where to put it, wait for them, then try to
// open the download page for convenience.
class ManualFallback
{
public:
    ManualFallback(std::istream& in, std::ostream& out, UrlOpenFunction openUrl, bool interactive = true);

    // Returns whether the browser could be opened; the printed URL is what
    // matters, so a false return is not an error.
    bool run(const std::string& downloadUrl, const std::filesystem::path& destination, int attemptCount);

private:
    std::istream& in_;
    std::ostream& out_;
    UrlOpenFunction openUrl_;
    bool interactive_;
};

} // namespace installer
