#include "PathRegistrar.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace installer
{

namespace
{

#ifdef _WIN32
constexpr char kPathSeparator = ';';
#else
constexpr char kPathSeparator = ':';
#endif

bool setProcessPath(const std::string& value)
{
#ifdef _WIN32
    return _putenv_s("PATH", value.c_str()) == 0;
#else
    return setenv("PATH", value.c_str(), 1) == 0;
#endif
}

} // namespace

PathRegistrar::PathRegistrar(fs::path installDir, std::vector<fs::path> startupFiles)
    : installDir_(std::move(installDir))
    , startupFiles_(std::move(startupFiles))
{
}

std::string PathRegistrar::exportLine() const { return "export PATH=\"$PATH:" + installDir_.string() + "\""; }

bool PathRegistrar::pathListContains(const std::string& pathValue, const std::string& directory)
{
    std::string entry;
    std::istringstream stream(pathValue);
    while (std::getline(stream, entry, kPathSeparator))
    {
        if (entry == directory)
            return true;
        // Tolerate a trailing slash on either side
        if (!entry.empty() && entry.back() == '/' && entry.substr(0, entry.size() - 1) == directory)
            return true;
        if (!directory.empty() && directory.back() == '/' && directory.substr(0, directory.size() - 1) == entry)
            return true;
    }
    return false;
}

bool PathRegistrar::registerInFile(const fs::path& startupFile, PathRegistration& outResult, std::string& outError)
{
    std::error_code ec;
    if (!fs::exists(startupFile, ec))
    {
        PLOG_DEBUG << "Startup file not present, skipping: " << startupFile.string();
        outResult.skipped.push_back(startupFile);
        return true;
    }

    std::string contents;
    {
        std::ifstream in(startupFile, std::ios::binary);
        if (!in.is_open())
        {
            outError = "Cannot read shell startup file " + startupFile.string();
            return false;
        }
        contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (contents.find(installDir_.string()) != std::string::npos)
    {
        PLOG_DEBUG << installDir_.string() << " already referenced in " << startupFile.string();
        outResult.alreadyPresent.push_back(startupFile);
        return true;
    }

    std::ofstream out(startupFile, std::ios::binary | std::ios::app);
    if (!out.is_open())
    {
        outError = "Cannot write shell startup file " + startupFile.string();
        return false;
    }

    if (!contents.empty() && contents.back() != '\n')
    {
        out << '\n';
    }
    out << exportLine() << '\n';
    out.close();

    if (out.fail())
    {
        outError = "Failed while appending to shell startup file " + startupFile.string();
        return false;
    }

    PLOG_INFO << "Added " << installDir_.string() << " to PATH in " << startupFile.string();
    outResult.updated.push_back(startupFile);
    return true;
}

bool PathRegistrar::ensureProcessPath()
{
    const char* current = std::getenv("PATH");
    std::string pathValue = current ? current : "";

    if (pathListContains(pathValue, installDir_.string()))
    {
        return false;
    }

    std::string updated = pathValue.empty() ? installDir_.string() : pathValue + kPathSeparator + installDir_.string();
    if (!setProcessPath(updated))
    {
        PLOG_WARNING << "Could not update PATH of the running process";
        return false;
    }
    return true;
}

bool PathRegistrar::ensurePresent(PathRegistration& outResult, std::string& outError)
{
    for (const auto& startupFile : startupFiles_)
    {
        if (!registerInFile(startupFile, outResult, outError))
        {
            return false;
        }
    }

    outResult.processPathUpdated = ensureProcessPath();
    return true;
}

} // namespace installer
