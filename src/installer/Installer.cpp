#include "Installer.hpp"

#include <plog/Log.h>

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace installer
{

Installer::Installer(fs::path installDir, std::string binaryName, PermissionSetter setPermissions)
    : installDir_(std::move(installDir))
    , binaryName_(std::move(binaryName))
    , setPermissions_(std::move(setPermissions))
{
    if (!setPermissions_)
    {
        setPermissions_ = [](const fs::path& path, fs::perms perms, std::error_code& ec)
        { fs::permissions(path, perms, fs::perm_options::replace, ec); };
    }
}

fs::path Installer::stagingPath() const { return installDir_ / ("." + binaryName_ + ".download"); }

bool Installer::prepareDirectory(std::string& outError)
{
    std::error_code ec;
    fs::create_directories(installDir_, ec);
    if (ec)
    {
        outError = "Cannot create install directory " + installDir_.string() + ": " + ec.message();
        return false;
    }

    if (!fs::is_directory(installDir_, ec))
    {
        outError = "Install path " + installDir_.string() + " exists but is not a directory";
        return false;
    }

    PLOG_DEBUG << "Install directory ready: " << installDir_.string();
    return true;
}

bool Installer::makeExecutable(const fs::path& path, std::string& outError)
{
#ifdef _WIN32
    (void)path;
    (void)outError;
    return true;
#else
    std::error_code ec;
    const auto perms = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                       fs::perms::others_exec;
    setPermissions_(path, perms, ec);
    if (ec)
    {
        outError = "Cannot mark " + path.string() + " as executable: " + ec.message();
        return false;
    }
    return true;
#endif
}

bool Installer::install(const fs::path& stagedPath, std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(stagedPath, ec))
    {
        outError = "Downloaded artifact missing at " + stagedPath.string();
        return false;
    }

    if (!makeExecutable(stagedPath, outError))
    {
        return false;
    }

    const fs::path target = targetPath();
    fs::rename(stagedPath, target, ec);
    if (ec)
    {
        outError = "Cannot move artifact into " + target.string() + ": " + ec.message();
        return false;
    }

    PLOG_INFO << "Installed " << target.string();
    return true;
}

} // namespace installer
