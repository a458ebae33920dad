#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace installer
{

using PermissionSetter =
    std::function<void(const std::filesystem::path&, std::filesystem::perms, std::error_code&)>;

// Places a validated artifact at the fixed per-user install path
class Installer
{
public:
    // setPermissions defaults to std::filesystem::permissions (replace)
    Installer(std::filesystem::path installDir, std::string binaryName, PermissionSetter setPermissions = nullptr);

    // Idempotent; must run before downloading since staging lives there too
    bool prepareDirectory(std::string& outError);

    // Sets the executable bits on the staged file and renames it over the
    // final path. The final name is never observed half-written.
    bool install(const std::filesystem::path& stagedPath, std::string& outError);

    // Same directory as the target so the rename stays on one filesystem
    std::filesystem::path stagingPath() const;

    std::filesystem::path targetPath() const { return installDir_ / binaryName_; }

    const std::filesystem::path& installDir() const { return installDir_; }

private:
    bool makeExecutable(const std::filesystem::path& path, std::string& outError);

    std::filesystem::path installDir_;
    std::string binaryName_;
    PermissionSetter setPermissions_;
};

} // namespace installer
